#include "access/Rules.hpp"
#include "access/PrivilegeResolver.hpp"
#include "store/Txn.hpp"

using namespace gr::types;
using namespace gr::store;

namespace gr::access {

User Rules::loadUser(Txn& txn, const unsigned int id) {
    const auto user = txn.getUser(id);
    if (!user) throw UsageError("Unknown user id " + std::to_string(id));
    return *user;
}

Group Rules::loadGroup(Txn& txn, const unsigned int id) {
    const auto group = txn.getGroup(id);
    if (!group) throw UsageError("Unknown group id " + std::to_string(id));
    return *group;
}

Resource Rules::loadResource(Txn& txn, const unsigned int id) {
    const auto resource = txn.getResource(id);
    if (!resource) throw UsageError("Unknown resource id " + std::to_string(id));
    return *resource;
}

void Rules::requireGrantable(const Privilege level) {
    if (!isGrantable(level))
        throw UsageError("Privilege level not valid for a grant: " + to_string(level));
}

Verdict Rules::activePrincipal(const User& principal) {
    if (!principal.is_active)
        return Verdict::deny(DenyReason::InactivePrincipal, "User " + principal.name + " is not active");
    return Verdict::allow();
}

// ---------------------------------------------------------------------------
// groups
// ---------------------------------------------------------------------------

Verdict Rules::viewGroup(Txn& txn, const User& p, const Group& g) {
    if (auto v = activePrincipal(p); !v) return v;
    if (p.is_superuser || g.flags.is_public) return Verdict::allow();
    if (atLeast(PrivilegeResolver::userGroup(txn, p, g), Privilege::View)) return Verdict::allow();
    return Verdict::deny(DenyReason::InsufficientPrivilege, "User has no privilege over group " + g.name);
}

Verdict Rules::viewGroupMetadata(Txn& txn, const User& p, const Group& g) {
    if (auto v = activePrincipal(p); !v) return v;
    if (g.flags.discoverable || g.flags.is_public) return Verdict::allow();
    return viewGroup(txn, p, g);
}

Verdict Rules::changeGroup(Txn& txn, const User& p, const Group& g) {
    if (auto v = activePrincipal(p); !v) return v;
    if (!g.flags.active) return Verdict::deny(DenyReason::InactiveObject, "Group " + g.name + " is not active");
    if (p.is_superuser) return Verdict::allow();
    if (atLeast(PrivilegeResolver::userGroup(txn, p, g), Privilege::Change)) return Verdict::allow();
    return Verdict::deny(DenyReason::InsufficientPrivilege, "User cannot change group " + g.name);
}

Verdict Rules::changeGroupFlags(Txn& txn, const User& p, const Group& g) {
    if (auto v = activePrincipal(p); !v) return v;
    if (p.is_superuser || PrivilegeResolver::owns(txn, p, g)) return Verdict::allow();
    return Verdict::deny(DenyReason::NotOwner, "Only an owner of group " + g.name + " may change it");
}

Verdict Rules::deleteGroup(Txn& txn, const User& p, const Group& g) {
    return changeGroupFlags(txn, p, g);
}

// ---------------------------------------------------------------------------
// resources
// ---------------------------------------------------------------------------

Verdict Rules::viewResource(Txn& txn, const User& p, const Resource& r) {
    if (auto v = activePrincipal(p); !v) return v;
    if (atLeast(PrivilegeResolver::effective(txn, p, r), Privilege::View)) return Verdict::allow();
    return Verdict::deny(DenyReason::InsufficientPrivilege, "User has no privilege over resource " + r.title);
}

Verdict Rules::viewResourceMetadata(Txn& txn, const User& p, const Resource& r) {
    if (auto v = activePrincipal(p); !v) return v;
    if (r.flags.discoverable || r.flags.is_public) return Verdict::allow();
    return viewResource(txn, p, r);
}

Verdict Rules::changeResource(Txn& txn, const User& p, const Resource& r) {
    if (auto v = activePrincipal(p); !v) return v;
    if (atLeast(PrivilegeResolver::effective(txn, p, r), Privilege::Change)) return Verdict::allow();
    if (r.flags.immutable)
        return Verdict::deny(DenyReason::InsufficientPrivilege, "Resource " + r.title + " is immutable");
    return Verdict::deny(DenyReason::InsufficientPrivilege, "User cannot change resource " + r.title);
}

Verdict Rules::changeResourceFlags(Txn& txn, const User& p, const Resource& r) {
    if (auto v = activePrincipal(p); !v) return v;
    if (p.is_superuser || PrivilegeResolver::owns(txn, p, r)) return Verdict::allow();
    return Verdict::deny(DenyReason::NotOwner, "Only an owner of resource " + r.title + " may change it");
}

Verdict Rules::deleteResource(Txn& txn, const User& p, const Resource& r) {
    return changeResourceFlags(txn, p, r);
}

// ---------------------------------------------------------------------------
// share
// ---------------------------------------------------------------------------

Verdict Rules::shareGroup(Txn& txn, const User& p, const Group& g, const Privilege level) {
    requireGrantable(level);
    if (auto v = activePrincipal(p); !v) return v;
    if (p.is_superuser) return Verdict::allow();
    if (!g.flags.active) return Verdict::deny(DenyReason::InactiveObject, "Group " + g.name + " is not active");

    if (!PrivilegeResolver::owns(txn, p, g) && !g.flags.shareable)
        return Verdict::deny(DenyReason::NotShareable, "User is not group owner and group is not shareable");

    // existence of a grant at least as strong as the level being granted
    if (!atLeast(PrivilegeResolver::direct(txn, Relation::UserGroup, p.id, g.id), level))
        return Verdict::deny(DenyReason::InsufficientPrivilege, "User has insufficient privilege over group");

    return Verdict::allow();
}

Verdict Rules::shareResource(Txn& txn, const User& p, const Resource& r, const Privilege level) {
    requireGrantable(level);
    if (auto v = activePrincipal(p); !v) return v;
    if (p.is_superuser) return Verdict::allow();
    if (!r.flags.active)
        return Verdict::deny(DenyReason::InactiveObject, "Resource " + r.title + " is not active");

    if (!PrivilegeResolver::owns(txn, p, r) && !r.flags.shareable)
        return Verdict::deny(DenyReason::NotShareable, "User must own resource or resource must be shareable");

    const auto whom = PrivilegeResolver::combined(txn, p, r);
    if (!atLeast(whom, Privilege::View))
        return Verdict::deny(DenyReason::InsufficientPrivilege, "User has no privilege over resource");
    if (!atLeast(whom, level))
        return Verdict::deny(DenyReason::InsufficientPrivilege, "User has insufficient privilege over resource");

    return Verdict::allow();
}

Verdict Rules::soleOwnerDemotion(Txn& txn, const Relation relation, const User& p, const unsigned int subject,
                                 const unsigned int object, const Privilege level) {
    if (level == Privilege::Owner) return Verdict::allow();
    const auto existing = txn.getGrant(relation, subject, object, p.id);
    if (existing && existing->privilege == Privilege::Owner &&
        !otherOwnerRecordExists(txn, relation, object, subject, p.id))
        return Verdict::deny(DenyReason::SoleOwner, "Cannot demote the last owner");
    return Verdict::allow();
}

Verdict Rules::shareGroupWithUser(Txn& txn, const User& p, const Group& g, const User& target,
                                  const Privilege level) {
    if (auto v = shareGroup(txn, p, g, level); !v) return v;
    if (!target.is_active)
        return Verdict::deny(DenyReason::GranteeInactive, "Grantee " + target.name + " is not active");
    return soleOwnerDemotion(txn, Relation::UserGroup, p, target.id, g.id, level);
}

Verdict Rules::shareResourceWithUser(Txn& txn, const User& p, const Resource& r, const User& target,
                                     const Privilege level) {
    if (auto v = shareResource(txn, p, r, level); !v) return v;
    if (!target.is_active)
        return Verdict::deny(DenyReason::GranteeInactive, "Grantee " + target.name + " is not active");

    // a non-owner may not weaken a grant that someone else made
    if (!p.is_superuser && !PrivilegeResolver::owns(txn, p, r)) {
        const auto grants = txn.listGrants(Relation::UserResource, {.subject = target.id, .object = r.id});
        auto best = Privilege::None;
        for (const auto& g : grants) best = strongest(best, g.privilege);

        if (strongerThan(best, level)) {
            bool mine = false;
            for (const auto& g : grants)
                if (g.privilege == best && g.grantor_id == p.id) mine = true;
            if (!mine)
                return Verdict::deny(DenyReason::CannotDowngrade,
                                     "Cannot downgrade a privilege granted by another user");
        }
    }

    return soleOwnerDemotion(txn, Relation::UserResource, p, target.id, r.id, level);
}

Verdict Rules::shareResourceWithGroup(Txn& txn, const User& p, const Resource& r, const Group& target,
                                      const Privilege level) {
    requireGrantable(level);
    if (level == Privilege::Owner) throw UsageError("Groups cannot own resources");
    if (auto v = shareResource(txn, p, r, level); !v) return v;
    if (!p.is_superuser && !PrivilegeResolver::isMember(txn, p.id, target.id))
        return Verdict::deny(DenyReason::NotMember, "User is not a member of group " + target.name);
    return Verdict::allow();
}

// ---------------------------------------------------------------------------
// unshare
// ---------------------------------------------------------------------------

Verdict Rules::unshareGroupWithUser(Txn& txn, const User& p, const Group& g, const User& target) {
    if (auto v = activePrincipal(p); !v) return v;
    if (!p.is_superuser && !PrivilegeResolver::owns(txn, p, g) && target.id != p.id)
        return Verdict::deny(DenyReason::NotOwner, "Only an owner or the member themself may leave group " + g.name);

    if (!txn.hasGrant(Relation::UserGroup, {.subject = target.id, .object = g.id})) return Verdict::allow();

    if (!ownerOtherThanExists(txn, Relation::UserGroup, g.id, target.id))
        return Verdict::deny(DenyReason::SoleOwner, "Cannot remove sole owner of group " + g.name);
    return Verdict::allow();
}

Verdict Rules::unshareResourceWithUser(Txn& txn, const User& p, const Resource& r, const User& target) {
    if (auto v = activePrincipal(p); !v) return v;
    if (!p.is_superuser && !PrivilegeResolver::owns(txn, p, r))
        return Verdict::deny(DenyReason::NotOwner, "Only an owner may unshare resource " + r.title);

    if (!txn.hasGrant(Relation::UserResource, {.subject = target.id, .object = r.id})) return Verdict::allow();

    if (!ownerOtherThanExists(txn, Relation::UserResource, r.id, target.id))
        return Verdict::deny(DenyReason::SoleOwner, "Cannot remove sole owner of resource " + r.title);
    return Verdict::allow();
}

Verdict Rules::unshareResourceWithGroup(Txn& txn, const User& p, const Resource& r, const Group& target) {
    if (auto v = activePrincipal(p); !v) return v;
    if (p.is_superuser || PrivilegeResolver::owns(txn, p, r) || PrivilegeResolver::owns(txn, p, target))
        return Verdict::allow();
    return Verdict::deny(DenyReason::NotOwner, "Only a resource or group owner may unshare with a group");
}

// ---------------------------------------------------------------------------
// undo-share
// ---------------------------------------------------------------------------

Verdict Rules::undoOwn(Txn& txn, const User& p, const Relation relation, const unsigned int subject,
                       const unsigned int object) {
    if (auto v = activePrincipal(p); !v) return v;

    const auto record = txn.getGrant(relation, subject, object, p.id);
    if (!record) return Verdict::deny(DenyReason::NothingToUndo, "No share to undo");

    if (record->privilege == Privilege::Owner && !otherOwnerRecordExists(txn, relation, object, subject, p.id))
        return Verdict::deny(DenyReason::SoleOwner, "Cannot remove sole owner");
    return Verdict::allow();
}

Verdict Rules::undoAs(Txn& txn, const User& p, const bool callerOwnsObject, const Relation relation,
                      const unsigned int subject, const unsigned int object, const unsigned int grantor) {
    if (auto v = activePrincipal(p); !v) return v;
    if (!p.is_superuser && !callerOwnsObject)
        return Verdict::deny(DenyReason::NotOwner, "Only an owner may undo a share made by another user");

    const auto record = txn.getGrant(relation, subject, object, grantor);
    if (!record) return Verdict::deny(DenyReason::NothingToUndo, "Grantor did not grant privilege");

    if (record->privilege == Privilege::Owner && !otherOwnerRecordExists(txn, relation, object, subject, grantor))
        return Verdict::deny(DenyReason::SoleOwner, "Cannot remove sole owner");
    return Verdict::allow();
}

Verdict Rules::undoShareGroupWithUser(Txn& txn, const User& p, const Group& g, const User& target) {
    return undoOwn(txn, p, Relation::UserGroup, target.id, g.id);
}

Verdict Rules::undoShareResourceWithUser(Txn& txn, const User& p, const Resource& r, const User& target) {
    return undoOwn(txn, p, Relation::UserResource, target.id, r.id);
}

Verdict Rules::undoShareResourceWithGroup(Txn& txn, const User& p, const Resource& r, const Group& target) {
    return undoOwn(txn, p, Relation::GroupResource, target.id, r.id);
}

Verdict Rules::undoShareGroupWithUser(Txn& txn, const User& p, const Group& g, const User& target,
                                      const GrantorOverride by) {
    return undoAs(txn, p, PrivilegeResolver::owns(txn, p, g), Relation::UserGroup, target.id, g.id, by.grantor);
}

Verdict Rules::undoShareResourceWithUser(Txn& txn, const User& p, const Resource& r, const User& target,
                                         const GrantorOverride by) {
    return undoAs(txn, p, PrivilegeResolver::owns(txn, p, r), Relation::UserResource, target.id, r.id, by.grantor);
}

Verdict Rules::undoShareResourceWithGroup(Txn& txn, const User& p, const Resource& r, const Group& target,
                                          const GrantorOverride by) {
    return undoAs(txn, p, PrivilegeResolver::owns(txn, p, r), Relation::GroupResource, target.id, r.id, by.grantor);
}

// ---------------------------------------------------------------------------
// owner invariant
// ---------------------------------------------------------------------------

bool Rules::otherOwnerRecordExists(Txn& txn, const Relation relation, const unsigned int object,
                                   const unsigned int subject, const unsigned int grantor) {
    for (const auto& g : txn.listGrants(relation, {.object = object, .privilege = Privilege::Owner}))
        if (g.subject_id != subject || g.grantor_id != grantor) return true;
    return false;
}

bool Rules::ownerOtherThanExists(Txn& txn, const Relation relation, const unsigned int object,
                                 const unsigned int subject) {
    const auto owners = txn.listGrants(relation, {.object = object, .privilege = Privilege::Owner});
    if (owners.empty())
        throw IntegrityError(to_string(relation) + " object " + std::to_string(object) + " has no owner");
    for (const auto& g : owners)
        if (g.subject_id != subject) return true;
    return false;
}

}
