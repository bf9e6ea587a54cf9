#include "access/Authorizer.hpp"
#include "access/PrivilegeResolver.hpp"
#include "store/Store.hpp"

#include <set>

using namespace gr::types;
using namespace gr::store;

namespace gr::access {

Authorizer::Authorizer(std::shared_ptr<Store> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("Authorizer requires a store");
}

Privilege Authorizer::combinedPrivilege(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::combinedPrivilege", [&](Txn& txn) {
        return PrivilegeResolver::combined(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource));
    });
}

Privilege Authorizer::effectivePrivilege(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::effectivePrivilege", [&](Txn& txn) {
        return PrivilegeResolver::effective(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource));
    });
}

Privilege Authorizer::userGroupPrivilege(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::userGroupPrivilege", [&](Txn& txn) {
        return PrivilegeResolver::userGroup(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group));
    });
}

Privilege Authorizer::groupPrivilege(const unsigned int group, const unsigned int resource) const {
    return store_->read("Authorizer::groupPrivilege", [&](Txn& txn) {
        return PrivilegeResolver::group(txn, Rules::loadGroup(txn, group), Rules::loadResource(txn, resource));
    });
}

bool Authorizer::ownsGroup(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::ownsGroup", [&](Txn& txn) {
        return PrivilegeResolver::owns(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group));
    });
}

bool Authorizer::ownsResource(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::ownsResource", [&](Txn& txn) {
        return PrivilegeResolver::owns(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource));
    });
}

bool Authorizer::isMember(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::isMember", [&](Txn& txn) {
        Rules::loadUser(txn, user);
        Rules::loadGroup(txn, group);
        return PrivilegeResolver::isMember(txn, user, group);
    });
}

// ---------------------------------------------------------------------------

bool Authorizer::canViewGroup(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::canViewGroup", [&](Txn& txn) {
        return Rules::viewGroup(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group)).allowed;
    });
}

bool Authorizer::canViewGroupMetadata(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::canViewGroupMetadata", [&](Txn& txn) {
        return Rules::viewGroupMetadata(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group)).allowed;
    });
}

bool Authorizer::canChangeGroup(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::canChangeGroup", [&](Txn& txn) {
        return Rules::changeGroup(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group)).allowed;
    });
}

bool Authorizer::canChangeGroupFlags(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::canChangeGroupFlags", [&](Txn& txn) {
        return Rules::changeGroupFlags(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group)).allowed;
    });
}

bool Authorizer::canDeleteGroup(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::canDeleteGroup", [&](Txn& txn) {
        return Rules::deleteGroup(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group)).allowed;
    });
}

bool Authorizer::canViewResource(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::canViewResource", [&](Txn& txn) {
        return Rules::viewResource(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource)).allowed;
    });
}

bool Authorizer::canViewResourceMetadata(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::canViewResourceMetadata", [&](Txn& txn) {
        return Rules::viewResourceMetadata(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource))
            .allowed;
    });
}

bool Authorizer::canChangeResource(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::canChangeResource", [&](Txn& txn) {
        return Rules::changeResource(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource)).allowed;
    });
}

bool Authorizer::canChangeResourceFlags(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::canChangeResourceFlags", [&](Txn& txn) {
        return Rules::changeResourceFlags(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource))
            .allowed;
    });
}

bool Authorizer::canDeleteResource(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::canDeleteResource", [&](Txn& txn) {
        return Rules::deleteResource(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource)).allowed;
    });
}

// ---------------------------------------------------------------------------

bool Authorizer::canShareGroup(const unsigned int user, const unsigned int group, const Privilege level) const {
    return store_->read("Authorizer::canShareGroup", [&](Txn& txn) {
        return Rules::shareGroup(txn, Rules::loadUser(txn, user), Rules::loadGroup(txn, group), level).allowed;
    });
}

bool Authorizer::canShareResource(const unsigned int user, const unsigned int resource, const Privilege level) const {
    return store_->read("Authorizer::canShareResource", [&](Txn& txn) {
        return Rules::shareResource(txn, Rules::loadUser(txn, user), Rules::loadResource(txn, resource), level)
            .allowed;
    });
}

bool Authorizer::canShareGroupWithUser(const unsigned int user, const unsigned int group, const unsigned int target,
                                       const Privilege level) const {
    return store_->read("Authorizer::canShareGroupWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        return Rules::shareGroupWithUser(txn, p, g, t, level).allowed;
    });
}

bool Authorizer::canShareResourceWithUser(const unsigned int user, const unsigned int resource,
                                          const unsigned int target, const Privilege level) const {
    return store_->read("Authorizer::canShareResourceWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        return Rules::shareResourceWithUser(txn, p, r, t, level).allowed;
    });
}

bool Authorizer::canShareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                           const unsigned int group, const Privilege level) const {
    return store_->read("Authorizer::canShareResourceWithGroup", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        return Rules::shareResourceWithGroup(txn, p, r, g, level).allowed;
    });
}

// ---------------------------------------------------------------------------

bool Authorizer::canUnshareGroupWithUser(const unsigned int user, const unsigned int group,
                                         const unsigned int target) const {
    return store_->read("Authorizer::canUnshareGroupWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        return Rules::unshareGroupWithUser(txn, p, g, t).allowed;
    });
}

bool Authorizer::canUnshareResourceWithUser(const unsigned int user, const unsigned int resource,
                                            const unsigned int target) const {
    return store_->read("Authorizer::canUnshareResourceWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        return Rules::unshareResourceWithUser(txn, p, r, t).allowed;
    });
}

bool Authorizer::canUnshareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                             const unsigned int group) const {
    return store_->read("Authorizer::canUnshareResourceWithGroup", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        return Rules::unshareResourceWithGroup(txn, p, r, g).allowed;
    });
}

// ---------------------------------------------------------------------------

bool Authorizer::canUndoShareGroupWithUser(const unsigned int user, const unsigned int group,
                                           const unsigned int target) const {
    return store_->read("Authorizer::canUndoShareGroupWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        return Rules::undoShareGroupWithUser(txn, p, g, t).allowed;
    });
}

bool Authorizer::canUndoShareGroupWithUser(const unsigned int user, const unsigned int group,
                                           const unsigned int target, const GrantorOverride by) const {
    return store_->read("Authorizer::canUndoShareGroupWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        return Rules::undoShareGroupWithUser(txn, p, g, t, by).allowed;
    });
}

bool Authorizer::canUndoShareResourceWithUser(const unsigned int user, const unsigned int resource,
                                              const unsigned int target) const {
    return store_->read("Authorizer::canUndoShareResourceWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        return Rules::undoShareResourceWithUser(txn, p, r, t).allowed;
    });
}

bool Authorizer::canUndoShareResourceWithUser(const unsigned int user, const unsigned int resource,
                                              const unsigned int target, const GrantorOverride by) const {
    return store_->read("Authorizer::canUndoShareResourceWithUser", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        return Rules::undoShareResourceWithUser(txn, p, r, t, by).allowed;
    });
}

bool Authorizer::canUndoShareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                               const unsigned int group) const {
    return store_->read("Authorizer::canUndoShareResourceWithGroup", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        return Rules::undoShareResourceWithGroup(txn, p, r, g).allowed;
    });
}

bool Authorizer::canUndoShareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                               const unsigned int group, const GrantorOverride by) const {
    return store_->read("Authorizer::canUndoShareResourceWithGroup", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        return Rules::undoShareResourceWithGroup(txn, p, r, g, by).allowed;
    });
}

// ---------------------------------------------------------------------------
// enumeration
// ---------------------------------------------------------------------------

std::vector<UserPtr> Authorizer::groupUndoUsers(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::groupUndoUsers", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);

        std::set<unsigned int> ids;
        for (const auto& grant : txn.listGrants(Relation::UserGroup, {.object = g.id})) {
            if (ids.contains(grant.subject_id)) continue;
            const auto t = txn.getUser(grant.subject_id);
            if (!t) continue;
            const auto v = grant.grantor_id == p.id
                               ? Rules::undoShareGroupWithUser(txn, p, g, *t)
                               : Rules::undoShareGroupWithUser(txn, p, g, *t, GrantorOverride{grant.grantor_id});
            if (v.allowed) ids.insert(grant.subject_id);
        }
        return txn.getUsers({ids.begin(), ids.end()});
    });
}

std::vector<UserPtr> Authorizer::resourceUndoUsers(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::resourceUndoUsers", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);

        std::set<unsigned int> ids;
        for (const auto& grant : txn.listGrants(Relation::UserResource, {.object = r.id})) {
            if (ids.contains(grant.subject_id)) continue;
            const auto t = txn.getUser(grant.subject_id);
            if (!t) continue;
            const auto v = grant.grantor_id == p.id
                               ? Rules::undoShareResourceWithUser(txn, p, r, *t)
                               : Rules::undoShareResourceWithUser(txn, p, r, *t, GrantorOverride{grant.grantor_id});
            if (v.allowed) ids.insert(grant.subject_id);
        }
        return txn.getUsers({ids.begin(), ids.end()});
    });
}

std::vector<GroupPtr> Authorizer::resourceUndoGroups(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::resourceUndoGroups", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);

        std::set<unsigned int> ids;
        for (const auto& grant : txn.listGrants(Relation::GroupResource, {.object = r.id})) {
            if (ids.contains(grant.subject_id)) continue;
            const auto g = txn.getGroup(grant.subject_id);
            if (!g) continue;
            const auto v = grant.grantor_id == p.id
                               ? Rules::undoShareResourceWithGroup(txn, p, r, *g)
                               : Rules::undoShareResourceWithGroup(txn, p, r, *g, GrantorOverride{grant.grantor_id});
            if (v.allowed) ids.insert(grant.subject_id);
        }
        return txn.getGroups({ids.begin(), ids.end()});
    });
}

std::vector<UserPtr> Authorizer::groupUnshareUsers(const unsigned int user, const unsigned int group) const {
    return store_->read("Authorizer::groupUnshareUsers", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);

        std::set<unsigned int> ids;
        for (const auto& grant : txn.listGrants(Relation::UserGroup, {.object = g.id})) {
            if (ids.contains(grant.subject_id)) continue;
            const auto t = txn.getUser(grant.subject_id);
            if (t && Rules::unshareGroupWithUser(txn, p, g, *t).allowed) ids.insert(grant.subject_id);
        }
        return txn.getUsers({ids.begin(), ids.end()});
    });
}

std::vector<UserPtr> Authorizer::resourceUnshareUsers(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::resourceUnshareUsers", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);

        std::set<unsigned int> ids;
        for (const auto& grant : txn.listGrants(Relation::UserResource, {.object = r.id})) {
            if (ids.contains(grant.subject_id)) continue;
            const auto t = txn.getUser(grant.subject_id);
            if (t && Rules::unshareResourceWithUser(txn, p, r, *t).allowed) ids.insert(grant.subject_id);
        }
        return txn.getUsers({ids.begin(), ids.end()});
    });
}

std::vector<GroupPtr> Authorizer::resourceUnshareGroups(const unsigned int user, const unsigned int resource) const {
    return store_->read("Authorizer::resourceUnshareGroups", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);

        std::set<unsigned int> ids;
        for (const auto& grant : txn.listGrants(Relation::GroupResource, {.object = r.id})) {
            if (ids.contains(grant.subject_id)) continue;
            const auto g = txn.getGroup(grant.subject_id);
            if (g && Rules::unshareResourceWithGroup(txn, p, r, *g).allowed) ids.insert(grant.subject_id);
        }
        return txn.getGroups({ids.begin(), ids.end()});
    });
}

}
