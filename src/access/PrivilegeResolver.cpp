#include "access/PrivilegeResolver.hpp"
#include "store/Txn.hpp"

using namespace gr::types;
using namespace gr::store;

namespace gr::access {

Privilege PrivilegeResolver::direct(Txn& txn, const Relation relation, const unsigned int subject,
                                    const unsigned int object) {
    auto best = Privilege::None;
    for (const auto& g : txn.listGrants(relation, {.subject = subject, .object = object}))
        best = strongest(best, g.privilege);
    return best;
}

Privilege PrivilegeResolver::userGroup(Txn& txn, const User& user, const Group& group) {
    if (user.is_superuser) return Privilege::Owner;
    if (!user.is_active) return Privilege::None;
    return direct(txn, Relation::UserGroup, user.id, group.id);
}

Privilege PrivilegeResolver::group(Txn& txn, const Group& group, const Resource& resource) {
    if (!group.flags.active) return Privilege::None;
    return direct(txn, Relation::GroupResource, group.id, resource.id);
}

Privilege PrivilegeResolver::combined(Txn& txn, const User& user, const Resource& resource) {
    if (user.is_superuser) return Privilege::Owner;
    if (!user.is_active) return Privilege::None;

    auto best = direct(txn, Relation::UserResource, user.id, resource.id);
    if (best == Privilege::Owner) return best;

    for (const auto& grant : txn.listGrants(Relation::GroupResource, {.object = resource.id})) {
        if (!strongerThan(grant.privilege, best)) continue;
        if (!isMember(txn, user.id, grant.subject_id)) continue;
        const auto g = txn.getGroup(grant.subject_id);
        if (!g || !g->flags.active) continue;
        best = grant.privilege;
    }
    return best;
}

Privilege PrivilegeResolver::effective(Txn& txn, const User& user, const Resource& resource) {
    auto p = combined(txn, user, resource);
    if (resource.flags.immutable) p = weakest(Privilege::View, p);
    if (resource.flags.is_public) p = strongest(Privilege::View, p);
    return p;
}

bool PrivilegeResolver::isMember(Txn& txn, const unsigned int user, const unsigned int group) {
    return txn.hasGrant(Relation::UserGroup, {.subject = user, .object = group});
}

bool PrivilegeResolver::owns(Txn& txn, const User& user, const Group& group) {
    if (!user.is_active || !group.flags.active) return false;
    return txn.hasGrant(Relation::UserGroup,
                        {.subject = user.id, .object = group.id, .privilege = Privilege::Owner});
}

bool PrivilegeResolver::owns(Txn& txn, const User& user, const Resource& resource) {
    if (!user.is_active || !resource.flags.active) return false;
    return txn.hasGrant(Relation::UserResource,
                        {.subject = user.id, .object = resource.id, .privilege = Privilege::Owner});
}

}
