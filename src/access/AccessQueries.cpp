#include "access/AccessQueries.hpp"
#include "access/Rules.hpp"
#include "store/Store.hpp"

#include <map>
#include <set>

using namespace gr::types;
using namespace gr::store;

namespace gr::access {

namespace {

using IdSet = std::set<unsigned int>;

std::vector<unsigned int> toVector(const IdSet& ids) { return {ids.begin(), ids.end()}; }

IdSet subjectsOf(Txn& txn, const Relation relation, const GrantFilter& filter) {
    IdSet ids;
    for (const auto& g : txn.listGrants(relation, filter)) ids.insert(g.subject_id);
    return ids;
}

IdSet objectsOf(Txn& txn, const Relation relation, const GrantFilter& filter) {
    IdSet ids;
    for (const auto& g : txn.listGrants(relation, filter)) ids.insert(g.object_id);
    return ids;
}

// Grants of at least `threshold` are those not weaker than it.
IdSet subjectsAtLeast(Txn& txn, const Relation relation, const unsigned int object, const Privilege threshold) {
    IdSet ids;
    for (const auto& g : txn.listGrants(relation, {.object = object}))
        if (atLeast(g.privilege, threshold)) ids.insert(g.subject_id);
    return ids;
}

std::vector<ResourcePtr> mutableResources(Txn& txn, const IdSet& ids) {
    std::vector<ResourcePtr> out;
    for (auto& r : txn.getResources(toVector(ids)))
        if (!r->flags.immutable) out.push_back(std::move(r));
    return out;
}

}

AccessQueries::AccessQueries(std::shared_ptr<Store> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("AccessQueries requires a store");
}

std::vector<Grant> AccessQueries::grants(const Relation relation, const GrantFilter& filter) const {
    return store_->read("AccessQueries::grants", [&](Txn& txn) { return txn.listGrants(relation, filter); });
}

// ---------------------------------------------------------------------------
// by user
// ---------------------------------------------------------------------------

std::vector<GroupPtr> AccessQueries::heldGroups(const unsigned int user) const {
    return store_->read("AccessQueries::heldGroups", [&](Txn& txn) {
        Rules::loadUser(txn, user);
        return txn.getGroups(toVector(objectsOf(txn, Relation::UserGroup, {.subject = user})));
    });
}

std::vector<GroupPtr> AccessQueries::ownedGroups(const unsigned int user) const {
    return store_->read("AccessQueries::ownedGroups", [&](Txn& txn) {
        Rules::loadUser(txn, user);
        const auto ids = objectsOf(txn, Relation::UserGroup, {.subject = user, .privilege = Privilege::Owner});
        return txn.getGroups(toVector(ids));
    });
}

std::vector<ResourcePtr> AccessQueries::heldResources(const unsigned int user) const {
    return store_->read("AccessQueries::heldResources", [&](Txn& txn) {
        Rules::loadUser(txn, user);
        auto ids = objectsOf(txn, Relation::UserResource, {.subject = user});
        for (const auto group : objectsOf(txn, Relation::UserGroup, {.subject = user}))
            ids.merge(objectsOf(txn, Relation::GroupResource, {.subject = group}));
        return txn.getResources(toVector(ids));
    });
}

std::vector<ResourcePtr> AccessQueries::ownedResources(const unsigned int user) const {
    return store_->read("AccessQueries::ownedResources", [&](Txn& txn) {
        Rules::loadUser(txn, user);
        const auto ids = objectsOf(txn, Relation::UserResource, {.subject = user, .privilege = Privilege::Owner});
        return txn.getResources(toVector(ids));
    });
}

std::vector<ResourcePtr> AccessQueries::editableResources(const unsigned int user) const {
    return store_->read("AccessQueries::editableResources", [&](Txn& txn) {
        Rules::loadUser(txn, user);
        IdSet ids;
        for (const auto& g : txn.listGrants(Relation::UserResource, {.subject = user}))
            if (atLeast(g.privilege, Privilege::Change)) ids.insert(g.object_id);
        return mutableResources(txn, ids);
    });
}

std::vector<ResourcePtr> AccessQueries::resourcesWithExplicitAccess(const unsigned int user,
                                                                    const Privilege level) const {
    return store_->read("AccessQueries::resourcesWithExplicitAccess", [&](Txn& txn) {
        Rules::loadUser(txn, user);
        std::map<unsigned int, Privilege> strongestByResource;
        for (const auto& g : txn.listGrants(Relation::UserResource, {.subject = user})) {
            auto [it, inserted] = strongestByResource.try_emplace(g.object_id, g.privilege);
            if (!inserted) it->second = strongest(it->second, g.privilege);
        }

        IdSet ids;
        for (const auto& [resource, p] : strongestByResource)
            if (p == level) ids.insert(resource);
        return mutableResources(txn, ids);
    });
}

// ---------------------------------------------------------------------------
// by group
// ---------------------------------------------------------------------------

std::vector<UserPtr> AccessQueries::groupMembers(const unsigned int group) const {
    return store_->read("AccessQueries::groupMembers", [&](Txn& txn) {
        Rules::loadGroup(txn, group);
        return txn.getUsers(toVector(subjectsOf(txn, Relation::UserGroup, {.object = group})));
    });
}

std::vector<UserPtr> AccessQueries::groupOwners(const unsigned int group) const {
    return store_->read("AccessQueries::groupOwners", [&](Txn& txn) {
        Rules::loadGroup(txn, group);
        const auto ids = subjectsOf(txn, Relation::UserGroup, {.object = group, .privilege = Privilege::Owner});
        return txn.getUsers(toVector(ids));
    });
}

std::size_t AccessQueries::groupMemberCount(const unsigned int group) const {
    return store_->read("AccessQueries::groupMemberCount", [&](Txn& txn) {
        Rules::loadGroup(txn, group);
        return subjectsOf(txn, Relation::UserGroup, {.object = group}).size();
    });
}

std::size_t AccessQueries::groupOwnerCount(const unsigned int group) const {
    return store_->read("AccessQueries::groupOwnerCount", [&](Txn& txn) {
        Rules::loadGroup(txn, group);
        return subjectsOf(txn, Relation::UserGroup, {.object = group, .privilege = Privilege::Owner}).size();
    });
}

std::size_t AccessQueries::groupOwnerRecordCount(const unsigned int group) const {
    return store_->read("AccessQueries::groupOwnerRecordCount", [&](Txn& txn) {
        Rules::loadGroup(txn, group);
        return txn.listGrants(Relation::UserGroup, {.object = group, .privilege = Privilege::Owner}).size();
    });
}

std::vector<ResourcePtr> AccessQueries::groupHeldResources(const unsigned int group) const {
    return store_->read("AccessQueries::groupHeldResources", [&](Txn& txn) {
        Rules::loadGroup(txn, group);
        return txn.getResources(toVector(objectsOf(txn, Relation::GroupResource, {.subject = group})));
    });
}

std::vector<ResourcePtr> AccessQueries::groupEditableResources(const unsigned int group) const {
    return store_->read("AccessQueries::groupEditableResources", [&](Txn& txn) {
        Rules::loadGroup(txn, group);
        IdSet ids;
        for (const auto& g : txn.listGrants(Relation::GroupResource, {.subject = group}))
            if (atLeast(g.privilege, Privilege::Change)) ids.insert(g.object_id);
        return mutableResources(txn, ids);
    });
}

// ---------------------------------------------------------------------------
// by resource
// ---------------------------------------------------------------------------

std::vector<UserPtr> AccessQueries::resourceOwners(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceOwners", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        const auto ids = subjectsOf(txn, Relation::UserResource,
                                    {.object = resource, .privilege = Privilege::Owner});
        return txn.getUsers(toVector(ids));
    });
}

std::size_t AccessQueries::resourceOwnerCount(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceOwnerCount", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return subjectsOf(txn, Relation::UserResource, {.object = resource, .privilege = Privilege::Owner}).size();
    });
}

std::size_t AccessQueries::resourceOwnerRecordCount(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceOwnerRecordCount", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return txn.listGrants(Relation::UserResource, {.object = resource, .privilege = Privilege::Owner}).size();
    });
}

std::vector<UserPtr> AccessQueries::resourceUsers(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceUsers", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return txn.getUsers(toVector(subjectsOf(txn, Relation::UserResource, {.object = resource})));
    });
}

std::vector<GroupPtr> AccessQueries::resourceGroups(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceGroups", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return txn.getGroups(toVector(subjectsOf(txn, Relation::GroupResource, {.object = resource})));
    });
}

std::vector<UserPtr> AccessQueries::resourceHolders(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceHolders", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        auto ids = subjectsOf(txn, Relation::UserResource, {.object = resource});
        for (const auto group : subjectsOf(txn, Relation::GroupResource, {.object = resource}))
            ids.merge(subjectsOf(txn, Relation::UserGroup, {.object = group}));
        return txn.getUsers(toVector(ids));
    });
}

std::vector<UserPtr> AccessQueries::resourceViewUsers(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceViewUsers", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return txn.getUsers(toVector(subjectsAtLeast(txn, Relation::UserResource, resource, Privilege::View)));
    });
}

std::vector<UserPtr> AccessQueries::resourceEditUsers(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceEditUsers", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return txn.getUsers(toVector(subjectsAtLeast(txn, Relation::UserResource, resource, Privilege::Change)));
    });
}

std::vector<GroupPtr> AccessQueries::resourceViewGroups(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceViewGroups", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return txn.getGroups(toVector(subjectsAtLeast(txn, Relation::GroupResource, resource, Privilege::View)));
    });
}

std::vector<GroupPtr> AccessQueries::resourceEditGroups(const unsigned int resource) const {
    return store_->read("AccessQueries::resourceEditGroups", [&](Txn& txn) {
        Rules::loadResource(txn, resource);
        return txn.getGroups(toVector(subjectsAtLeast(txn, Relation::GroupResource, resource, Privilege::Change)));
    });
}

}
