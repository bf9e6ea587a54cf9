#include "access/ShareManager.hpp"
#include "access/PrivilegeResolver.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "store/Store.hpp"

using namespace gr::types;
using namespace gr::store;
using namespace gr::logging;

namespace gr::access {

namespace {

template <typename... Args>
void audit(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if (!config::ConfigRegistry::get().access.audit_mutations) return;
    LogRegistry::audit()->info(fmt, std::forward<Args>(args)...);
}

// Grant removal must never leave an object without an owner.
void requireOwner(Txn& txn, const Relation relation, const unsigned int object) {
    if (!txn.hasGrant(relation, {.object = object, .privilege = Privilege::Owner}))
        throw IntegrityError(to_string(relation) + " object " + std::to_string(object) +
                             " would be left without an owner");
}

}

ShareManager::ShareManager(std::shared_ptr<Store> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("ShareManager requires a store");
}

void ShareManager::enforce(const Verdict& verdict, const std::string& action, const unsigned int user) {
    if (verdict.allowed) return;
    LogRegistry::access()->warn("[ShareManager::{}] Denied for user {}: {} ({})",
                                action, user, verdict.message, to_string(verdict.reason));
    verdict.enforce();
}

// ---------------------------------------------------------------------------
// identities
// ---------------------------------------------------------------------------

unsigned int ShareManager::registerUser(const User& user) {
    const auto id = store_->write("ShareManager::registerUser", [&](Txn& txn) { return txn.createUser(user); });
    LogRegistry::grantry()->debug("[ShareManager] Registered user {} as {}", user.name, id);
    return id;
}

void ShareManager::updateUser(const User& user) {
    store_->write("ShareManager::updateUser", [&](Txn& txn) {
        Rules::loadUser(txn, user.id);
        txn.updateUser(user);
    });
    audit("user {} updated: active={} superuser={}", user.id, user.is_active, user.is_superuser);
}

// ---------------------------------------------------------------------------
// lifecycle
// ---------------------------------------------------------------------------

GroupPtr ShareManager::createGroup(const unsigned int user, const std::string& name, const GroupFlags& flags) {
    auto group = store_->write("ShareManager::createGroup", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        enforce(Rules::activePrincipal(p), "createGroup", user);

        Group g(name);
        g.flags = flags;
        g.id = txn.createGroup(g);
        txn.upsertGrant(Relation::UserGroup, p.id, g.id, p.id, Privilege::Owner);
        return txn.getGroup(g.id);
    });
    audit("user {} created group {} ({})", user, group->id, group->name);
    return group;
}

ResourcePtr ShareManager::createResource(const unsigned int user, const std::string& title,
                                         const ResourceFlags& flags) {
    auto resource = store_->write("ShareManager::createResource", [&](Txn& txn) {
        const auto p = Rules::loadUser(txn, user);
        enforce(Rules::activePrincipal(p), "createResource", user);

        Resource r(title);
        r.flags = flags;
        r.id = txn.createResource(r);
        txn.upsertGrant(Relation::UserResource, p.id, r.id, p.id, Privilege::Owner);
        return txn.getResource(r.id);
    });
    audit("user {} created resource {} ({})", user, resource->id, resource->title);
    return resource;
}

void ShareManager::deleteGroup(const unsigned int user, const unsigned int group) {
    store_->write("ShareManager::deleteGroup", [&](Txn& txn) {
        txn.lockGroup(group);
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        enforce(Rules::deleteGroup(txn, p, g), "deleteGroup", user);

        txn.deleteGrants(Relation::UserGroup, {.object = g.id});
        txn.deleteGrants(Relation::GroupResource, {.subject = g.id});
        txn.deleteGroup(g.id);
    });
    audit("user {} deleted group {}", user, group);
}

void ShareManager::deleteResource(const unsigned int user, const unsigned int resource) {
    store_->write("ShareManager::deleteResource", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        enforce(Rules::deleteResource(txn, p, r), "deleteResource", user);

        txn.deleteGrants(Relation::UserResource, {.object = r.id});
        txn.deleteGrants(Relation::GroupResource, {.object = r.id});
        txn.deleteResource(r.id);
    });
    audit("user {} deleted resource {}", user, resource);
}

void ShareManager::setGroupFlags(const unsigned int user, const unsigned int group, const GroupFlags& flags) {
    store_->write("ShareManager::setGroupFlags", [&](Txn& txn) {
        txn.lockGroup(group);
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        enforce(Rules::changeGroupFlags(txn, p, g), "setGroupFlags", user);
        txn.updateGroupFlags(g.id, flags);
    });
    audit("user {} set flags of group {}: active={} discoverable={} public={} shareable={}",
          user, group, flags.active, flags.discoverable, flags.is_public, flags.shareable);
}

void ShareManager::setResourceFlags(const unsigned int user, const unsigned int resource,
                                    const ResourceFlags& flags) {
    store_->write("ShareManager::setResourceFlags", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        enforce(Rules::changeResourceFlags(txn, p, r), "setResourceFlags", user);
        txn.updateResourceFlags(r.id, flags);
    });
    audit("user {} set flags of resource {}: active={} discoverable={} public={} shareable={} published={} "
          "immutable={}", user, resource, flags.active, flags.discoverable, flags.is_public, flags.shareable,
          flags.published, flags.immutable);
}

// ---------------------------------------------------------------------------
// share
// ---------------------------------------------------------------------------

void ShareManager::shareGroupWithUser(const unsigned int user, const unsigned int group, const unsigned int target,
                                      const Privilege level) {
    store_->write("ShareManager::shareGroupWithUser", [&](Txn& txn) {
        txn.lockGroup(group);
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::shareGroupWithUser(txn, p, g, t, level), "shareGroupWithUser", user);

        txn.upsertGrant(Relation::UserGroup, t.id, g.id, p.id, level);

        // owner grants supersede weaker grants from anyone else
        if (p.is_superuser || PrivilegeResolver::owns(txn, p, g))
            txn.deleteGrants(Relation::UserGroup, {.subject = t.id, .object = g.id, .weakerThan = level});

        requireOwner(txn, Relation::UserGroup, g.id);
    });
    audit("user {} shared group {} with user {} at {}", user, group, target, to_string(level));
}

void ShareManager::shareResourceWithUser(const unsigned int user, const unsigned int resource,
                                         const unsigned int target, const Privilege level) {
    store_->write("ShareManager::shareResourceWithUser", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::shareResourceWithUser(txn, p, r, t, level), "shareResourceWithUser", user);

        txn.upsertGrant(Relation::UserResource, t.id, r.id, p.id, level);

        if (p.is_superuser || PrivilegeResolver::owns(txn, p, r))
            txn.deleteGrants(Relation::UserResource, {.subject = t.id, .object = r.id, .weakerThan = level});

        requireOwner(txn, Relation::UserResource, r.id);
    });
    audit("user {} shared resource {} with user {} at {}", user, resource, target, to_string(level));
}

void ShareManager::shareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                          const unsigned int group, const Privilege level) {
    store_->write("ShareManager::shareResourceWithGroup", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        enforce(Rules::shareResourceWithGroup(txn, p, r, g, level), "shareResourceWithGroup", user);

        txn.upsertGrant(Relation::GroupResource, g.id, r.id, p.id, level);

        if (p.is_superuser || PrivilegeResolver::owns(txn, p, r))
            txn.deleteGrants(Relation::GroupResource, {.subject = g.id, .object = r.id, .weakerThan = level});
    });
    audit("user {} shared resource {} with group {} at {}", user, resource, group, to_string(level));
}

// ---------------------------------------------------------------------------
// unshare
// ---------------------------------------------------------------------------

std::size_t ShareManager::unshareGroupWithUser(const unsigned int user, const unsigned int group,
                                               const unsigned int target) {
    const auto removed = store_->write("ShareManager::unshareGroupWithUser", [&](Txn& txn) {
        txn.lockGroup(group);
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::unshareGroupWithUser(txn, p, g, t), "unshareGroupWithUser", user);

        const auto n = txn.deleteGrants(Relation::UserGroup, {.subject = t.id, .object = g.id});
        if (n > 0) requireOwner(txn, Relation::UserGroup, g.id);
        return n;
    });
    if (removed > 0) audit("user {} unshared group {} with user {} ({} grants)", user, group, target, removed);
    return removed;
}

std::size_t ShareManager::unshareResourceWithUser(const unsigned int user, const unsigned int resource,
                                                  const unsigned int target) {
    const auto removed = store_->write("ShareManager::unshareResourceWithUser", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::unshareResourceWithUser(txn, p, r, t), "unshareResourceWithUser", user);

        const auto n = txn.deleteGrants(Relation::UserResource, {.subject = t.id, .object = r.id});
        if (n > 0) requireOwner(txn, Relation::UserResource, r.id);
        return n;
    });
    if (removed > 0)
        audit("user {} unshared resource {} with user {} ({} grants)", user, resource, target, removed);
    return removed;
}

std::size_t ShareManager::unshareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                                   const unsigned int group) {
    const auto removed = store_->write("ShareManager::unshareResourceWithGroup", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        enforce(Rules::unshareResourceWithGroup(txn, p, r, g), "unshareResourceWithGroup", user);

        return txn.deleteGrants(Relation::GroupResource, {.subject = g.id, .object = r.id});
    });
    if (removed > 0)
        audit("user {} unshared resource {} with group {} ({} grants)", user, resource, group, removed);
    return removed;
}

// ---------------------------------------------------------------------------
// undo-share
// ---------------------------------------------------------------------------

void ShareManager::undoShareGroupWithUser(const unsigned int user, const unsigned int group,
                                          const unsigned int target) {
    store_->write("ShareManager::undoShareGroupWithUser", [&](Txn& txn) {
        txn.lockGroup(group);
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::undoShareGroupWithUser(txn, p, g, t), "undoShareGroupWithUser", user);

        txn.deleteGrants(Relation::UserGroup, {.subject = t.id, .object = g.id, .grantor = p.id});
        requireOwner(txn, Relation::UserGroup, g.id);
    });
    audit("user {} undid own share of group {} with user {}", user, group, target);
}

void ShareManager::undoShareGroupWithUser(const unsigned int user, const unsigned int group,
                                          const unsigned int target, const GrantorOverride by) {
    store_->write("ShareManager::undoShareGroupWithUser", [&](Txn& txn) {
        txn.lockGroup(group);
        const auto p = Rules::loadUser(txn, user);
        const auto g = Rules::loadGroup(txn, group);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::undoShareGroupWithUser(txn, p, g, t, by), "undoShareGroupWithUser", user);

        txn.deleteGrants(Relation::UserGroup, {.subject = t.id, .object = g.id, .grantor = by.grantor});
        requireOwner(txn, Relation::UserGroup, g.id);
    });
    audit("user {} undid share of group {} with user {} granted by {}", user, group, target, by.grantor);
}

void ShareManager::undoShareResourceWithUser(const unsigned int user, const unsigned int resource,
                                             const unsigned int target) {
    store_->write("ShareManager::undoShareResourceWithUser", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::undoShareResourceWithUser(txn, p, r, t), "undoShareResourceWithUser", user);

        txn.deleteGrants(Relation::UserResource, {.subject = t.id, .object = r.id, .grantor = p.id});
        requireOwner(txn, Relation::UserResource, r.id);
    });
    audit("user {} undid own share of resource {} with user {}", user, resource, target);
}

void ShareManager::undoShareResourceWithUser(const unsigned int user, const unsigned int resource,
                                             const unsigned int target, const GrantorOverride by) {
    store_->write("ShareManager::undoShareResourceWithUser", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto t = Rules::loadUser(txn, target);
        enforce(Rules::undoShareResourceWithUser(txn, p, r, t, by), "undoShareResourceWithUser", user);

        txn.deleteGrants(Relation::UserResource, {.subject = t.id, .object = r.id, .grantor = by.grantor});
        requireOwner(txn, Relation::UserResource, r.id);
    });
    audit("user {} undid share of resource {} with user {} granted by {}", user, resource, target, by.grantor);
}

void ShareManager::undoShareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                              const unsigned int group) {
    store_->write("ShareManager::undoShareResourceWithGroup", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        enforce(Rules::undoShareResourceWithGroup(txn, p, r, g), "undoShareResourceWithGroup", user);

        txn.deleteGrants(Relation::GroupResource, {.subject = g.id, .object = r.id, .grantor = p.id});
    });
    audit("user {} undid own share of resource {} with group {}", user, resource, group);
}

void ShareManager::undoShareResourceWithGroup(const unsigned int user, const unsigned int resource,
                                              const unsigned int group, const GrantorOverride by) {
    store_->write("ShareManager::undoShareResourceWithGroup", [&](Txn& txn) {
        txn.lockResource(resource);
        const auto p = Rules::loadUser(txn, user);
        const auto r = Rules::loadResource(txn, resource);
        const auto g = Rules::loadGroup(txn, group);
        enforce(Rules::undoShareResourceWithGroup(txn, p, r, g, by), "undoShareResourceWithGroup", user);

        txn.deleteGrants(Relation::GroupResource, {.subject = g.id, .object = r.id, .grantor = by.grantor});
    });
    audit("user {} undid share of resource {} with group {} granted by {}", user, resource, group, by.grantor);
}

}
