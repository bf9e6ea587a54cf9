#include <gtest/gtest.h>

#include "access/AccessError.hpp"
#include "access/Authorizer.hpp"
#include "access/ShareManager.hpp"
#include "store/MemoryStore.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace gr::access;
using namespace gr::types;

namespace {

enum class Outcome { Allowed, Denied, Usage };

std::string to_string(const Outcome o) {
    switch (o) {
        case Outcome::Allowed: return "allowed";
        case Outcome::Denied: return "denied";
        case Outcome::Usage: return "usage error";
    }
    return "?";
}

// The same small world, rebuilt for every case so each action runs against
// exactly the state its predicate saw. Ids are assigned deterministically.
struct World {
    std::shared_ptr<gr::store::MemoryStore> store = std::make_shared<gr::store::MemoryStore>();
    ShareManager shares{store};
    Authorizer authz{store};

    std::vector<unsigned int> users, groups, resources;

    World() {
        const auto owner = shares.registerUser(User("owner"));
        const auto changer = shares.registerUser(User("changer"));
        const auto viewer = shares.registerUser(User("viewer"));
        const auto outsider = shares.registerUser(User("outsider"));
        const auto dormant = shares.registerUser(User("dormant"));
        const auto admin = shares.registerUser(User("admin", true, true));
        users = {owner, changer, viewer, outsider, dormant, admin};

        const auto open = shares.createGroup(owner, "open")->id;
        shares.shareGroupWithUser(owner, open, changer, Privilege::Change);
        shares.shareGroupWithUser(changer, open, viewer, Privilege::View);
        shares.shareGroupWithUser(owner, open, dormant, Privilege::View);

        GroupFlags closedFlags;
        closedFlags.shareable = false;
        const auto closed = shares.createGroup(changer, "closed", closedFlags)->id;
        shares.shareGroupWithUser(changer, closed, viewer, Privilege::View);
        shares.shareGroupWithUser(changer, closed, owner, Privilege::Owner);
        groups = {open, closed};

        const auto doc = shares.createResource(owner, "doc")->id;
        shares.shareResourceWithUser(owner, doc, changer, Privilege::Change);
        shares.shareResourceWithUser(changer, doc, viewer, Privilege::View);
        shares.shareResourceWithGroup(owner, doc, open, Privilege::View);

        ResourceFlags lockedFlags;
        lockedFlags.shareable = false;
        const auto locked = shares.createResource(owner, "locked", lockedFlags)->id;
        shares.shareResourceWithUser(owner, locked, viewer, Privilege::Change);
        shares.shareResourceWithUser(owner, locked, changer, Privilege::Owner);

        ResourceFlags frozenFlags;
        frozenFlags.is_public = true;
        frozenFlags.immutable = true;
        const auto frozen = shares.createResource(changer, "frozen", frozenFlags)->id;
        shares.shareResourceWithGroup(changer, frozen, closed, Privilege::Change);
        resources = {doc, locked, frozen};

        User d = *store->read("world", [&](gr::store::Txn& txn) { return txn.getUser(dormant); });
        d.is_active = false;
        shares.updateUser(d);
    }
};

Outcome predicate(const std::function<bool(const Authorizer&)>& can) {
    const World w;
    try {
        return can(w.authz) ? Outcome::Allowed : Outcome::Denied;
    } catch (const UsageError&) {
        return Outcome::Usage;
    }
}

Outcome action(const std::function<void(ShareManager&)>& act) {
    World w;
    try {
        act(w.shares);
        return Outcome::Allowed;
    } catch (const AuthorizationError&) {
        return Outcome::Denied;
    } catch (const UsageError&) {
        return Outcome::Usage;
    }
}

void expectEquivalent(const std::function<bool(const Authorizer&)>& can,
                      const std::function<void(ShareManager&)>& act, const std::string& label) {
    const auto expected = predicate(can);
    const auto actual = action(act);
    EXPECT_EQ(expected, actual) << label << ": predicate " << to_string(expected) << ", action "
                                << to_string(actual);
}

std::string label(const std::string& op, const unsigned int p, const unsigned int o, const unsigned int t) {
    return op + "(" + std::to_string(p) + ", " + std::to_string(o) + ", " + std::to_string(t) + ")";
}

// ids only; built after logging is up
const World& reference() {
    static const World world;
    return world;
}

}

TEST(PredicateEquivalenceTest, ShareGroupWithUser) {
    for (const auto p : reference().users)
        for (const auto g : reference().groups)
            for (const auto t : reference().users)
                for (const auto level : ALL_GRANTABLE)
                    expectEquivalent(
                        [&](const Authorizer& a) { return a.canShareGroupWithUser(p, g, t, level); },
                        [&](ShareManager& s) { s.shareGroupWithUser(p, g, t, level); },
                        label("shareGroupWithUser", p, g, t) + " at " + to_string(level));
}

TEST(PredicateEquivalenceTest, ShareResourceWithUser) {
    for (const auto p : reference().users)
        for (const auto r : reference().resources)
            for (const auto t : reference().users)
                for (const auto level : ALL_GRANTABLE)
                    expectEquivalent(
                        [&](const Authorizer& a) { return a.canShareResourceWithUser(p, r, t, level); },
                        [&](ShareManager& s) { s.shareResourceWithUser(p, r, t, level); },
                        label("shareResourceWithUser", p, r, t) + " at " + to_string(level));
}

TEST(PredicateEquivalenceTest, ShareResourceWithGroup) {
    for (const auto p : reference().users)
        for (const auto r : reference().resources)
            for (const auto g : reference().groups)
                for (const auto level : ALL_GRANTABLE)
                    expectEquivalent(
                        [&](const Authorizer& a) { return a.canShareResourceWithGroup(p, r, g, level); },
                        [&](ShareManager& s) { s.shareResourceWithGroup(p, r, g, level); },
                        label("shareResourceWithGroup", p, r, g) + " at " + to_string(level));
}

TEST(PredicateEquivalenceTest, Unshare) {
    for (const auto p : reference().users) {
        for (const auto g : reference().groups)
            for (const auto t : reference().users)
                expectEquivalent([&](const Authorizer& a) { return a.canUnshareGroupWithUser(p, g, t); },
                                 [&](ShareManager& s) { s.unshareGroupWithUser(p, g, t); },
                                 label("unshareGroupWithUser", p, g, t));

        for (const auto r : reference().resources) {
            for (const auto t : reference().users)
                expectEquivalent([&](const Authorizer& a) { return a.canUnshareResourceWithUser(p, r, t); },
                                 [&](ShareManager& s) { s.unshareResourceWithUser(p, r, t); },
                                 label("unshareResourceWithUser", p, r, t));
            for (const auto g : reference().groups)
                expectEquivalent([&](const Authorizer& a) { return a.canUnshareResourceWithGroup(p, r, g); },
                                 [&](ShareManager& s) { s.unshareResourceWithGroup(p, r, g); },
                                 label("unshareResourceWithGroup", p, r, g));
        }
    }
}

TEST(PredicateEquivalenceTest, UndoOwnShare) {
    for (const auto p : reference().users) {
        for (const auto g : reference().groups)
            for (const auto t : reference().users)
                expectEquivalent([&](const Authorizer& a) { return a.canUndoShareGroupWithUser(p, g, t); },
                                 [&](ShareManager& s) { s.undoShareGroupWithUser(p, g, t); },
                                 label("undoShareGroupWithUser", p, g, t));

        for (const auto r : reference().resources) {
            for (const auto t : reference().users)
                expectEquivalent([&](const Authorizer& a) { return a.canUndoShareResourceWithUser(p, r, t); },
                                 [&](ShareManager& s) { s.undoShareResourceWithUser(p, r, t); },
                                 label("undoShareResourceWithUser", p, r, t));
            for (const auto g : reference().groups)
                expectEquivalent([&](const Authorizer& a) { return a.canUndoShareResourceWithGroup(p, r, g); },
                                 [&](ShareManager& s) { s.undoShareResourceWithGroup(p, r, g); },
                                 label("undoShareResourceWithGroup", p, r, g));
        }
    }
}

TEST(PredicateEquivalenceTest, UndoShareAsGrantor) {
    for (const auto p : reference().users)
        for (const auto by : reference().users) {
            const GrantorOverride o{by};
            const auto suffix = " by " + std::to_string(by);

            for (const auto g : reference().groups)
                for (const auto t : reference().users)
                    expectEquivalent([&](const Authorizer& a) { return a.canUndoShareGroupWithUser(p, g, t, o); },
                                     [&](ShareManager& s) { s.undoShareGroupWithUser(p, g, t, o); },
                                     label("undoShareGroupWithUser", p, g, t) + suffix);

            for (const auto r : reference().resources) {
                for (const auto t : reference().users)
                    expectEquivalent(
                        [&](const Authorizer& a) { return a.canUndoShareResourceWithUser(p, r, t, o); },
                        [&](ShareManager& s) { s.undoShareResourceWithUser(p, r, t, o); },
                        label("undoShareResourceWithUser", p, r, t) + suffix);
                for (const auto g : reference().groups)
                    expectEquivalent(
                        [&](const Authorizer& a) { return a.canUndoShareResourceWithGroup(p, r, g, o); },
                        [&](ShareManager& s) { s.undoShareResourceWithGroup(p, r, g, o); },
                        label("undoShareResourceWithGroup", p, r, g) + suffix);
            }
        }
}

TEST(PredicateEquivalenceTest, LifecycleAndFlags) {
    for (const auto p : reference().users) {
        for (const auto g : reference().groups) {
            expectEquivalent([&](const Authorizer& a) { return a.canChangeGroupFlags(p, g); },
                             [&](ShareManager& s) { s.setGroupFlags(p, g, GroupFlags{}); },
                             label("setGroupFlags", p, g, 0));
            expectEquivalent([&](const Authorizer& a) { return a.canDeleteGroup(p, g); },
                             [&](ShareManager& s) { s.deleteGroup(p, g); }, label("deleteGroup", p, g, 0));
        }
        for (const auto r : reference().resources) {
            expectEquivalent([&](const Authorizer& a) { return a.canChangeResourceFlags(p, r); },
                             [&](ShareManager& s) { s.setResourceFlags(p, r, ResourceFlags{}); },
                             label("setResourceFlags", p, r, 0));
            expectEquivalent([&](const Authorizer& a) { return a.canDeleteResource(p, r); },
                             [&](ShareManager& s) { s.deleteResource(p, r); }, label("deleteResource", p, r, 0));
        }
    }
}

TEST(PredicateEquivalenceTest, UnknownIdsFailBothWays) {
    constexpr unsigned int missing = 999;
    const auto p = reference().users.front();
    const auto r = reference().resources.front();
    const auto g = reference().groups.front();

    EXPECT_EQ(predicate([&](const Authorizer& a) {
                  return a.canShareResourceWithUser(p, r, missing, Privilege::View);
              }),
              Outcome::Usage);
    EXPECT_EQ(action([&](ShareManager& s) { s.shareResourceWithUser(p, r, missing, Privilege::View); }),
              Outcome::Usage);
    EXPECT_EQ(predicate([&](const Authorizer& a) { return a.canUnshareGroupWithUser(missing, g, p); }),
              Outcome::Usage);
    EXPECT_EQ(action([&](ShareManager& s) { s.unshareGroupWithUser(missing, g, p); }), Outcome::Usage);
}
