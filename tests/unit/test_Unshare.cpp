#include "AccessFixture.hpp"

#include <atomic>
#include <thread>

using namespace gr::access;
using namespace gr::types;

class UnshareTest : public AccessFixture {
protected:
    unsigned int u1 = 0, u2 = 0, u3 = 0, admin = 0;

    void SetUp() override {
        u1 = user("u1");
        u2 = user("u2");
        u3 = user("u3");
        admin = user("admin", true, true);
    }
};

TEST_F(UnshareTest, OwnerLeavesWhenAnotherOwnerRemains) {
    const auto r = resource(u1);
    shares.shareResourceWithUser(u1, r, u2, Privilege::Owner);

    EXPECT_TRUE(authz.canUnshareResourceWithUser(u1, r, u1));
    EXPECT_EQ(shares.unshareResourceWithUser(u1, r, u1), 1u);

    EXPECT_EQ(authz.combinedPrivilege(u1, r), Privilege::None);
    EXPECT_TRUE(authz.ownsResource(u2, r));
}

TEST_F(UnshareTest, SoleOwnerCannotLeave) {
    const auto r = resource(u1);

    EXPECT_FALSE(authz.canUnshareResourceWithUser(u1, r, u1));
    EXPECT_EQ(denial([&] { shares.unshareResourceWithUser(u1, r, u1); }), DenyReason::SoleOwner);
    EXPECT_TRUE(authz.ownsResource(u1, r));
}

TEST_F(UnshareTest, SuperuserCannotRemoveSoleOwnerEither) {
    const auto r = resource(u1);
    const auto g = group(u1);
    EXPECT_EQ(denial([&] { shares.unshareResourceWithUser(admin, r, u1); }), DenyReason::SoleOwner);
    EXPECT_EQ(denial([&] { shares.unshareGroupWithUser(admin, g, u1); }), DenyReason::SoleOwner);
}

TEST_F(UnshareTest, RemovesEveryGrantOfTheSubject) {
    const auto r = resource(u1);
    shares.shareResourceWithUser(u1, r, u2, Privilege::Change);
    shares.shareResourceWithUser(u2, r, u3, Privilege::Change);
    shares.shareResourceWithUser(u1, r, u3, Privilege::Owner);
    shares.shareResourceWithUser(u3, r, u3, Privilege::View);

    EXPECT_EQ(shares.unshareResourceWithUser(u1, r, u3), 2u);
    EXPECT_TRUE(grants(Relation::UserResource, u3, r).empty());
}

TEST_F(UnshareTest, AbsentGrantIsANoOp) {
    const auto r = resource(u1);
    EXPECT_TRUE(authz.canUnshareResourceWithUser(u1, r, u3));
    EXPECT_EQ(shares.unshareResourceWithUser(u1, r, u3), 0u);
}

TEST_F(UnshareTest, NonOwnerCannotUnshareResource) {
    const auto r = resource(u1);
    shares.shareResourceWithUser(u1, r, u2, Privilege::Change);
    shares.shareResourceWithUser(u1, r, u3, Privilege::View);

    EXPECT_EQ(denial([&] { shares.unshareResourceWithUser(u2, r, u3); }), DenyReason::NotOwner);
    // holders do not remove themselves from resources; undo is the way back
    EXPECT_EQ(denial([&] { shares.unshareResourceWithUser(u3, r, u3); }), DenyReason::NotOwner);
    EXPECT_EQ(authz.combinedPrivilege(u3, r), Privilege::View);
}

TEST_F(UnshareTest, MemberMayLeaveGroup) {
    const auto g = group(u1);
    shares.shareGroupWithUser(u1, g, u2, Privilege::View);
    shares.shareGroupWithUser(u1, g, u3, Privilege::View);

    EXPECT_EQ(denial([&] { shares.unshareGroupWithUser(u2, g, u3); }), DenyReason::NotOwner);
    EXPECT_EQ(shares.unshareGroupWithUser(u2, g, u2), 1u);
    EXPECT_FALSE(authz.isMember(u2, g));
    EXPECT_TRUE(authz.isMember(u3, g));
}

TEST_F(UnshareTest, LeavingGroupDropsInheritedAccess) {
    const auto r = resource(u1);
    const auto g = group(u1);
    shares.shareGroupWithUser(u1, g, u2, Privilege::View);
    shares.shareResourceWithGroup(u1, r, g, Privilege::Change);
    ASSERT_EQ(authz.combinedPrivilege(u2, r), Privilege::Change);

    shares.unshareGroupWithUser(u1, g, u2);
    EXPECT_EQ(authz.combinedPrivilege(u2, r), Privilege::None);
}

TEST_F(UnshareTest, GroupOwnerMayWithdrawResourceFromGroup) {
    const auto r = resource(u1);
    const auto g = group(u2);
    shares.shareGroupWithUser(u2, g, u1, Privilege::View);
    shares.shareGroupWithUser(u2, g, u3, Privilege::View);
    shares.shareResourceWithGroup(u1, r, g, Privilege::View);

    EXPECT_EQ(denial([&] { shares.unshareResourceWithGroup(u3, r, g); }), DenyReason::NotOwner);
    EXPECT_TRUE(authz.canUnshareResourceWithGroup(u2, r, g));
    EXPECT_EQ(shares.unshareResourceWithGroup(u2, r, g), 1u);
    EXPECT_EQ(authz.groupPrivilege(g, r), Privilege::None);
}

TEST_F(UnshareTest, InactiveCallerIsDenied) {
    const auto r = resource(u1);
    shares.shareResourceWithUser(u1, r, u2, Privilege::View);
    setActive(u1, false);
    EXPECT_EQ(denial([&] { shares.unshareResourceWithUser(u1, r, u2); }), DenyReason::InactivePrincipal);
}

TEST_F(UnshareTest, OwnerFloorHoldsAcrossSequences) {
    const auto r = resource(u1);
    shares.shareResourceWithUser(u1, r, u2, Privilege::Owner);
    shares.shareResourceWithUser(u2, r, u3, Privilege::Owner);

    shares.unshareResourceWithUser(u3, r, u1);
    shares.unshareResourceWithUser(u3, r, u2);

    EXPECT_EQ(denial([&] { shares.unshareResourceWithUser(u3, r, u3); }), DenyReason::SoleOwner);
    EXPECT_EQ(denial([&] { shares.undoShareResourceWithUser(u3, r, u3, GrantorOverride{u2}); }),
              DenyReason::SoleOwner);
    EXPECT_EQ(queries.resourceOwnerCount(r), 1u);
    EXPECT_EQ(ids(queries.resourceOwners(r)), std::vector<unsigned int>{u3});
}

TEST_F(UnshareTest, RacingOwnersNeverLeaveResourceOwnerless) {
    constexpr int rounds = 50;

    for (int round = 0; round < rounds; ++round) {
        const auto r = resource(u1, "race-" + std::to_string(round));
        shares.shareResourceWithUser(u1, r, u2, Privilege::Owner);

        std::atomic<bool> go{false};
        std::atomic<int> writersDone{0};
        std::atomic<int> succeeded{0};
        std::atomic<int> denied{0};
        std::atomic<std::size_t> fewestOwners{2};

        auto leave = [&](const unsigned int self) {
            while (!go.load()) std::this_thread::yield();
            try {
                shares.unshareResourceWithUser(self, r, self);
                ++succeeded;
            } catch (const AuthorizationError& e) {
                if (e.reason() == DenyReason::SoleOwner) ++denied;
            }
            ++writersDone;
        };

        std::thread reader([&] {
            while (!go.load()) std::this_thread::yield();
            while (writersDone.load() < 2) {
                (void)authz.canUnshareResourceWithUser(u1, r, u1);
                (void)authz.canViewResource(u2, r);
                const auto owners = queries.resourceOwnerCount(r);
                auto seen = fewestOwners.load();
                while (owners < seen && !fewestOwners.compare_exchange_weak(seen, owners)) {}
            }
        });
        std::thread first(leave, u1);
        std::thread second(leave, u2);

        go = true;
        first.join();
        second.join();
        reader.join();

        EXPECT_EQ(succeeded.load(), 1) << "round " << round;
        EXPECT_EQ(denied.load(), 1) << "round " << round;
        EXPECT_EQ(queries.resourceOwnerCount(r), 1u) << "round " << round;
        EXPECT_GE(fewestOwners.load(), 1u) << "round " << round;
    }
}
