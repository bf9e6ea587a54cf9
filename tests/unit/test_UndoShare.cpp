#include "AccessFixture.hpp"

using namespace gr::access;
using namespace gr::types;

class UndoShareTest : public AccessFixture {
protected:
    unsigned int u1 = 0, u2 = 0, u3 = 0, admin = 0;
    unsigned int res = 0, grp = 0;

    void SetUp() override {
        u1 = user("u1");
        u2 = user("u2");
        u3 = user("u3");
        admin = user("admin", true, true);
        res = resource(u1);
        grp = group(u1);
    }
};

TEST_F(UndoShareTest, SecondUndoHasNothingToUndo) {
    shares.shareResourceWithUser(u1, res, u2, Privilege::View);

    EXPECT_TRUE(authz.canUndoShareResourceWithUser(u1, res, u2));
    shares.undoShareResourceWithUser(u1, res, u2);
    EXPECT_EQ(authz.combinedPrivilege(u2, res), Privilege::None);

    EXPECT_FALSE(authz.canUndoShareResourceWithUser(u1, res, u2));
    EXPECT_EQ(denial([&] { shares.undoShareResourceWithUser(u1, res, u2); }), DenyReason::NothingToUndo);
}

TEST_F(UndoShareTest, UndoRemovesOnlyTheCallersGrant) {
    shares.shareResourceWithUser(u1, res, u2, Privilege::Change);
    shares.shareResourceWithUser(u1, res, u3, Privilege::View);
    shares.shareResourceWithUser(u2, res, u3, Privilege::Change);

    shares.undoShareResourceWithUser(u2, res, u3);

    const auto left = grants(Relation::UserResource, u3, res);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].grantor_id, u1);
    EXPECT_EQ(authz.combinedPrivilege(u3, res), Privilege::View);
}

TEST_F(UndoShareTest, NonGrantorHasNothingToUndo) {
    shares.shareResourceWithUser(u1, res, u2, Privilege::Change);
    shares.shareResourceWithUser(u1, res, u3, Privilege::View);
    EXPECT_EQ(denial([&] { shares.undoShareResourceWithUser(u2, res, u3); }), DenyReason::NothingToUndo);
}

TEST_F(UndoShareTest, OwnerUndoesAnotherGrantorsShare) {
    shares.shareResourceWithUser(u1, res, u2, Privilege::Change);
    shares.shareResourceWithUser(u2, res, u3, Privilege::View);

    EXPECT_TRUE(authz.canUndoShareResourceWithUser(u1, res, u3, GrantorOverride{u2}));
    shares.undoShareResourceWithUser(u1, res, u3, GrantorOverride{u2});
    EXPECT_TRUE(grants(Relation::UserResource, u3, res).empty());

    EXPECT_EQ(denial([&] { shares.undoShareResourceWithUser(u1, res, u3, GrantorOverride{u2}); }),
              DenyReason::NothingToUndo);
}

TEST_F(UndoShareTest, OverrideRequiresOwnership) {
    shares.shareResourceWithUser(u1, res, u2, Privilege::Change);
    shares.shareResourceWithUser(u1, res, u3, Privilege::View);

    EXPECT_FALSE(authz.canUndoShareResourceWithUser(u2, res, u3, GrantorOverride{u1}));
    EXPECT_EQ(denial([&] { shares.undoShareResourceWithUser(u2, res, u3, GrantorOverride{u1}); }),
              DenyReason::NotOwner);
}

TEST_F(UndoShareTest, OverrideNamingSelfMatchesOwnUndo) {
    shares.shareResourceWithUser(u1, res, u2, Privilege::View);
    shares.undoShareResourceWithUser(u1, res, u2, GrantorOverride{u1});
    EXPECT_EQ(authz.combinedPrivilege(u2, res), Privilege::None);
}

TEST_F(UndoShareTest, SuperuserUndoesAnyShare) {
    const auto g2 = group(u2);
    shares.shareGroupWithUser(u2, g2, u3, Privilege::Change);
    shares.undoShareGroupWithUser(admin, g2, u3, GrantorOverride{u2});
    EXPECT_FALSE(authz.isMember(u3, g2));
}

TEST_F(UndoShareTest, CannotUndoTheLastOwnerRecord) {
    EXPECT_EQ(denial([&] { shares.undoShareResourceWithUser(u1, res, u1); }), DenyReason::SoleOwner);
    EXPECT_EQ(denial([&] { shares.undoShareGroupWithUser(admin, grp, u1, GrantorOverride{u1}); }),
              DenyReason::SoleOwner);
    EXPECT_TRUE(authz.ownsResource(u1, res));
    EXPECT_TRUE(authz.ownsGroup(u1, grp));
}

TEST_F(UndoShareTest, SecondOwnerRecordForSameUserUnblocksUndo) {
    // u2 becomes owner through two grantors; dropping one record keeps ownership
    shares.shareResourceWithUser(u1, res, u2, Privilege::Owner);
    shares.shareResourceWithUser(u2, res, u2, Privilege::Owner);
    shares.unshareResourceWithUser(u2, res, u1);
    ASSERT_EQ(queries.resourceOwnerRecordCount(res), 2u);

    shares.undoShareResourceWithUser(u2, res, u2, GrantorOverride{u1});
    EXPECT_TRUE(authz.ownsResource(u2, res));
    EXPECT_EQ(queries.resourceOwnerRecordCount(res), 1u);
}

TEST_F(UndoShareTest, GroupUndoByGrantor) {
    shares.shareGroupWithUser(u1, grp, u2, Privilege::Change);
    shares.shareGroupWithUser(u2, grp, u3, Privilege::View);

    shares.undoShareGroupWithUser(u2, grp, u3);
    EXPECT_FALSE(authz.isMember(u3, grp));
    EXPECT_EQ(denial([&] { shares.undoShareGroupWithUser(u2, grp, u3); }), DenyReason::NothingToUndo);
}

TEST_F(UndoShareTest, ResourceGroupUndo) {
    shares.shareGroupWithUser(u1, grp, u2, Privilege::View);
    shares.shareResourceWithUser(u1, res, u2, Privilege::Change);
    shares.shareResourceWithGroup(u2, res, grp, Privilege::View);

    EXPECT_EQ(denial([&] { shares.undoShareResourceWithGroup(u2, res, grp, GrantorOverride{u1}); }),
              DenyReason::NotOwner);
    shares.undoShareResourceWithGroup(u2, res, grp);
    EXPECT_EQ(authz.groupPrivilege(grp, res), Privilege::None);

    shares.shareResourceWithGroup(u2, res, grp, Privilege::Change);
    shares.undoShareResourceWithGroup(u1, res, grp, GrantorOverride{u2});
    EXPECT_TRUE(grants(Relation::GroupResource, grp, res).empty());
}

TEST_F(UndoShareTest, InactiveCallerCannotUndo) {
    shares.shareResourceWithUser(u1, res, u2, Privilege::Change);
    shares.shareResourceWithUser(u2, res, u3, Privilege::View);
    setActive(u2, false);
    EXPECT_EQ(denial([&] { shares.undoShareResourceWithUser(u2, res, u3); }), DenyReason::InactivePrincipal);
}
