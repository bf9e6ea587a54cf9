#include "AccessFixture.hpp"

using namespace gr::access;
using namespace gr::types;

class PrivilegeResolverTest : public AccessFixture {
protected:
    unsigned int owner = 0, member = 0, outsider = 0, admin = 0;
    unsigned int grp = 0, res = 0;

    void SetUp() override {
        owner = user("owner");
        member = user("member");
        outsider = user("outsider");
        admin = user("admin", true, true);
        grp = group(owner, "team");
        res = resource(owner, "dataset");
        shares.shareGroupWithUser(owner, grp, member, Privilege::View);
    }

    void setFlags(const bool isPublic, const bool immutable) {
        ResourceFlags f;
        f.is_public = isPublic;
        f.immutable = immutable;
        shares.setResourceFlags(owner, res, f);
    }
};

TEST_F(PrivilegeResolverTest, CreatorOwnsBootstrapGrant) {
    EXPECT_EQ(authz.combinedPrivilege(owner, res), Privilege::Owner);
    EXPECT_TRUE(authz.ownsResource(owner, res));
    EXPECT_TRUE(authz.ownsGroup(owner, grp));

    const auto g = grants(Relation::UserResource, owner, res);
    ASSERT_EQ(g.size(), 1u);
    EXPECT_EQ(g[0].grantor_id, owner);
}

TEST_F(PrivilegeResolverTest, NoGrantResolvesToNone) {
    EXPECT_EQ(authz.combinedPrivilege(outsider, res), Privilege::None);
    EXPECT_EQ(authz.userGroupPrivilege(outsider, grp), Privilege::None);
}

TEST_F(PrivilegeResolverTest, SuperuserIsAlwaysOwner) {
    EXPECT_EQ(authz.combinedPrivilege(admin, res), Privilege::Owner);
    EXPECT_EQ(authz.userGroupPrivilege(admin, grp), Privilege::Owner);
    EXPECT_FALSE(authz.ownsResource(admin, res));
}

TEST_F(PrivilegeResolverTest, GroupGrantReachesMembers) {
    shares.shareResourceWithGroup(owner, res, grp, Privilege::Change);

    EXPECT_EQ(authz.groupPrivilege(grp, res), Privilege::Change);
    EXPECT_EQ(authz.combinedPrivilege(member, res), Privilege::Change);
    EXPECT_EQ(authz.combinedPrivilege(outsider, res), Privilege::None);
}

TEST_F(PrivilegeResolverTest, StrongestOfDirectAndGroupWins) {
    shares.shareResourceWithUser(owner, res, member, Privilege::View);
    shares.shareResourceWithGroup(owner, res, grp, Privilege::Change);
    EXPECT_EQ(authz.combinedPrivilege(member, res), Privilege::Change);

    shares.unshareResourceWithGroup(owner, res, grp);
    EXPECT_EQ(authz.combinedPrivilege(member, res), Privilege::View);
}

TEST_F(PrivilegeResolverTest, InactiveGroupConfersNothing) {
    shares.shareResourceWithGroup(owner, res, grp, Privilege::Change);

    GroupFlags f;
    f.active = false;
    shares.setGroupFlags(owner, grp, f);

    EXPECT_EQ(authz.groupPrivilege(grp, res), Privilege::None);
    EXPECT_EQ(authz.combinedPrivilege(member, res), Privilege::None);
}

TEST_F(PrivilegeResolverTest, InactiveUserHasNoPrivilege) {
    shares.shareResourceWithUser(owner, res, member, Privilege::Change);
    setActive(member, false);

    EXPECT_EQ(authz.combinedPrivilege(member, res), Privilege::None);
    EXPECT_EQ(authz.userGroupPrivilege(member, grp), Privilege::None);
    EXPECT_FALSE(authz.canViewResource(member, res));
}

TEST_F(PrivilegeResolverTest, EffectiveEqualsCombinedWithoutFlags) {
    shares.shareResourceWithUser(owner, res, member, Privilege::Change);
    for (const auto u : {owner, member, outsider, admin})
        EXPECT_EQ(authz.effectivePrivilege(u, res), authz.combinedPrivilege(u, res));
}

TEST_F(PrivilegeResolverTest, ImmutableCapsAtView) {
    shares.shareResourceWithUser(owner, res, member, Privilege::Change);
    setFlags(false, true);

    EXPECT_EQ(authz.effectivePrivilege(owner, res), Privilege::View);
    EXPECT_EQ(authz.effectivePrivilege(member, res), Privilege::View);
    EXPECT_EQ(authz.effectivePrivilege(outsider, res), Privilege::None);
    EXPECT_FALSE(authz.canChangeResource(owner, res));
    EXPECT_TRUE(authz.canViewResource(owner, res));
}

TEST_F(PrivilegeResolverTest, PublicGuaranteesView) {
    setFlags(true, false);

    EXPECT_EQ(authz.effectivePrivilege(owner, res), Privilege::Owner);
    EXPECT_EQ(authz.effectivePrivilege(outsider, res), Privilege::View);
}

TEST_F(PrivilegeResolverTest, ImmutableAndPublicCollapseToView) {
    shares.shareResourceWithUser(owner, res, member, Privilege::Change);
    setFlags(true, true);

    for (const auto u : {owner, member, outsider, admin})
        EXPECT_EQ(authz.effectivePrivilege(u, res), Privilege::View) << "user " << u;
}

TEST_F(PrivilegeResolverTest, PublicResourceNeverSharedIsViewOnly) {
    const auto stranger = user("stranger");
    setFlags(true, false);

    EXPECT_EQ(authz.effectivePrivilege(stranger, res), Privilege::View);
    EXPECT_TRUE(authz.canViewResource(stranger, res));
    EXPECT_FALSE(authz.canChangeResource(stranger, res));
}

TEST_F(PrivilegeResolverTest, UnknownIdsAreUsageErrors) {
    EXPECT_THROW((void)authz.combinedPrivilege(999, res), UsageError);
    EXPECT_THROW((void)authz.combinedPrivilege(owner, 999), UsageError);
    EXPECT_THROW((void)authz.canViewGroup(owner, 999), UsageError);
}
