#pragma once

#include "access/Rules.hpp"
#include "types/Privilege.hpp"
#include "types/Group.hpp"
#include "types/User.hpp"

#include <memory>
#include <vector>

namespace gr::store {
class Store;
}

namespace gr::access {

// Read-only answers to "may this principal do X". Every can* call evaluates the
// same Rules function that the matching ShareManager action enforces, so a true
// answer means the action succeeds against unchanged state.
//
// Usage:
//     if (authz.canShareResourceWithUser(me, res, other, Privilege::View))
//         // ...render the control; later, in the handler:
//         shares.shareResourceWithUser(me, res, other, Privilege::View);
//
// Unknown ids raise UsageError.
class Authorizer {
public:
    explicit Authorizer(std::shared_ptr<store::Store> store);

    // privilege resolution
    [[nodiscard]] types::Privilege combinedPrivilege(unsigned int user, unsigned int resource) const;
    [[nodiscard]] types::Privilege effectivePrivilege(unsigned int user, unsigned int resource) const;
    [[nodiscard]] types::Privilege userGroupPrivilege(unsigned int user, unsigned int group) const;
    [[nodiscard]] types::Privilege groupPrivilege(unsigned int group, unsigned int resource) const;

    [[nodiscard]] bool ownsGroup(unsigned int user, unsigned int group) const;
    [[nodiscard]] bool ownsResource(unsigned int user, unsigned int resource) const;
    [[nodiscard]] bool isMember(unsigned int user, unsigned int group) const;

    // groups
    [[nodiscard]] bool canViewGroup(unsigned int user, unsigned int group) const;
    [[nodiscard]] bool canViewGroupMetadata(unsigned int user, unsigned int group) const;
    [[nodiscard]] bool canChangeGroup(unsigned int user, unsigned int group) const;
    [[nodiscard]] bool canChangeGroupFlags(unsigned int user, unsigned int group) const;
    [[nodiscard]] bool canDeleteGroup(unsigned int user, unsigned int group) const;

    // resources
    [[nodiscard]] bool canViewResource(unsigned int user, unsigned int resource) const;
    [[nodiscard]] bool canViewResourceMetadata(unsigned int user, unsigned int resource) const;
    [[nodiscard]] bool canChangeResource(unsigned int user, unsigned int resource) const;
    [[nodiscard]] bool canChangeResourceFlags(unsigned int user, unsigned int resource) const;
    [[nodiscard]] bool canDeleteResource(unsigned int user, unsigned int resource) const;

    // share
    [[nodiscard]] bool canShareGroup(unsigned int user, unsigned int group, types::Privilege level) const;
    [[nodiscard]] bool canShareResource(unsigned int user, unsigned int resource, types::Privilege level) const;
    [[nodiscard]] bool canShareGroupWithUser(unsigned int user, unsigned int group, unsigned int target,
                                             types::Privilege level) const;
    [[nodiscard]] bool canShareResourceWithUser(unsigned int user, unsigned int resource, unsigned int target,
                                                types::Privilege level) const;
    [[nodiscard]] bool canShareResourceWithGroup(unsigned int user, unsigned int resource, unsigned int group,
                                                 types::Privilege level) const;

    // unshare
    [[nodiscard]] bool canUnshareGroupWithUser(unsigned int user, unsigned int group, unsigned int target) const;
    [[nodiscard]] bool canUnshareResourceWithUser(unsigned int user, unsigned int resource,
                                                  unsigned int target) const;
    [[nodiscard]] bool canUnshareResourceWithGroup(unsigned int user, unsigned int resource,
                                                   unsigned int group) const;

    // undo-share, own grant and grantor override
    [[nodiscard]] bool canUndoShareGroupWithUser(unsigned int user, unsigned int group, unsigned int target) const;
    [[nodiscard]] bool canUndoShareGroupWithUser(unsigned int user, unsigned int group, unsigned int target,
                                                 GrantorOverride by) const;
    [[nodiscard]] bool canUndoShareResourceWithUser(unsigned int user, unsigned int resource,
                                                    unsigned int target) const;
    [[nodiscard]] bool canUndoShareResourceWithUser(unsigned int user, unsigned int resource, unsigned int target,
                                                    GrantorOverride by) const;
    [[nodiscard]] bool canUndoShareResourceWithGroup(unsigned int user, unsigned int resource,
                                                     unsigned int group) const;
    [[nodiscard]] bool canUndoShareResourceWithGroup(unsigned int user, unsigned int resource, unsigned int group,
                                                     GrantorOverride by) const;

    // Subjects for which at least one undo call (own grant, or override when the
    // caller owns the object) would currently succeed.
    [[nodiscard]] std::vector<types::UserPtr> groupUndoUsers(unsigned int user, unsigned int group) const;
    [[nodiscard]] std::vector<types::UserPtr> resourceUndoUsers(unsigned int user, unsigned int resource) const;
    [[nodiscard]] std::vector<types::GroupPtr> resourceUndoGroups(unsigned int user, unsigned int resource) const;

    // Holders for which the unshare call would currently succeed.
    [[nodiscard]] std::vector<types::UserPtr> groupUnshareUsers(unsigned int user, unsigned int group) const;
    [[nodiscard]] std::vector<types::UserPtr> resourceUnshareUsers(unsigned int user, unsigned int resource) const;
    [[nodiscard]] std::vector<types::GroupPtr> resourceUnshareGroups(unsigned int user, unsigned int resource) const;

private:
    std::shared_ptr<store::Store> store_;
};

}
