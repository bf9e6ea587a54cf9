#pragma once

#include "store/Txn.hpp"
#include "types/Grant.hpp"
#include "types/Group.hpp"
#include "types/Privilege.hpp"
#include "types/Resource.hpp"
#include "types/User.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace gr::store {
class Store;
}

namespace gr::access {

// Read-only views over the grant relations. Membership and holding are derived
// from grant records; nothing here is stored separately. Results are sorted by
// id and free of duplicates. Unknown ids raise UsageError.
class AccessQueries {
public:
    explicit AccessQueries(std::shared_ptr<store::Store> store);

    // raw grant records, for diagnostics and administration
    [[nodiscard]] std::vector<types::Grant> grants(types::Relation relation, const store::GrantFilter& filter) const;

    // by user
    [[nodiscard]] std::vector<types::GroupPtr> heldGroups(unsigned int user) const;
    [[nodiscard]] std::vector<types::GroupPtr> ownedGroups(unsigned int user) const;
    // directly or through any group the user belongs to
    [[nodiscard]] std::vector<types::ResourcePtr> heldResources(unsigned int user) const;
    [[nodiscard]] std::vector<types::ResourcePtr> ownedResources(unsigned int user) const;
    // direct grant of Change or better on a resource that is not immutable
    [[nodiscard]] std::vector<types::ResourcePtr> editableResources(unsigned int user) const;
    // resources where the user's strongest direct grant is exactly `level`, immutable ones excluded
    [[nodiscard]] std::vector<types::ResourcePtr> resourcesWithExplicitAccess(unsigned int user,
                                                                              types::Privilege level) const;

    // by group
    [[nodiscard]] std::vector<types::UserPtr> groupMembers(unsigned int group) const;
    [[nodiscard]] std::vector<types::UserPtr> groupOwners(unsigned int group) const;
    [[nodiscard]] std::size_t groupMemberCount(unsigned int group) const;
    [[nodiscard]] std::size_t groupOwnerCount(unsigned int group) const;
    // can exceed groupOwnerCount when several grantors made the same user owner
    [[nodiscard]] std::size_t groupOwnerRecordCount(unsigned int group) const;
    [[nodiscard]] std::vector<types::ResourcePtr> groupHeldResources(unsigned int group) const;
    [[nodiscard]] std::vector<types::ResourcePtr> groupEditableResources(unsigned int group) const;

    // by resource
    [[nodiscard]] std::vector<types::UserPtr> resourceOwners(unsigned int resource) const;
    [[nodiscard]] std::size_t resourceOwnerCount(unsigned int resource) const;
    [[nodiscard]] std::size_t resourceOwnerRecordCount(unsigned int resource) const;
    // users with a direct grant
    [[nodiscard]] std::vector<types::UserPtr> resourceUsers(unsigned int resource) const;
    [[nodiscard]] std::vector<types::GroupPtr> resourceGroups(unsigned int resource) const;
    // users with a direct grant or membership in a group holding the resource
    [[nodiscard]] std::vector<types::UserPtr> resourceHolders(unsigned int resource) const;
    [[nodiscard]] std::vector<types::UserPtr> resourceViewUsers(unsigned int resource) const;
    [[nodiscard]] std::vector<types::UserPtr> resourceEditUsers(unsigned int resource) const;
    [[nodiscard]] std::vector<types::GroupPtr> resourceViewGroups(unsigned int resource) const;
    [[nodiscard]] std::vector<types::GroupPtr> resourceEditGroups(unsigned int resource) const;

private:
    std::shared_ptr<store::Store> store_;
};

}
