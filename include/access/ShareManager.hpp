#pragma once

#include "access/Rules.hpp"
#include "types/Group.hpp"
#include "types/Privilege.hpp"
#include "types/Resource.hpp"
#include "types/User.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace gr::store {
class Store;
}

namespace gr::access {

// The only writer of grant records and entity flags. Each action runs in one
// write transaction: lock the object, re-evaluate the rule the matching
// Authorizer predicate uses, then mutate. A denial throws AuthorizationError
// and leaves nothing behind.
class ShareManager {
public:
    explicit ShareManager(std::shared_ptr<store::Store> store);

    // Identity mirror. Users come from the identity provider; only their
    // active and superuser flags matter here.
    unsigned int registerUser(const types::User& user);
    void updateUser(const types::User& user);

    // lifecycle
    types::GroupPtr createGroup(unsigned int user, const std::string& name,
                                const types::GroupFlags& flags = {});
    types::ResourcePtr createResource(unsigned int user, const std::string& title,
                                      const types::ResourceFlags& flags = {});
    void deleteGroup(unsigned int user, unsigned int group);
    void deleteResource(unsigned int user, unsigned int resource);
    void setGroupFlags(unsigned int user, unsigned int group, const types::GroupFlags& flags);
    void setResourceFlags(unsigned int user, unsigned int resource, const types::ResourceFlags& flags);

    // share
    void shareGroupWithUser(unsigned int user, unsigned int group, unsigned int target, types::Privilege level);
    void shareResourceWithUser(unsigned int user, unsigned int resource, unsigned int target,
                               types::Privilege level);
    void shareResourceWithGroup(unsigned int user, unsigned int resource, unsigned int group,
                                types::Privilege level);

    // unshare; returns the number of grant records removed
    std::size_t unshareGroupWithUser(unsigned int user, unsigned int group, unsigned int target);
    std::size_t unshareResourceWithUser(unsigned int user, unsigned int resource, unsigned int target);
    std::size_t unshareResourceWithGroup(unsigned int user, unsigned int resource, unsigned int group);

    // undo-share of the caller's own grant
    void undoShareGroupWithUser(unsigned int user, unsigned int group, unsigned int target);
    void undoShareResourceWithUser(unsigned int user, unsigned int resource, unsigned int target);
    void undoShareResourceWithGroup(unsigned int user, unsigned int resource, unsigned int group);

    // undo-share of the grant made by `by.grantor`, owner or superuser only
    void undoShareGroupWithUser(unsigned int user, unsigned int group, unsigned int target, GrantorOverride by);
    void undoShareResourceWithUser(unsigned int user, unsigned int resource, unsigned int target,
                                   GrantorOverride by);
    void undoShareResourceWithGroup(unsigned int user, unsigned int resource, unsigned int group,
                                    GrantorOverride by);

private:
    std::shared_ptr<store::Store> store_;

    static void enforce(const Verdict& verdict, const std::string& action, unsigned int user);
};

}
