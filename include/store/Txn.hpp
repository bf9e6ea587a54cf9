#pragma once

#include "types/Grant.hpp"
#include "types/Group.hpp"
#include "types/Privilege.hpp"
#include "types/Resource.hpp"
#include "types/User.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace gr::store {

// Selects grant records within one relation. Unset fields match anything.
struct GrantFilter {
    std::optional<unsigned int> subject{};
    std::optional<unsigned int> object{};
    std::optional<unsigned int> grantor{};
    std::optional<types::Privilege> privilege{};   // exact level
    std::optional<types::Privilege> weakerThan{};  // level strictly weaker than this

    [[nodiscard]] bool matches(const types::Grant& g) const;
};

enum class TxnMode { ReadOnly, ReadWrite };

// One unit of work against the grant and entity tables. Writes become visible
// to other transactions only after commit(); a transaction destroyed without
// commit() is rolled back.
class Txn {
public:
    virtual ~Txn() = default;

    [[nodiscard]] virtual TxnMode mode() const = 0;

    // identities
    virtual types::UserPtr getUser(unsigned int id) = 0;
    virtual unsigned int createUser(const types::User& user) = 0;
    virtual void updateUser(const types::User& user) = 0;
    virtual std::vector<types::UserPtr> getUsers(const std::vector<unsigned int>& ids) = 0;

    // groups
    virtual types::GroupPtr getGroup(unsigned int id) = 0;
    virtual unsigned int createGroup(const types::Group& group) = 0;
    virtual void updateGroupFlags(unsigned int id, const types::GroupFlags& flags) = 0;
    virtual void deleteGroup(unsigned int id) = 0;
    virtual std::vector<types::GroupPtr> getGroups(const std::vector<unsigned int>& ids) = 0;

    // resources
    virtual types::ResourcePtr getResource(unsigned int id) = 0;
    virtual unsigned int createResource(const types::Resource& resource) = 0;
    virtual void updateResourceFlags(unsigned int id, const types::ResourceFlags& flags) = 0;
    virtual void deleteResource(unsigned int id) = 0;
    virtual std::vector<types::ResourcePtr> getResources(const std::vector<unsigned int>& ids) = 0;

    // Serializes concurrent writers touching the same group or resource until commit.
    virtual void lockGroup(unsigned int id) = 0;
    virtual void lockResource(unsigned int id) = 0;

    // grants
    virtual std::vector<types::Grant> listGrants(types::Relation relation, const GrantFilter& filter) = 0;
    virtual std::optional<types::Grant> getGrant(types::Relation relation, unsigned int subject,
                                                 unsigned int object, unsigned int grantor) = 0;
    // Creates the record or updates its privilege in place. Returns true if created.
    virtual bool upsertGrant(types::Relation relation, unsigned int subject, unsigned int object,
                             unsigned int grantor, types::Privilege privilege) = 0;
    virtual std::size_t deleteGrants(types::Relation relation, const GrantFilter& filter) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;

    [[nodiscard]] bool hasGrant(const types::Relation relation, const GrantFilter& filter) {
        return !listGrants(relation, filter).empty();
    }
};

} // namespace gr::store
