#pragma once

#include "store/Store.hpp"

#include <map>
#include <shared_mutex>
#include <tuple>

namespace gr::store {

// In-process store. Writers are serialized by an exclusive lock held for the
// whole transaction and work on a private copy of the tables that replaces the
// shared copy on commit. Readers share the lock and see only committed state.
class MemoryStore : public Store {
public:
    MemoryStore() = default;

    [[nodiscard]] std::unique_ptr<Txn> begin(TxnMode mode) override;
    [[nodiscard]] std::string name() const override { return "memory"; }

    struct Tables {
        using GrantKey = std::tuple<types::Relation, unsigned int, unsigned int, unsigned int>;

        unsigned int nextUserId = 1, nextGroupId = 1, nextResourceId = 1;
        std::map<unsigned int, types::User> users;
        std::map<unsigned int, types::Group> groups;
        std::map<unsigned int, types::Resource> resources;
        std::map<GrantKey, types::Grant> grants;
    };

private:
    friend class MemoryTxn;

    mutable std::shared_mutex mutex_;
    Tables tables_;
};

} // namespace gr::store
