#include "store/MemoryStore.hpp"

#include <mutex>
#include <stdexcept>
#include <variant>

using namespace gr::types;

namespace gr::store {

class MemoryTxn final : public Txn {
public:
    MemoryTxn(MemoryStore& store, const TxnMode mode) : store_(store), mode_(mode) {
        if (mode_ == TxnMode::ReadWrite) {
            lock_.emplace<std::unique_lock<std::shared_mutex>>(store_.mutex_);
            working_ = store_.tables_;
            tables_ = &working_;
        } else {
            lock_.emplace<std::shared_lock<std::shared_mutex>>(store_.mutex_);
            tables_ = &store_.tables_;
        }
    }

    ~MemoryTxn() override = default;

    [[nodiscard]] TxnMode mode() const override { return mode_; }

    UserPtr getUser(const unsigned int id) override {
        const auto it = tables_->users.find(id);
        if (it == tables_->users.end()) return nullptr;
        return std::make_shared<User>(it->second);
    }

    unsigned int createUser(const User& user) override {
        requireWritable("createUser");
        User copy = user;
        copy.id = tables_->nextUserId++;
        tables_->users.emplace(copy.id, copy);
        return copy.id;
    }

    void updateUser(const User& user) override {
        requireWritable("updateUser");
        const auto it = tables_->users.find(user.id);
        if (it == tables_->users.end()) throw std::runtime_error("User not found: " + std::to_string(user.id));
        it->second = user;
    }

    std::vector<UserPtr> getUsers(const std::vector<unsigned int>& ids) override {
        std::vector<UserPtr> out;
        for (const auto id : ids)
            if (auto u = getUser(id)) out.push_back(std::move(u));
        return out;
    }

    GroupPtr getGroup(const unsigned int id) override {
        const auto it = tables_->groups.find(id);
        if (it == tables_->groups.end()) return nullptr;
        return std::make_shared<Group>(it->second);
    }

    unsigned int createGroup(const Group& group) override {
        requireWritable("createGroup");
        Group copy = group;
        copy.id = tables_->nextGroupId++;
        tables_->groups.emplace(copy.id, copy);
        return copy.id;
    }

    void updateGroupFlags(const unsigned int id, const GroupFlags& flags) override {
        requireWritable("updateGroupFlags");
        const auto it = tables_->groups.find(id);
        if (it == tables_->groups.end()) throw std::runtime_error("Group not found: " + std::to_string(id));
        it->second.flags = flags;
    }

    void deleteGroup(const unsigned int id) override {
        requireWritable("deleteGroup");
        tables_->groups.erase(id);
    }

    std::vector<GroupPtr> getGroups(const std::vector<unsigned int>& ids) override {
        std::vector<GroupPtr> out;
        for (const auto id : ids)
            if (auto g = getGroup(id)) out.push_back(std::move(g));
        return out;
    }

    ResourcePtr getResource(const unsigned int id) override {
        const auto it = tables_->resources.find(id);
        if (it == tables_->resources.end()) return nullptr;
        return std::make_shared<Resource>(it->second);
    }

    unsigned int createResource(const Resource& resource) override {
        requireWritable("createResource");
        Resource copy = resource;
        copy.id = tables_->nextResourceId++;
        tables_->resources.emplace(copy.id, copy);
        return copy.id;
    }

    void updateResourceFlags(const unsigned int id, const ResourceFlags& flags) override {
        requireWritable("updateResourceFlags");
        const auto it = tables_->resources.find(id);
        if (it == tables_->resources.end()) throw std::runtime_error("Resource not found: " + std::to_string(id));
        it->second.flags = flags;
    }

    void deleteResource(const unsigned int id) override {
        requireWritable("deleteResource");
        tables_->resources.erase(id);
    }

    std::vector<ResourcePtr> getResources(const std::vector<unsigned int>& ids) override {
        std::vector<ResourcePtr> out;
        for (const auto id : ids)
            if (auto r = getResource(id)) out.push_back(std::move(r));
        return out;
    }

    // The exclusive store lock already serializes writers.
    void lockGroup(unsigned int) override { requireWritable("lockGroup"); }
    void lockResource(unsigned int) override { requireWritable("lockResource"); }

    std::vector<Grant> listGrants(const Relation relation, const GrantFilter& filter) override {
        std::vector<Grant> out;
        for (const auto& [key, grant] : tables_->grants)
            if (std::get<0>(key) == relation && filter.matches(grant)) out.push_back(grant);
        return out;
    }

    std::optional<Grant> getGrant(const Relation relation, const unsigned int subject,
                                  const unsigned int object, const unsigned int grantor) override {
        const auto it = tables_->grants.find({relation, subject, object, grantor});
        if (it == tables_->grants.end()) return std::nullopt;
        return it->second;
    }

    bool upsertGrant(const Relation relation, const unsigned int subject, const unsigned int object,
                     const unsigned int grantor, const Privilege privilege) override {
        requireWritable("upsertGrant");
        if (!isGrantable(privilege))
            throw std::invalid_argument("Refusing to store non-grantable privilege " + to_string(privilege));

        const MemoryStore::Tables::GrantKey key{relation, subject, object, grantor};
        if (const auto it = tables_->grants.find(key); it != tables_->grants.end()) {
            it->second.privilege = privilege;
            it->second.granted_at = Grant(relation, subject, object, grantor, privilege).granted_at;
            return false;
        }
        tables_->grants.emplace(key, Grant(relation, subject, object, grantor, privilege));
        return true;
    }

    std::size_t deleteGrants(const Relation relation, const GrantFilter& filter) override {
        requireWritable("deleteGrants");
        return std::erase_if(tables_->grants, [&](const auto& kv) {
            return std::get<0>(kv.first) == relation && filter.matches(kv.second);
        });
    }

    void commit() override {
        if (finished_) return;
        if (mode_ == TxnMode::ReadWrite) store_.tables_ = std::move(working_);
        finish();
    }

    void rollback() override {
        if (finished_) return;
        finish();
    }

private:
    MemoryStore& store_;
    TxnMode mode_;
    std::variant<std::monostate, std::shared_lock<std::shared_mutex>, std::unique_lock<std::shared_mutex>> lock_;
    MemoryStore::Tables working_;
    MemoryStore::Tables* tables_ = nullptr;
    bool finished_ = false;

    void requireWritable(const char* op) const {
        if (finished_) throw std::logic_error(std::string("MemoryTxn::") + op + " on finished transaction");
        if (mode_ != TxnMode::ReadWrite)
            throw std::logic_error(std::string("MemoryTxn::") + op + " in read-only transaction");
    }

    void finish() {
        finished_ = true;
        tables_ = nullptr;
        lock_.emplace<std::monostate>();
    }
};

std::unique_ptr<Txn> MemoryStore::begin(const TxnMode mode) {
    return std::make_unique<MemoryTxn>(*this, mode);
}

}
