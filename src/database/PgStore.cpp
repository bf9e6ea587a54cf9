#include "database/PgStore.hpp"
#include "access/AccessError.hpp"
#include "database/DBPool.hpp"
#include "database/grantTables.hpp"
#include "logging/LogRegistry.hpp"

#include <pqxx/pqxx>

using namespace gr::types;
using namespace gr::store;
using namespace gr::logging;

namespace gr::database {

namespace {

std::optional<int> code(const std::optional<Privilege>& p) {
    if (!p) return std::nullopt;
    return static_cast<int>(privilegeToCode(*p));
}

pqxx::params filterParams(const GrantFilter& f) {
    return pqxx::params{f.subject, f.object, f.grantor, code(f.privilege), code(f.weakerThan)};
}

class PgTxn final : public Txn {
public:
    PgTxn(std::shared_ptr<DBPool> pool, const TxnMode mode)
        : pool_(std::move(pool)), conn_(pool_->acquire()), mode_(mode) {
        try {
            work_ = std::make_unique<pqxx::work>(conn_->get());
            if (mode_ == TxnMode::ReadOnly) work_->exec("SET TRANSACTION READ ONLY");
        } catch (...) {
            work_.reset();
            pool_->release(std::move(conn_));
            throw;
        }
    }

    ~PgTxn() override {
        // pqxx::work aborts on destruction if not committed
        work_.reset();
        if (conn_) pool_->release(std::move(conn_));
    }

    [[nodiscard]] TxnMode mode() const override { return mode_; }

    UserPtr getUser(const unsigned int id) override {
        const auto res = w().exec(pqxx::prepped{"get_user"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<User>(res.one_row());
    }

    unsigned int createUser(const User& user) override {
        return w().exec(pqxx::prepped{"insert_user"}, pqxx::params{user.name, user.is_active, user.is_superuser})
            .one_row()["id"].as<unsigned int>();
    }

    void updateUser(const User& user) override {
        const auto res = w().exec(pqxx::prepped{"update_user"},
                                  pqxx::params{user.id, user.name, user.is_active, user.is_superuser});
        if (res.affected_rows() == 0) throw std::runtime_error("User not found: " + std::to_string(user.id));
    }

    std::vector<UserPtr> getUsers(const std::vector<unsigned int>& ids) override {
        std::vector<UserPtr> out;
        for (const auto id : ids)
            if (auto u = getUser(id)) out.push_back(std::move(u));
        return out;
    }

    GroupPtr getGroup(const unsigned int id) override {
        const auto res = w().exec(pqxx::prepped{"get_group"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<Group>(res.one_row());
    }

    unsigned int createGroup(const Group& group) override {
        const auto& f = group.flags;
        return w().exec(pqxx::prepped{"insert_group"},
                        pqxx::params{group.name, f.active, f.discoverable, f.is_public, f.shareable})
            .one_row()["id"].as<unsigned int>();
    }

    void updateGroupFlags(const unsigned int id, const GroupFlags& f) override {
        const auto res = w().exec(pqxx::prepped{"update_group_flags"},
                                  pqxx::params{id, f.active, f.discoverable, f.is_public, f.shareable});
        if (res.affected_rows() == 0) throw std::runtime_error("Group not found: " + std::to_string(id));
    }

    void deleteGroup(const unsigned int id) override {
        w().exec(pqxx::prepped{"delete_group"}, pqxx::params{id});
    }

    std::vector<GroupPtr> getGroups(const std::vector<unsigned int>& ids) override {
        std::vector<GroupPtr> out;
        for (const auto id : ids)
            if (auto g = getGroup(id)) out.push_back(std::move(g));
        return out;
    }

    ResourcePtr getResource(const unsigned int id) override {
        const auto res = w().exec(pqxx::prepped{"get_resource"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<Resource>(res.one_row());
    }

    unsigned int createResource(const Resource& resource) override {
        const auto& f = resource.flags;
        return w().exec(pqxx::prepped{"insert_resource"},
                        pqxx::params{resource.title, f.active, f.discoverable, f.is_public, f.shareable,
                                     f.published, f.immutable})
            .one_row()["id"].as<unsigned int>();
    }

    void updateResourceFlags(const unsigned int id, const ResourceFlags& f) override {
        const auto res = w().exec(pqxx::prepped{"update_resource_flags"},
                                  pqxx::params{id, f.active, f.discoverable, f.is_public, f.shareable,
                                               f.published, f.immutable});
        if (res.affected_rows() == 0) throw std::runtime_error("Resource not found: " + std::to_string(id));
    }

    void deleteResource(const unsigned int id) override {
        w().exec(pqxx::prepped{"delete_resource"}, pqxx::params{id});
    }

    std::vector<ResourcePtr> getResources(const std::vector<unsigned int>& ids) override {
        std::vector<ResourcePtr> out;
        for (const auto id : ids)
            if (auto r = getResource(id)) out.push_back(std::move(r));
        return out;
    }

    void lockGroup(const unsigned int id) override {
        w().exec(pqxx::prepped{"lock_group"}, pqxx::params{id});
    }

    void lockResource(const unsigned int id) override {
        w().exec(pqxx::prepped{"lock_resource"}, pqxx::params{id});
    }

    std::vector<Grant> listGrants(const Relation relation, const GrantFilter& filter) override {
        const auto res = w().exec(pqxx::prepped{grantStmt(relation, "list")}, filterParams(filter));
        std::vector<Grant> out;
        out.reserve(res.size());
        for (const auto& row : res) out.emplace_back(relation, row);
        return out;
    }

    std::optional<Grant> getGrant(const Relation relation, const unsigned int subject,
                                  const unsigned int object, const unsigned int grantor) override {
        const auto res = w().exec(pqxx::prepped{grantStmt(relation, "get")}, pqxx::params{subject, object, grantor});
        if (res.empty()) return std::nullopt;
        if (res.size() > 1)
            throw access::IntegrityError("duplicate " + to_string(relation) + " grant (" + std::to_string(subject) +
                                         ", " + std::to_string(object) + ", " + std::to_string(grantor) + ")");
        return Grant(relation, res[0]);
    }

    bool upsertGrant(const Relation relation, const unsigned int subject, const unsigned int object,
                     const unsigned int grantor, const Privilege privilege) override {
        if (!isGrantable(privilege))
            throw std::invalid_argument("Refusing to store non-grantable privilege " + to_string(privilege));
        return w().exec(pqxx::prepped{grantStmt(relation, "upsert")},
                        pqxx::params{subject, object, grantor, static_cast<int>(privilegeToCode(privilege))})
            .one_row()["inserted"].as<bool>();
    }

    std::size_t deleteGrants(const Relation relation, const GrantFilter& filter) override {
        const auto res = w().exec(pqxx::prepped{grantStmt(relation, "delete")}, filterParams(filter));
        return static_cast<std::size_t>(res.affected_rows());
    }

    void commit() override {
        if (!work_) return;
        work_->commit();
        work_.reset();
        pool_->release(std::move(conn_));
    }

    void rollback() override {
        if (!work_) return;
        try {
            work_->abort();
        } catch (const std::exception& e) {
            LogRegistry::db()->error("[PgTxn] Rollback failed: {}", e.what());
        }
        work_.reset();
        pool_->release(std::move(conn_));
    }

private:
    std::shared_ptr<DBPool> pool_;
    std::unique_ptr<DBConnection> conn_;
    std::unique_ptr<pqxx::work> work_;
    TxnMode mode_;

    pqxx::work& w() const {
        if (!work_) throw std::logic_error("PgTxn used after commit or rollback");
        return *work_;
    }
};

}

PgStore::PgStore(const config::DatabaseConfig& cfg) : pool_(std::make_shared<DBPool>(cfg)) {
    LogRegistry::db()->info("[PgStore] Connection pool ready ({} connections to {}/{})",
                            cfg.pool_size, cfg.host, cfg.name);
}

PgStore::~PgStore() = default;

std::unique_ptr<Txn> PgStore::begin(const TxnMode mode) {
    return std::make_unique<PgTxn>(pool_, mode);
}

}
