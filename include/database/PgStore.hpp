#pragma once

#include "store/Store.hpp"

#include <memory>

namespace gr::config {
struct DatabaseConfig;
}

namespace gr::database {

class DBPool;

// PostgreSQL-backed store. Each transaction holds one pooled connection and one
// pqxx::work; per-object locks are row locks taken with SELECT ... FOR UPDATE.
class PgStore : public store::Store {
public:
    explicit PgStore(const config::DatabaseConfig& cfg);
    ~PgStore() override;

    [[nodiscard]] std::unique_ptr<store::Txn> begin(store::TxnMode mode) override;
    [[nodiscard]] std::string name() const override { return "postgres"; }

private:
    std::shared_ptr<DBPool> pool_;
};

} // namespace gr::database
