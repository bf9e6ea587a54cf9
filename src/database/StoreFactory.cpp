#include "database/StoreFactory.hpp"
#include "database/PgStore.hpp"
#include "logging/LogRegistry.hpp"
#include "store/MemoryStore.hpp"

#include <stdexcept>

namespace gr::database {

std::shared_ptr<store::Store> openStore(const config::Config& config) {
    switch (config.store.backend) {
    case config::StoreBackend::Memory:
        logging::LogRegistry::grantry()->info("[openStore] Using in-memory grant store");
        return std::make_shared<store::MemoryStore>();
    case config::StoreBackend::Postgres:
        logging::LogRegistry::grantry()->info("[openStore] Connecting to {}@{}:{}/{}", config.database.user,
                                              config.database.host, config.database.port, config.database.name);
        return std::make_shared<PgStore>(config.database);
    }
    throw std::invalid_argument("Unsupported store backend");
}

}
