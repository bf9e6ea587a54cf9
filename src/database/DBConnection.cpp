#include "database/DBConnection.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace gr::logging;

namespace gr::database {

static std::string quoteConnValue(const std::string& v) {
    std::string out = "'";
    for (const char c : v) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string buildConnectionString(const config::DatabaseConfig& cfg, const std::string& password) {
    std::string s = "host=" + quoteConnValue(cfg.host) +
                    " port=" + std::to_string(cfg.port) +
                    " dbname=" + quoteConnValue(cfg.name) +
                    " user=" + quoteConnValue(cfg.user);
    if (!password.empty()) s += " password=" + quoteConnValue(password);
    return s;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg) {
    std::string password;
    if (!cfg.password_env.empty()) {
        if (const char* env = std::getenv(cfg.password_env.c_str())) password = env;
        else LogRegistry::db()->warn("[DBConnection] {} is not set, connecting without a password", cfg.password_env);
    }

    LogRegistry::db()->debug("[DBConnection] Connecting to {}@{}:{}/{}", cfg.user, cfg.host, cfg.port, cfg.name);
    conn_ = std::make_unique<pqxx::connection>(buildConnectionString(cfg, password));
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedUsers();
    initPreparedGroups();
    initPreparedResources();
    initPreparedGrants();
}

}
