#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace gr::config {

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["store"]) YAML::convert<StoreConfig>::decode(node, cfg.store);
    if (auto node = root["access"]) YAML::convert<AccessConfig>::decode(node, cfg.access);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string to_string(const StoreBackend b) {
    switch (b) {
    case StoreBackend::Memory: return "memory";
    case StoreBackend::Postgres: return "postgres";
    default: return "unknown";
    }
}

StoreBackend storeBackendFromString(const std::string& s) {
    if (s == "memory") return StoreBackend::Memory;
    if (s == "postgres" || s == "postgresql") return StoreBackend::Postgres;
    throw std::runtime_error("Unknown store backend: " + s);
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"database", c.database},
        {"store", c.store},
        {"access", c.access},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("database")) j.at("database").get_to(c.database);
    if (j.contains("store")) j.at("store").get_to(c.store);
    if (j.contains("access")) j.at("access").get_to(c.access);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password_env", c.password_env},
        {"pool_size", c.pool_size}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.host = j.value("host", "localhost");
    c.port = j.value("port", static_cast<uint16_t>(5432));
    c.name = j.value("name", "grantry");
    c.user = j.value("user", "grantry");
    c.password_env = j.value("password_env", "GRANTRY_DB_PASSWORD");
    c.pool_size = j.value("pool_size", 4u);
}

void to_json(nlohmann::json& j, const StoreConfig& c) {
    j = {{"backend", to_string(c.backend)}};
}

void from_json(const nlohmann::json& j, StoreConfig& c) {
    c.backend = storeBackendFromString(j.value("backend", "memory"));
}

void to_json(nlohmann::json& j, const AccessConfig& c) {
    j = {{"audit_mutations", c.audit_mutations}};
}

void from_json(const nlohmann::json& j, AccessConfig& c) {
    c.audit_mutations = j.value("audit_mutations", true);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"grantry", levelName(c.grantry)},
        {"access", levelName(c.access)},
        {"store", levelName(c.store)},
        {"db", levelName(c.db)},
        {"types", levelName(c.types)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.grantry = spdlog::level::from_str(j.value("grantry", "info"));
    c.access = spdlog::level::from_str(j.value("access", "warn"));
    c.store = spdlog::level::from_str(j.value("store", "warn"));
    c.db = spdlog::level::from_str(j.value("db", "error"));
    c.types = spdlog::level::from_str(j.value("types", "error"));
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", "info"));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", "warn"));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"max_file_size_mb", c.max_file_size_bytes / (1024 * 1024)},
        {"max_files", c.max_files},
        {"log_levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", "/var/log/grantry");
    c.max_file_size_bytes = j.value("max_file_size_mb", static_cast<size_t>(10)) * 1024 * 1024;
    c.max_files = j.value("max_files", static_cast<size_t>(5));
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

} // namespace gr::config
