#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace gr::config {

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "grantry";
    std::string user = "grantry";
    std::string password_env = "GRANTRY_DB_PASSWORD"; // environment variable holding the password
    unsigned int pool_size = 4;
};

enum class StoreBackend { Memory, Postgres };

struct StoreConfig {
    StoreBackend backend = StoreBackend::Memory;
};

struct AccessConfig {
    bool audit_mutations = true; // write every committed grant mutation to the audit log
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum grantry  = spdlog::level::info;   // lifecycle events
    spdlog::level::level_enum access   = spdlog::level::warn;   // denied actions
    spdlog::level::level_enum store    = spdlog::level::warn;   // transaction rollbacks
    spdlog::level::level_enum db       = spdlog::level::err;    // unreachable DB, failed tx
    spdlog::level::level_enum types    = spdlog::level::err;    // schema or decoding errors
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/grantry";
    size_t max_file_size_bytes = 10 * 1024 * 1024;
    size_t max_files = 5;
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    StoreConfig store;
    AccessConfig access;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

std::string to_string(StoreBackend b);
StoreBackend storeBackendFromString(const std::string& s);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const StoreConfig& c);
void from_json(const nlohmann::json& j, StoreConfig& c);
void to_json(nlohmann::json& j, const AccessConfig& c);
void from_json(const nlohmann::json& j, AccessConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace gr::config
