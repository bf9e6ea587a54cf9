#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace gr::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("grantry");
        rhs.user = node["user"].as<std::string>("grantry");
        rhs.password_env = node["password_env"].as<std::string>("GRANTRY_DB_PASSWORD");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<StoreConfig> {
    static Node encode(const StoreConfig& rhs) {
        Node node;
        node["backend"] = to_string(rhs.backend);
        return node;
    }

    static bool decode(const Node& node, StoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = storeBackendFromString(node["backend"].as<std::string>("memory"));
        return true;
    }
};

template<>
struct convert<AccessConfig> {
    static Node encode(const AccessConfig& rhs) {
        Node node;
        node["audit_mutations"] = rhs.audit_mutations;
        return node;
    }

    static bool decode(const Node& node, AccessConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.audit_mutations = node["audit_mutations"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["grantry"] = to_std_string(spdlog::level::to_string_view(rhs.grantry));
        node["access"]  = to_std_string(spdlog::level::to_string_view(rhs.access));
        node["store"]   = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["db"]      = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["types"]   = to_std_string(spdlog::level::to_string_view(rhs.types));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.grantry = spdlog::level::from_str(node["grantry"].as<std::string>("info"));
        rhs.access = spdlog::level::from_str(node["access"].as<std::string>("warn"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.types = spdlog::level::from_str(node["types"].as<std::string>("error"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["max_file_size_mb"] = rhs.max_file_size_bytes / (1024 * 1024);
        node["max_files"] = rhs.max_files;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/grantry");
        rhs.max_file_size_bytes = node["max_file_size_mb"].as<size_t>(10) * 1024 * 1024;
        rhs.max_files = node["max_files"].as<size_t>(5);
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
