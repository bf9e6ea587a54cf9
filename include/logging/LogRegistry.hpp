#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

namespace gr::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from the logging config.
    static void init(const std::filesystem::path& logDir);

    // Initialize using the log_dir from the logging config.
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> grantry()  { return get("grantry"); }
    static std::shared_ptr<spdlog::logger> access()   { return get("access"); }
    static std::shared_ptr<spdlog::logger> store()    { return get("store"); }
    static std::shared_ptr<spdlog::logger> db()       { return get("db"); }
    static std::shared_ptr<spdlog::logger> types()    { return get("types"); }
    static std::shared_ptr<spdlog::logger> audit()    { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

private:
    static inline bool initialized_ = false;
    static inline std::filesystem::path log_dir_, main_log_path_, audit_log_path_;
    static inline std::shared_ptr<spdlog::sinks::sink> console_sink_, main_file_sink_, audit_file_sink_;
    static inline size_t main_max_bytes_ = 10 * 1024 * 1024;
    static inline size_t main_max_files_ = 5;

    static constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
};

} // namespace gr::logging
