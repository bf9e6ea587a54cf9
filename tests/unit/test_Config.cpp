#include <gtest/gtest.h>

#include "config/Config.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace gr::config;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path path = fs::temp_directory_path() /
                    ("grantry-config-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                     ".yaml");

    void write(const std::string& yaml) const {
        std::ofstream out(path);
        out << yaml;
    }

    void TearDown() override { fs::remove(path); }
};

TEST_F(ConfigTest, LoadsEverySection) {
    write(R"(
database:
  host: db.internal
  port: 6432
  name: acl
  user: acl_rw
  password_env: ACL_PASSWORD
  pool_size: 8
store:
  backend: postgres
access:
  audit_mutations: false
logging:
  log_dir: /tmp/grantry-logs
  max_file_size_mb: 2
  max_files: 3
  log_levels:
    console_log_level: debug
    subsystem_levels:
      access: trace
)");

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.port, 6432);
    EXPECT_EQ(cfg.database.name, "acl");
    EXPECT_EQ(cfg.database.user, "acl_rw");
    EXPECT_EQ(cfg.database.password_env, "ACL_PASSWORD");
    EXPECT_EQ(cfg.database.pool_size, 8u);
    EXPECT_EQ(cfg.store.backend, StoreBackend::Postgres);
    EXPECT_FALSE(cfg.access.audit_mutations);
    EXPECT_EQ(cfg.logging.log_dir, fs::path("/tmp/grantry-logs"));
    EXPECT_EQ(cfg.logging.max_file_size_bytes, 2u * 1024 * 1024);
    EXPECT_EQ(cfg.logging.max_files, 3u);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.access, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::err);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    write("access:\n  audit_mutations: true\n");

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.store.backend, StoreBackend::Memory);
    EXPECT_EQ(cfg.database.port, 5432);
    EXPECT_EQ(cfg.database.password_env, "GRANTRY_DB_PASSWORD");
    EXPECT_TRUE(cfg.access.audit_mutations);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW((void)loadConfig(fs::temp_directory_path() / "grantry-no-such-config.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, UnknownBackendThrows) {
    write("store:\n  backend: cassandra\n");
    EXPECT_THROW((void)loadConfig(path), std::runtime_error);
}

TEST(StoreBackendTest, NamesRoundTrip) {
    EXPECT_EQ(storeBackendFromString("memory"), StoreBackend::Memory);
    EXPECT_EQ(storeBackendFromString("postgresql"), StoreBackend::Postgres);
    EXPECT_EQ(to_string(StoreBackend::Postgres), "postgres");
}

TEST(ConfigJsonTest, SerializesForDiagnostics) {
    Config cfg;
    cfg.database.host = "db";
    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("database").at("host"), "db");
    EXPECT_EQ(j.at("store").at("backend"), "memory");

    Config back = j.get<Config>();
    EXPECT_EQ(back.database.host, "db");
}

TEST(ConfigJsonTest, LogFileSizeUsesTheYamlKey) {
    Config cfg;
    cfg.logging.max_file_size_bytes = 3 * 1024 * 1024;

    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("logging").at("max_file_size_mb"), 3);
    EXPECT_FALSE(j.at("logging").contains("max_file_size_bytes"));

    EXPECT_EQ(j.get<Config>().logging.max_file_size_bytes, 3u * 1024 * 1024);
}
