#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace gr::config {
struct DatabaseConfig;
}

namespace gr::database {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedUsers() const;
    void initPreparedGroups() const;
    void initPreparedResources() const;
    void initPreparedGrants() const;
};

// Key/value connection string. Values are single-quoted with ' and \ escaped.
std::string buildConnectionString(const config::DatabaseConfig& cfg, const std::string& password);

} // namespace gr::database
