#pragma once

#include <ctime>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace gr::types {

// A principal as supplied by the identity provider. Grantry only consults
// the active and superuser flags; everything else is carried for display.
struct User {
    unsigned int id{};
    std::string name{};
    bool is_active{true};
    bool is_superuser{false};
    std::time_t created_at{};

    User() = default;
    explicit User(std::string name, bool isActive = true, bool isSuperuser = false);
    explicit User(const pqxx::row& row);

    bool operator==(const User& other) const { return id == other.id; }
};

using UserPtr = std::shared_ptr<User>;

void to_json(nlohmann::json& j, const User& u);
void from_json(const nlohmann::json& j, User& u);

nlohmann::json to_json(const std::vector<UserPtr>& users);

std::string to_string(const UserPtr& user);

} // namespace gr::types
