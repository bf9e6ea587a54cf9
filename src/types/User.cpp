#include "types/User.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace gr::types {

User::User(std::string name, const bool isActive, const bool isSuperuser)
    : name(std::move(name)), is_active(isActive), is_superuser(isSuperuser), created_at(util::now()) {}

void to_json(nlohmann::json& j, const User& u) {
    j = {
        {"id", u.id},
        {"name", u.name},
        {"is_active", u.is_active},
        {"is_superuser", u.is_superuser},
        {"created_at", util::timestampToString(u.created_at)}
    };
}

void from_json(const nlohmann::json& j, User& u) {
    u.id = j.value("id", 0u);
    u.name = j.at("name").get<std::string>();
    u.is_active = j.value("is_active", true);
    u.is_superuser = j.value("is_superuser", false);
    if (j.contains("created_at")) u.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
}

nlohmann::json to_json(const std::vector<UserPtr>& users) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& user : users) j.push_back(*user);
    return j;
}

std::string to_string(const UserPtr& user) {
    if (!user) return "<null user>";
    std::string out = "User #" + std::to_string(user->id) + " '" + user->name + "'";
    if (!user->is_active) out += " [inactive]";
    if (user->is_superuser) out += " [superuser]";
    return out;
}

}
