#include "types/Group.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace gr::types {

Group::Group(std::string name) : name(std::move(name)), created_at(util::now()) {}

void to_json(nlohmann::json& j, const GroupFlags& f) {
    j = {
        {"active", f.active},
        {"discoverable", f.discoverable},
        {"public", f.is_public},
        {"shareable", f.shareable}
    };
}

void from_json(const nlohmann::json& j, GroupFlags& f) {
    f.active = j.value("active", true);
    f.discoverable = j.value("discoverable", true);
    f.is_public = j.value("public", true);
    f.shareable = j.value("shareable", true);
}

void to_json(nlohmann::json& j, const Group& g) {
    j = {
        {"id", g.id},
        {"name", g.name},
        {"created_at", util::timestampToString(g.created_at)},
        {"flags", g.flags}
    };
}

void from_json(const nlohmann::json& j, Group& g) {
    g.id = j.value("id", 0u);
    g.name = j.at("name").get<std::string>();
    if (j.contains("created_at")) g.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
    if (j.contains("flags")) j.at("flags").get_to(g.flags);
}

nlohmann::json to_json(const std::vector<GroupPtr>& groups) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& group : groups) j.push_back(*group);
    return j;
}

std::string to_string(const GroupPtr& g) {
    if (!g) return "<null group>";
    std::string out = "Group #" + std::to_string(g->id) + " '" + g->name + "'";
    if (!g->flags.active) out += " [inactive]";
    if (!g->flags.shareable) out += " [unshareable]";
    return out;
}

}
