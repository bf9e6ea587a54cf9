#include "types/Resource.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace gr::types {

Resource::Resource(std::string title) : title(std::move(title)), created_at(util::now()) {}

void to_json(nlohmann::json& j, const ResourceFlags& f) {
    j = {
        {"active", f.active},
        {"discoverable", f.discoverable},
        {"public", f.is_public},
        {"shareable", f.shareable},
        {"published", f.published},
        {"immutable", f.immutable}
    };
}

void from_json(const nlohmann::json& j, ResourceFlags& f) {
    f.active = j.value("active", true);
    f.discoverable = j.value("discoverable", false);
    f.is_public = j.value("public", false);
    f.shareable = j.value("shareable", true);
    f.published = j.value("published", false);
    f.immutable = j.value("immutable", false);
}

void to_json(nlohmann::json& j, const Resource& r) {
    j = {
        {"id", r.id},
        {"title", r.title},
        {"created_at", util::timestampToString(r.created_at)},
        {"flags", r.flags}
    };
}

void from_json(const nlohmann::json& j, Resource& r) {
    r.id = j.value("id", 0u);
    r.title = j.at("title").get<std::string>();
    if (j.contains("created_at")) r.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
    if (j.contains("flags")) j.at("flags").get_to(r.flags);
}

nlohmann::json to_json(const std::vector<ResourcePtr>& resources) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& resource : resources) j.push_back(*resource);
    return j;
}

std::string to_string(const ResourcePtr& r) {
    if (!r) return "<null resource>";
    std::string out = "Resource #" + std::to_string(r->id) + " '" + r->title + "'";
    if (!r->flags.active) out += " [inactive]";
    if (r->flags.is_public) out += " [public]";
    if (r->flags.immutable) out += " [immutable]";
    return out;
}

}
