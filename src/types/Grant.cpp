#include "types/Grant.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace gr::types {

std::string to_string(const Relation r) {
    switch (r) {
    case Relation::UserGroup: return "user_group";
    case Relation::UserResource: return "user_resource";
    case Relation::GroupResource: return "group_resource";
    default: return "unknown-relation";
    }
}

static Relation relationFromString(const std::string& s) {
    if (s == "user_group") return Relation::UserGroup;
    if (s == "user_resource") return Relation::UserResource;
    if (s == "group_resource") return Relation::GroupResource;
    throw std::invalid_argument("Unknown grant relation: " + s);
}

Grant::Grant(const Relation relation, const unsigned int subject, const unsigned int object,
             const unsigned int grantor, const Privilege privilege)
    : relation(relation), subject_id(subject), object_id(object), grantor_id(grantor),
      privilege(privilege), granted_at(util::now()) {}

void to_json(nlohmann::json& j, const Grant& g) {
    j = {
        {"relation", to_string(g.relation)},
        {"subject_id", g.subject_id},
        {"object_id", g.object_id},
        {"grantor_id", g.grantor_id},
        {"privilege", g.privilege},
        {"granted_at", util::timestampToString(g.granted_at)}
    };
}

void from_json(const nlohmann::json& j, Grant& g) {
    g.relation = relationFromString(j.at("relation").get<std::string>());
    g.subject_id = j.at("subject_id").get<unsigned int>();
    g.object_id = j.at("object_id").get<unsigned int>();
    g.grantor_id = j.at("grantor_id").get<unsigned int>();
    j.at("privilege").get_to(g.privilege);
    if (j.contains("granted_at")) g.granted_at = util::parseTimestampFromString(j.at("granted_at").get<std::string>());
}

nlohmann::json to_json(const std::vector<Grant>& grants) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& grant : grants) j.push_back(grant);
    return j;
}

std::string to_string(const Grant& g) {
    return to_string(g.relation) + " grant " + std::to_string(g.subject_id) + " -> " +
           std::to_string(g.object_id) + " (" + to_string(g.privilege) + ", by " +
           std::to_string(g.grantor_id) + ")";
}

}
