#pragma once

#include "types/Privilege.hpp"

#include <ctime>
#include <string>
#include <tuple>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace gr::types {

// The three independently keyed grant relations, named subject-object.
enum class Relation : uint8_t {
    UserGroup,      // user membership in and privilege over a group
    UserResource,   // user privilege over a resource
    GroupResource,  // group privilege over a resource, resolved into member privilege
};

std::string to_string(Relation r);

// One delegation of access. Unique per (relation, subject, object, grantor).
struct Grant {
    Relation relation{Relation::UserResource};
    unsigned int subject_id{};
    unsigned int object_id{};
    unsigned int grantor_id{};
    Privilege privilege{Privilege::View};
    std::time_t granted_at{};

    Grant() = default;
    Grant(Relation relation, unsigned int subject, unsigned int object, unsigned int grantor, Privilege privilege);
    Grant(Relation relation, const pqxx::row& row);

    [[nodiscard]] auto key() const { return std::make_tuple(relation, subject_id, object_id, grantor_id); }
};

void to_json(nlohmann::json& j, const Grant& g);
void from_json(const nlohmann::json& j, Grant& g);

nlohmann::json to_json(const std::vector<Grant>& grants);

std::string to_string(const Grant& g);

} // namespace gr::types
