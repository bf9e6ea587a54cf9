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

struct GroupFlags {
    bool active{true};        // inactive groups confer no privilege over resources
    bool discoverable{true};  // description can be discovered by everyone
    bool is_public{true};     // member list can be viewed by everyone
    bool shareable{true};     // non-owner members may share the group

    bool operator==(const GroupFlags&) const = default;
};

// A group has no stored member list. Membership is holding any grant over it.
struct Group {
    unsigned int id{};
    std::string name{};
    std::time_t created_at{};
    GroupFlags flags{};

    Group() = default;
    explicit Group(std::string name);
    explicit Group(const pqxx::row& row);
};

using GroupPtr = std::shared_ptr<Group>;

void to_json(nlohmann::json& j, const GroupFlags& f);
void from_json(const nlohmann::json& j, GroupFlags& f);

void to_json(nlohmann::json& j, const Group& g);
void from_json(const nlohmann::json& j, Group& g);

nlohmann::json to_json(const std::vector<GroupPtr>& groups);

std::string to_string(const GroupPtr& g);

} // namespace gr::types
