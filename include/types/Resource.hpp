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

struct ResourceFlags {
    bool active{true};
    bool discoverable{false};
    bool is_public{false};    // anyone may view, effective privilege is at least VIEW
    bool shareable{true};     // non-owner holders may re-share
    bool published{false};
    bool immutable{false};    // nobody may change, effective privilege is at most VIEW

    bool operator==(const ResourceFlags&) const = default;
};

// An opaque content object. Always owned by at least one user, never by a group.
struct Resource {
    unsigned int id{};
    std::string title{};
    std::time_t created_at{};
    ResourceFlags flags{};

    Resource() = default;
    explicit Resource(std::string title);
    explicit Resource(const pqxx::row& row);
};

using ResourcePtr = std::shared_ptr<Resource>;

void to_json(nlohmann::json& j, const ResourceFlags& f);
void from_json(const nlohmann::json& j, ResourceFlags& f);

void to_json(nlohmann::json& j, const Resource& r);
void from_json(const nlohmann::json& j, Resource& r);

nlohmann::json to_json(const std::vector<ResourcePtr>& resources);

std::string to_string(const ResourcePtr& r);

} // namespace gr::types
