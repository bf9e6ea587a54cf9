#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gr::types {

// Lower value is the stronger privilege. None is a query result only and is never stored.
enum class Privilege : uint8_t {
    Owner   = 1, // owns the object, may change its flags and delete it
    Change  = 2, // may change content but not state
    View    = 3, // may view but not change
    None    = 4,
};

inline constexpr Privilege ALL_GRANTABLE[] = {Privilege::Owner, Privilege::Change, Privilege::View};

inline uint8_t privilegeToCode(const Privilege p) { return static_cast<uint8_t>(p); }
Privilege privilegeFromCode(int code);

// True for Owner, Change and View: the levels that may appear on a grant record.
[[nodiscard]] bool isGrantable(Privilege p);

// p is at least as strong as threshold (p <= threshold on the numeric scale).
[[nodiscard]] inline bool atLeast(const Privilege p, const Privilege threshold) {
    return privilegeToCode(p) <= privilegeToCode(threshold);
}

[[nodiscard]] inline bool strongerThan(const Privilege a, const Privilege b) {
    return privilegeToCode(a) < privilegeToCode(b);
}

[[nodiscard]] inline bool weakerThan(const Privilege a, const Privilege b) {
    return privilegeToCode(a) > privilegeToCode(b);
}

[[nodiscard]] inline Privilege strongest(const Privilege a, const Privilege b) { return strongerThan(b, a) ? b : a; }
[[nodiscard]] inline Privilege weakest(const Privilege a, const Privilege b) { return weakerThan(b, a) ? b : a; }

std::string to_string(Privilege p);
Privilege privilegeFromString(const std::string& s);

void to_json(nlohmann::json& j, const Privilege& p);
void from_json(const nlohmann::json& j, Privilege& p);

} // namespace gr::types
