#include "types/Privilege.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace gr::types {

Privilege privilegeFromCode(const int code) {
    if (code < privilegeToCode(Privilege::Owner) || code > privilegeToCode(Privilege::None))
        throw std::invalid_argument("Invalid privilege code: " + std::to_string(code));
    return static_cast<Privilege>(code);
}

bool isGrantable(const Privilege p) {
    return p == Privilege::Owner || p == Privilege::Change || p == Privilege::View;
}

std::string to_string(const Privilege p) {
    switch (p) {
    case Privilege::Owner: return "owner";
    case Privilege::Change: return "change";
    case Privilege::View: return "view";
    case Privilege::None: return "none";
    default: return "unknown-privilege";
    }
}

Privilege privilegeFromString(const std::string& s) {
    std::string lower = s;
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (lower == "owner") return Privilege::Owner;
    if (lower == "change") return Privilege::Change;
    if (lower == "view") return Privilege::View;
    if (lower == "none") return Privilege::None;
    throw std::invalid_argument("Invalid privilege name: " + s);
}

void to_json(nlohmann::json& j, const Privilege& p) { j = to_string(p); }

void from_json(const nlohmann::json& j, Privilege& p) {
    if (j.is_number_integer()) p = privilegeFromCode(j.get<int>());
    else p = privilegeFromString(j.get<std::string>());
}

}
