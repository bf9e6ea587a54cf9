#pragma once

#include "access/AccessError.hpp"

#include <string>
#include <utility>

namespace gr::access {

// Outcome of one authorization rule. Predicates return `allowed`; actions
// throw AuthorizationError(reason, message) when it is false.
struct Verdict {
    bool allowed{true};
    DenyReason reason{DenyReason::InsufficientPrivilege};
    std::string message{};

    static Verdict allow() { return {}; }
    static Verdict deny(const DenyReason reason, std::string message) { return {false, reason, std::move(message)}; }

    explicit operator bool() const { return allowed; }

    // Throws AuthorizationError when denied.
    void enforce() const {
        if (!allowed) throw AuthorizationError(reason, message);
    }
};

}
