#pragma once

#include <stdexcept>
#include <string>

namespace gr::access {

enum class DenyReason {
    InactivePrincipal,      // requesting user is not active
    InactiveObject,         // group or resource is not active
    InsufficientPrivilege,  // caller holds too little privilege for the request
    NotShareable,           // caller is not an owner and the object is not shareable
    NotMember,              // caller is not a member of the group receiving a share
    GranteeInactive,        // target user of a share is not active
    CannotDowngrade,        // non-owner tried to weaken a grant made by someone else
    NotOwner,               // owner or superuser required
    SoleOwner,              // would leave the object without an OWNER grant
    NothingToUndo,          // no grant by the named grantor exists
};

std::string to_string(DenyReason r);

// Base of every exception raised by the access control subsystem.
class AccessError : public std::runtime_error {
public:
    explicit AccessError(const std::string& what) : std::runtime_error(what) {}
};

// The caller lacks privilege, a principal is inactive, or the request would
// breach the sole-owner invariant. Safe to catch.
class AuthorizationError : public AccessError {
public:
    AuthorizationError(DenyReason reason, const std::string& message);

    [[nodiscard]] DenyReason reason() const noexcept { return reason_; }

private:
    DenyReason reason_;
};

// Invalid parameters: unknown users, groups or resources, bad privilege levels.
// Indicates a programming error.
class UsageError : public AccessError {
public:
    explicit UsageError(const std::string& what) : AccessError("Usage error: " + what) {}
};

// The stored grant data already violates an invariant. Not recoverable.
class IntegrityError : public AccessError {
public:
    explicit IntegrityError(const std::string& what) : AccessError("Integrity error: " + what) {}
};

}
