#include "access/AccessError.hpp"

namespace gr::access {

std::string to_string(const DenyReason r) {
    switch (r) {
    case DenyReason::InactivePrincipal: return "inactive_principal";
    case DenyReason::InactiveObject: return "inactive_object";
    case DenyReason::InsufficientPrivilege: return "insufficient_privilege";
    case DenyReason::NotShareable: return "not_shareable";
    case DenyReason::NotMember: return "not_member";
    case DenyReason::GranteeInactive: return "grantee_inactive";
    case DenyReason::CannotDowngrade: return "cannot_downgrade";
    case DenyReason::NotOwner: return "not_owner";
    case DenyReason::SoleOwner: return "sole_owner";
    case DenyReason::NothingToUndo: return "nothing_to_undo";
    default: return "unknown";
    }
}

AuthorizationError::AuthorizationError(const DenyReason reason, const std::string& message)
    : AccessError("Access denied (" + to_string(reason) + "): " + message), reason_(reason) {}

}
