#pragma once

#include "types/Grant.hpp"

#include <stdexcept>
#include <string>

namespace gr::database {

// All three grant tables share the column layout
// (subject_id, object_id, grantor_id, privilege, granted_at).
inline std::string grantTable(const types::Relation r) {
    switch (r) {
    case types::Relation::UserGroup: return "user_group_grants";
    case types::Relation::UserResource: return "user_resource_grants";
    case types::Relation::GroupResource: return "group_resource_grants";
    }
    throw std::invalid_argument("Unknown grant relation");
}

// Prepared statement name for an operation on the relation's table, e.g. "ug_upsert".
inline std::string grantStmt(const types::Relation r, const std::string& op) {
    switch (r) {
    case types::Relation::UserGroup: return "ug_" + op;
    case types::Relation::UserResource: return "ur_" + op;
    case types::Relation::GroupResource: return "gr_" + op;
    }
    throw std::invalid_argument("Unknown grant relation");
}

}
