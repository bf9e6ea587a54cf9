#include "database/DBConnection.hpp"
#include "database/grantTables.hpp"

using namespace gr::database;
using namespace gr::types;

// $1 subject, $2 object, $3 grantor, $4 exact privilege, $5 strictly weaker than.
// NULL matches anything.
static const std::string GRANT_FILTER =
    "($1::integer IS NULL OR subject_id = $1) "
    "AND ($2::integer IS NULL OR object_id = $2) "
    "AND ($3::integer IS NULL OR grantor_id = $3) "
    "AND ($4::smallint IS NULL OR privilege = $4) "
    "AND ($5::smallint IS NULL OR privilege > $5)";

void DBConnection::initPreparedGrants() const {
    for (const auto relation : {Relation::UserGroup, Relation::UserResource, Relation::GroupResource}) {
        const auto table = grantTable(relation);

        conn_->prepare(grantStmt(relation, "list"),
                       "SELECT * FROM " + table + " WHERE " + GRANT_FILTER +
                       " ORDER BY subject_id, object_id, grantor_id");

        conn_->prepare(grantStmt(relation, "get"),
                       "SELECT * FROM " + table + " WHERE subject_id = $1 AND object_id = $2 AND grantor_id = $3");

        conn_->prepare(grantStmt(relation, "upsert"),
                       "INSERT INTO " + table + " (subject_id, object_id, grantor_id, privilege) "
                       "VALUES ($1, $2, $3, $4) "
                       "ON CONFLICT (subject_id, object_id, grantor_id) "
                       "DO UPDATE SET privilege = EXCLUDED.privilege, granted_at = NOW() "
                       "RETURNING (xmax = 0) AS inserted");

        conn_->prepare(grantStmt(relation, "delete"), "DELETE FROM " + table + " WHERE " + GRANT_FILTER);
    }
}
