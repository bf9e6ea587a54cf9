#include "database/DBConnection.hpp"

using namespace gr::database;

void DBConnection::initPreparedUsers() const {
    conn_->prepare("insert_user",
                   "INSERT INTO users (name, is_active, is_superuser) VALUES ($1, $2, $3) RETURNING id");

    conn_->prepare("get_user", "SELECT * FROM users WHERE id = $1");

    conn_->prepare("update_user",
                   "UPDATE users SET name = $2, is_active = $3, is_superuser = $4 WHERE id = $1");
}

void DBConnection::initPreparedGroups() const {
    conn_->prepare("insert_group",
                   "INSERT INTO groups (name, is_active, is_discoverable, is_public, is_shareable) "
                   "VALUES ($1, $2, $3, $4, $5) RETURNING id");

    conn_->prepare("get_group", "SELECT * FROM groups WHERE id = $1");

    conn_->prepare("update_group_flags",
                   "UPDATE groups SET is_active = $2, is_discoverable = $3, is_public = $4, is_shareable = $5 "
                   "WHERE id = $1");

    conn_->prepare("delete_group", "DELETE FROM groups WHERE id = $1");

    conn_->prepare("lock_group", "SELECT id FROM groups WHERE id = $1 FOR UPDATE");
}

void DBConnection::initPreparedResources() const {
    conn_->prepare("insert_resource",
                   "INSERT INTO resources (title, is_active, is_discoverable, is_public, is_shareable, "
                   "is_published, is_immutable) VALUES ($1, $2, $3, $4, $5, $6, $7) RETURNING id");

    conn_->prepare("get_resource", "SELECT * FROM resources WHERE id = $1");

    conn_->prepare("update_resource_flags",
                   "UPDATE resources SET is_active = $2, is_discoverable = $3, is_public = $4, is_shareable = $5, "
                   "is_published = $6, is_immutable = $7 WHERE id = $1");

    conn_->prepare("delete_resource", "DELETE FROM resources WHERE id = $1");

    conn_->prepare("lock_resource", "SELECT id FROM resources WHERE id = $1 FOR UPDATE");
}
