#include "types/Grant.hpp"
#include "types/Group.hpp"
#include "types/Resource.hpp"
#include "types/User.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>

// Row constructors live with the database layer so the core library never links libpqxx.
namespace gr::types {

User::User(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      name(row["name"].as<std::string>()),
      is_active(row["is_active"].as<bool>()),
      is_superuser(row["is_superuser"].as<bool>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {}

Group::Group(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      name(row["name"].as<std::string>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {
    flags.active = row["is_active"].as<bool>();
    flags.discoverable = row["is_discoverable"].as<bool>();
    flags.is_public = row["is_public"].as<bool>();
    flags.shareable = row["is_shareable"].as<bool>();
}

Resource::Resource(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      title(row["title"].as<std::string>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {
    flags.active = row["is_active"].as<bool>();
    flags.discoverable = row["is_discoverable"].as<bool>();
    flags.is_public = row["is_public"].as<bool>();
    flags.shareable = row["is_shareable"].as<bool>();
    flags.published = row["is_published"].as<bool>();
    flags.immutable = row["is_immutable"].as<bool>();
}

Grant::Grant(const Relation relation, const pqxx::row& row)
    : relation(relation),
      subject_id(row["subject_id"].as<unsigned int>()),
      object_id(row["object_id"].as<unsigned int>()),
      grantor_id(row["grantor_id"].as<unsigned int>()),
      privilege(privilegeFromCode(row["privilege"].as<int>())),
      granted_at(util::parsePostgresTimestamp(row["granted_at"].as<std::string>())) {}

}
