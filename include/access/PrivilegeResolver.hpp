#pragma once

#include "types/Privilege.hpp"
#include "types/Grant.hpp"

namespace gr::store {
class Txn;
}

namespace gr::types {
struct User;
struct Group;
struct Resource;
}

namespace gr::access {

// Pure privilege computations over the grant records visible in a transaction.
// None of these mutate state.
class PrivilegeResolver {
public:
    // Strongest stored grant of subject over object in one relation, regardless of
    // grantor or any active flags. None when no record exists.
    static types::Privilege direct(store::Txn& txn, types::Relation relation,
                                   unsigned int subject, unsigned int object);

    // Superuser: Owner. Inactive user: None. Otherwise the strongest direct grant
    // of the user over the group.
    static types::Privilege userGroup(store::Txn& txn, const types::User& user, const types::Group& group);

    // Strongest grant of the group over the resource. None when the group is inactive.
    static types::Privilege group(store::Txn& txn, const types::Group& group, const types::Resource& resource);

    // Superuser: Owner. Inactive user: None. Otherwise the strongest of the user's
    // direct grants and the grants held by every active group the user belongs to.
    static types::Privilege combined(store::Txn& txn, const types::User& user, const types::Resource& resource);

    // combined() adjusted by resource flags:
    //   immutable -> max(View, p)   nobody gets better than View
    //   public    -> min(View, p)   everybody gets at least View
    // Applying both yields exactly View whatever the order, since max then min
    // and min then max both collapse every level to View.
    static types::Privilege effective(store::Txn& txn, const types::User& user, const types::Resource& resource);

    // Membership is holding any grant over the group.
    static bool isMember(store::Txn& txn, unsigned int user, unsigned int group);

    // User and object active, and a direct OWNER grant exists.
    static bool owns(store::Txn& txn, const types::User& user, const types::Group& group);
    static bool owns(store::Txn& txn, const types::User& user, const types::Resource& resource);
};

}
