#pragma once

#include "access/Verdict.hpp"
#include "types/Grant.hpp"
#include "types/Group.hpp"
#include "types/Privilege.hpp"
#include "types/Resource.hpp"
#include "types/User.hpp"

namespace gr::store {
class Txn;
}

namespace gr::access {

// Names the grantor whose grant an owner or superuser wants to undo.
struct GrantorOverride {
    unsigned int grantor;
};

// Every authorization rule of the access model, each written exactly once.
// Authorizer::canX returns the verdict of one of these; ShareManager::X runs the
// same function inside its write transaction and enforces it before mutating.
//
// Rules never throw for a denial. They throw UsageError for bad arguments and
// IntegrityError for stored data that already breaks the owner invariant, and
// do so identically for predicates and actions.
class Rules {
public:
    // Entity lookup. Unknown ids are a UsageError.
    static types::User loadUser(store::Txn& txn, unsigned int id);
    static types::Group loadGroup(store::Txn& txn, unsigned int id);
    static types::Resource loadResource(store::Txn& txn, unsigned int id);

    // Throws UsageError unless level is Owner, Change or View.
    static void requireGrantable(types::Privilege level);

    static Verdict activePrincipal(const types::User& principal);

    // groups
    static Verdict viewGroup(store::Txn& txn, const types::User& p, const types::Group& g);
    static Verdict viewGroupMetadata(store::Txn& txn, const types::User& p, const types::Group& g);
    static Verdict changeGroup(store::Txn& txn, const types::User& p, const types::Group& g);
    static Verdict changeGroupFlags(store::Txn& txn, const types::User& p, const types::Group& g);
    static Verdict deleteGroup(store::Txn& txn, const types::User& p, const types::Group& g);

    // resources
    static Verdict viewResource(store::Txn& txn, const types::User& p, const types::Resource& r);
    static Verdict viewResourceMetadata(store::Txn& txn, const types::User& p, const types::Resource& r);
    static Verdict changeResource(store::Txn& txn, const types::User& p, const types::Resource& r);
    static Verdict changeResourceFlags(store::Txn& txn, const types::User& p, const types::Resource& r);
    static Verdict deleteResource(store::Txn& txn, const types::User& p, const types::Resource& r);

    // sharing, independent of the target
    static Verdict shareGroup(store::Txn& txn, const types::User& p, const types::Group& g, types::Privilege level);
    static Verdict shareResource(store::Txn& txn, const types::User& p, const types::Resource& r,
                                 types::Privilege level);

    // sharing with a concrete target, exactly what the share actions require
    static Verdict shareGroupWithUser(store::Txn& txn, const types::User& p, const types::Group& g,
                                      const types::User& target, types::Privilege level);
    static Verdict shareResourceWithUser(store::Txn& txn, const types::User& p, const types::Resource& r,
                                         const types::User& target, types::Privilege level);
    static Verdict shareResourceWithGroup(store::Txn& txn, const types::User& p, const types::Resource& r,
                                          const types::Group& target, types::Privilege level);

    // unshare: every grant of the subject over the object
    static Verdict unshareGroupWithUser(store::Txn& txn, const types::User& p, const types::Group& g,
                                        const types::User& target);
    static Verdict unshareResourceWithUser(store::Txn& txn, const types::User& p, const types::Resource& r,
                                           const types::User& target);
    static Verdict unshareResourceWithGroup(store::Txn& txn, const types::User& p, const types::Resource& r,
                                            const types::Group& target);

    // undo-share of the caller's own grant
    static Verdict undoShareGroupWithUser(store::Txn& txn, const types::User& p, const types::Group& g,
                                          const types::User& target);
    static Verdict undoShareResourceWithUser(store::Txn& txn, const types::User& p, const types::Resource& r,
                                             const types::User& target);
    static Verdict undoShareResourceWithGroup(store::Txn& txn, const types::User& p, const types::Resource& r,
                                              const types::Group& target);

    // undo-share of another grantor's grant, owner or superuser only
    static Verdict undoShareGroupWithUser(store::Txn& txn, const types::User& p, const types::Group& g,
                                          const types::User& target, GrantorOverride by);
    static Verdict undoShareResourceWithUser(store::Txn& txn, const types::User& p, const types::Resource& r,
                                             const types::User& target, GrantorOverride by);
    static Verdict undoShareResourceWithGroup(store::Txn& txn, const types::User& p, const types::Resource& r,
                                              const types::Group& target, GrantorOverride by);

    // True if an OWNER record other than (subject, object, grantor) exists.
    static bool otherOwnerRecordExists(store::Txn& txn, types::Relation relation, unsigned int object,
                                       unsigned int subject, unsigned int grantor);

    // True if an OWNER record held by someone other than subject exists.
    // Throws IntegrityError if the object has no OWNER record at all.
    static bool ownerOtherThanExists(store::Txn& txn, types::Relation relation, unsigned int object,
                                     unsigned int subject);

private:
    static Verdict undoOwn(store::Txn& txn, const types::User& p, types::Relation relation,
                           unsigned int subject, unsigned int object);
    static Verdict undoAs(store::Txn& txn, const types::User& p, bool callerOwnsObject, types::Relation relation,
                          unsigned int subject, unsigned int object, unsigned int grantor);
    static Verdict soleOwnerDemotion(store::Txn& txn, types::Relation relation, const types::User& p,
                                     unsigned int subject, unsigned int object, types::Privilege level);
};

}
