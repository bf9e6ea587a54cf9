#include "store/Txn.hpp"

namespace gr::store {

bool GrantFilter::matches(const types::Grant& g) const {
    if (subject && g.subject_id != *subject) return false;
    if (object && g.object_id != *object) return false;
    if (grantor && g.grantor_id != *grantor) return false;
    if (privilege && g.privilege != *privilege) return false;
    if (weakerThan && !types::weakerThan(g.privilege, *weakerThan)) return false;
    return true;
}

}
