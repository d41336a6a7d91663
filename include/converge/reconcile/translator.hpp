#pragma once

#include <converge/common/result.hpp>
#include <converge/schema/access_policy.hpp>
#include <converge/schema/access_policy_declaration.hpp>

namespace converge::reconcile {

/// Build the nested wire object sent on create.
///
/// Pure function of the declaration: the action is rendered in its canonical
/// uppercase form, and every nested object gets its discriminator tag from
/// `kObjectKindMappings`. Values are assumed validated by the attribute
/// boundary; the only local check is that cross-referenced identities are
/// well formed. Unset references are omitted from the wire object.
result_t<schema::access_policy> translate(
    const schema::access_policy_declaration_t& declaration);

}  // namespace converge::reconcile
