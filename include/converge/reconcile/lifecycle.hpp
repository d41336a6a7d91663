#pragma once

#include <converge/common/context.hpp>
#include <converge/reconcile/reconciler.hpp>
#include <converge/schema/access_policy_declaration.hpp>
#include <converge/schema/diagnostic.hpp>
#include <converge/schema/resource_state.hpp>

#include <string_view>

namespace converge::reconcile {

/// Converge stored state onto a declaration.
///
/// Untracked state is created. Tracked state is read first; if the read
/// forgets the resource it is created again, and if the refreshed declaration
/// differs from `declaration` the resource is replaced (delete, then create)
/// since every declared attribute is force-new. Stops at the first error.
schema::diagnostics_t apply_declaration(
    reconciler& engine,
    const common::context& context,
    schema::resource_state_t& state,
    const schema::access_policy_declaration_t& declaration);

/// Save state that still tracks a remote object, erase it otherwise.
template <typename Storage>
void persist(const Storage& storage,
             const std::string_view address,
             const schema::resource_state_t& state) {
  if (state.identity.empty()) {
    storage.erase_resource_state(address);
  } else {
    storage.save_resource_state(address, state);
  }
}

}  // namespace converge::reconcile
