#include <spdlog/spdlog.h>
#include <converge/reconcile/lifecycle.hpp>
#include <converge/reconcile/state_accessor.hpp>

#include <iterator>
#include <utility>

namespace converge::reconcile {

namespace {

void append(schema::diagnostics_t& out, schema::diagnostics_t more) {
  out.insert(std::end(out), std::make_move_iterator(std::begin(more)),
             std::make_move_iterator(std::end(more)));
}

}  // namespace

schema::diagnostics_t apply_declaration(
    reconciler& engine,
    const common::context& context,
    schema::resource_state_t& state,
    const schema::access_policy_declaration_t& declaration) {
  auto accessor = resource_state_accessor{state};
  auto diagnostics = schema::diagnostics_t{};

  if (!state.identity.empty()) {
    append(diagnostics, engine.reconcile_read(context, accessor));
    if (schema::has_error(diagnostics)) {
      return diagnostics;
    }
  }

  if (!state.identity.empty()) {
    if (state.declaration == declaration) {
      spdlog::info("Access policy '{}' is up to date", declaration.name);
      return diagnostics;
    }
    spdlog::info("Declaration of access policy {} changed; replacing",
                 state.identity);
    append(diagnostics, engine.reconcile_delete(context, accessor));
    if (schema::has_error(diagnostics)) {
      return diagnostics;
    }
  }

  state = schema::resource_state_t{};
  state.declaration = declaration;
  append(diagnostics, engine.reconcile_create(context, accessor));
  return diagnostics;
}

}  // namespace converge::reconcile
