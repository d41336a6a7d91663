#pragma once

#include <converge/common/result.hpp>
#include <converge/reconcile/state_accessor.hpp>
#include <converge/schema/access_policy.hpp>

#include <cstddef>

namespace converge::reconcile {

struct sync_report final {
  /// Drift warnings; never fatal.
  schema::diagnostics_t warnings;
  std::size_t fields_written{};
};

/// Write the remote object's fields into local state, one field at a time:
/// name, description, type, default_action_type, default_action_id.
///
/// Name and description are immutable declared fields; when the remote value
/// differs from the declared one a drift warning is recorded before the
/// remote value is written.
///
/// The first failed write stops the pass with one error diagnostic (preceded
/// by any warnings gathered so far). Fields written before the failure are
/// kept, so local state may be partially synchronized; the next successful
/// read converges it.
result_t<sync_report> synchronize(const schema::access_policy& remote,
                                  state_accessor& state);

}  // namespace converge::reconcile
