#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <converge/reconcile/reconciler.hpp>
#include <converge/reconcile/synchronizer.hpp>
#include <converge/reconcile/translator.hpp>

#include <iterator>
#include <utility>

namespace converge::reconcile {

namespace {

schema::diagnostics_t finish(schema::diagnostics_t diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == schema::severity_t::error) {
      spdlog::error("{}: {}", d.summary, d.detail);
    } else {
      spdlog::warn("{}: {}", d.summary, d.detail);
    }
  }
  return diagnostics;
}

}  // namespace

reconciler::reconciler(remote::client& client, reconcile_options options)
    : executor_{client}, options_{options} {}

schema::diagnostics_t reconciler::reconcile_create(
    const common::context& context,
    state_accessor& state) {
  const auto& declaration = state.declaration();
  spdlog::info("Reconcile create for access policy '{}'", declaration.name);

  if (!state.identity().empty()) {
    return finish({schema::make_error(
        kCreateSummary,
        fmt::format("resource already has identity {}; delete it before "
                    "creating again",
                    state.identity()))});
  }

  auto translated = translate(declaration);
  if (!translated) {
    return finish(std::move(translated).error());
  }

  auto created = executor_.create(context, translated.value());
  if (!created) {
    return finish(std::move(created).error());
  }
  state.set_identity(std::move(created).value());

  // The identity is stored before the confirming read: if the read fails the
  // remote object still exists and must stay tracked.
  return reconcile_read(context, state);
}

schema::diagnostics_t reconciler::reconcile_read(
    const common::context& context,
    state_accessor& state) {
  spdlog::debug("Reconcile read for access policy {}", state.identity());

  auto fetched = executor_.read(context, state.identity());
  if (!fetched) {
    return finish(std::move(fetched).error());
  }

  auto& observed = fetched.value();
  if (!observed.policy.has_value()) {
    auto identity = state.identity();
    if (options_.not_found_policy == not_found_policy_t::forget) {
      state.set_identity({});
      return finish({schema::make_warning(
          "access policy no longer exists",
          fmt::format("{}; access policy {} has been removed from state",
                      observed.not_found_detail, identity))});
    }
    return finish(
        {schema::make_error(kReadSummary, observed.not_found_detail)});
  }

  auto synchronized = synchronize(*observed.policy, state);
  if (!synchronized) {
    return finish(std::move(synchronized).error());
  }
  spdlog::debug("Synchronized {} field(s) of access policy {}",
                synchronized.value().fields_written, state.identity());
  return finish(std::move(synchronized).value().warnings);
}

schema::diagnostics_t reconciler::reconcile_delete(
    const common::context& context,
    state_accessor& state) {
  spdlog::info("Reconcile delete for access policy {}", state.identity());

  auto removed = executor_.remove(context, state.identity());
  if (!removed) {
    return finish(std::move(removed).error());
  }
  state.set_identity({});
  return {};
}

}  // namespace converge::reconcile
