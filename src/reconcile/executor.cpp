#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <converge/reconcile/executor.hpp>

#include <string>
#include <string_view>

namespace converge::reconcile {

namespace {

constexpr auto kUnknownOutcome = std::string_view{
    "the remote outcome is unknown; re-read the resource to confirm"};

/// Local check run before every remote call.
std::optional<std::string> check_context(const common::context& context) {
  if (context.stop_requested()) {
    return std::string{"reconciliation cancelled before the remote call"};
  }
  if (context.deadline_exceeded()) {
    return std::string{"deadline exceeded before the remote call"};
  }
  return std::nullopt;
}

/// Remote error detail. For mutating calls interrupted mid-flight the server
/// may still have applied the change.
std::string describe(const remote::remote_error& error, const bool mutating) {
  if (mutating && (error.code == remote::remote_error_code_t::cancelled ||
                   error.code == remote::remote_error_code_t::deadline_exceeded)) {
    return fmt::format("{}; {}", error.message, kUnknownOutcome);
  }
  return error.message;
}

}  // namespace

executor::executor(remote::client& client) : client_{client} {}

result_t<schema::identity_t> executor::create(
    const common::context& context,
    const schema::access_policy& policy) {
  if (auto reason = check_context(context)) {
    return fail(kCreateSummary, std::move(*reason));
  }

  spdlog::debug("Creating access policy '{}'", policy.name);
  auto created = client_.create_access_policy(context, policy);
  if (!created) {
    const auto& error = created.error();
    return fail(kCreateSummary, describe(error, true));
  }

  auto identity = created.value().id.value_or("");
  if (identity.empty()) {
    return fail(kCreateSummary,
                "remote accepted the create but returned no identity; " +
                    std::string{kUnknownOutcome});
  }
  spdlog::info("Created access policy '{}' with identity {}", policy.name,
               identity);
  return identity;
}

result_t<read_outcome> executor::read(
    const common::context& context,
    const schema::identity_t& identity) {
  if (identity.empty()) {
    return fail(kReadSummary,
                "resource has no identity; it was never created or has been "
                "deleted");
  }
  if (auto reason = check_context(context)) {
    return fail(kReadSummary, std::move(*reason));
  }

  spdlog::debug("Reading access policy {}", identity);
  auto fetched = client_.get_access_policy(context, identity);
  if (!fetched) {
    const auto& error = fetched.error();
    if (error.code == remote::remote_error_code_t::not_found) {
      return read_outcome{.policy = std::nullopt,
                          .not_found_detail = error.message};
    }
    return fail(kReadSummary, describe(error, false));
  }
  return read_outcome{.policy = std::move(fetched).value(),
                      .not_found_detail = {}};
}

result_t<void> executor::remove(const common::context& context,
                                const schema::identity_t& identity) {
  if (identity.empty()) {
    return fail(kDeleteSummary,
                "resource has no identity; it was never created or has been "
                "deleted");
  }
  if (auto reason = check_context(context)) {
    return fail(kDeleteSummary, std::move(*reason));
  }

  spdlog::debug("Deleting access policy {}", identity);
  auto deleted = client_.delete_access_policy(context, identity);
  if (!deleted) {
    const auto& error = deleted.error();
    return fail(kDeleteSummary, describe(error, true));
  }
  spdlog::info("Deleted access policy {}", identity);
  return outcome::success();
}

}  // namespace converge::reconcile
