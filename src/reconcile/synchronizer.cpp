#include <spdlog/fmt/fmt.h>
#include <converge/reconcile/executor.hpp>
#include <converge/reconcile/synchronizer.hpp>

#include <array>
#include <optional>
#include <string>

namespace converge::reconcile {

namespace {

struct field_mapping final {
  state_field_t field;
  std::string (*observed)(const schema::access_policy&);
  std::optional<std::string> (*declared)(
      const schema::access_policy_declaration_t&);
};

constexpr auto kFieldMappings = std::array{
    field_mapping{
        .field = state_field_t::name,
        .observed = [](const schema::access_policy& p) { return p.name; },
        .declared = [](const schema::access_policy_declaration_t& d)
            -> std::optional<std::string> { return d.name; }},
    field_mapping{
        .field = state_field_t::description,
        .observed =
            [](const schema::access_policy& p) { return p.description; },
        .declared = [](const schema::access_policy_declaration_t& d)
            -> std::optional<std::string> {
          return d.description;
        }},
    field_mapping{
        .field = state_field_t::type,
        .observed = [](const schema::access_policy& p) { return p.type; },
        .declared = nullptr},
    field_mapping{.field = state_field_t::default_action_type,
                  .observed =
                      [](const schema::access_policy& p) {
                        return p.default_action.type;
                      },
                  .declared = nullptr},
    field_mapping{.field = state_field_t::default_action_id,
                  .observed =
                      [](const schema::access_policy& p) {
                        return p.default_action.id.value_or("");
                      },
                  .declared = nullptr},
};

}  // namespace

result_t<sync_report> synchronize(const schema::access_policy& remote,
                                  state_accessor& state) {
  auto report = sync_report{};
  for (const auto& mapping : kFieldMappings) {
    auto observed = mapping.observed(remote);

    if (mapping.declared != nullptr) {
      auto declared = mapping.declared(state.declaration());
      if (declared.has_value() && *declared != observed) {
        report.warnings.push_back(schema::make_warning(
            "access policy drift detected",
            fmt::format("\"{}\" changed remotely from \"{}\" to \"{}\"; the "
                        "field is immutable so the resource must be replaced",
                        to_string(mapping.field), *declared, observed)));
      }
    }

    auto error = std::string{};
    if (!state.write(mapping.field, observed, error)) {
      auto diagnostics = std::move(report.warnings);
      diagnostics.push_back(schema::make_error(
          kReadSummary,
          fmt::format("failed to set \"{}\": {}", to_string(mapping.field),
                      error)));
      return outcome::failure(std::move(diagnostics));
    }
    ++report.fields_written;
  }
  return report;
}

}  // namespace converge::reconcile
