#include <gtest/gtest.h>
#include <converge/reconcile/state_accessor.hpp>
#include <converge/reconcile/synchronizer.hpp>
#include <converge/testing/common.hpp>

#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace {

converge::schema::access_policy make_remote(const std::string& name) {
  return converge::schema::access_policy{
      .id = "abc123",
      .name = name,
      .description = "managed by converge",
      .type = "AccessPolicy",
      .default_action = converge::schema::access_policy_default_action{
          .id = "abc123-action",
          .type = "AccessPolicyDefaultAction",
          .action = "PERMIT"}};
}

/// Accessor that refuses one field and records every write.
class refusing_accessor final : public converge::reconcile::state_accessor {
 public:
  explicit refusing_accessor(converge::reconcile::state_field_t refused)
      : refused_{refused}, state_{converge::testing::make_state()} {}

  const converge::schema::access_policy_declaration_t& declaration()
      const override {
    return state_.declaration;
  }
  const converge::schema::identity_t& identity() const override {
    return state_.identity;
  }
  void set_identity(converge::schema::identity_t identity) override {
    state_.identity = std::move(identity);
  }
  bool write(const converge::reconcile::state_field_t field,
             const std::string_view value,
             std::string& error) override {
    if (field == refused_) {
      error = "storage refused";
      return false;
    }
    written[field] = std::string{value};
    return true;
  }

  std::map<converge::reconcile::state_field_t, std::string> written;

 private:
  converge::reconcile::state_field_t refused_;
  converge::schema::resource_state_t state_;
};

}  // namespace

TEST(synchronizer, writes_every_observed_field) {
  auto state = converge::testing::make_state();
  state.identity = "abc123";
  auto accessor = converge::reconcile::resource_state_accessor{state};

  auto synchronized =
      converge::reconcile::synchronize(make_remote("Terraform Access Policy"),
                                       accessor);
  ASSERT_TRUE(synchronized.has_value());
  EXPECT_EQ(synchronized.value().fields_written, 5u);
  EXPECT_TRUE(synchronized.value().warnings.empty());
  EXPECT_EQ(state.type, "AccessPolicy");
  EXPECT_EQ(state.default_action_type, "AccessPolicyDefaultAction");
  EXPECT_EQ(state.default_action_id, "abc123-action");
  EXPECT_EQ(state.declaration.name, "Terraform Access Policy");
}

TEST(synchronizer, records_drift_on_immutable_fields) {
  auto state = converge::testing::make_state();
  state.identity = "abc123";
  auto accessor = converge::reconcile::resource_state_accessor{state};

  auto synchronized =
      converge::reconcile::synchronize(make_remote("Renamed In Console"),
                                       accessor);
  ASSERT_TRUE(synchronized.has_value());
  const auto& warnings = synchronized.value().warnings;
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].severity, converge::schema::severity_t::warning);
  EXPECT_EQ(warnings[0].summary, "access policy drift detected");
  EXPECT_NE(warnings[0].detail.find("Renamed In Console"), std::string::npos);
  EXPECT_EQ(state.declaration.name, "Renamed In Console");
}

TEST(synchronizer, undeclared_description_is_not_drift) {
  auto state = converge::testing::make_state();
  state.declaration.description.reset();
  auto accessor = converge::reconcile::resource_state_accessor{state};

  auto synchronized = converge::reconcile::synchronize(
      make_remote("Terraform Access Policy"), accessor);
  ASSERT_TRUE(synchronized.has_value());
  EXPECT_TRUE(synchronized.value().warnings.empty());
  EXPECT_EQ(state.declaration.description, "managed by converge");
}

TEST(synchronizer, stops_at_first_failed_write_without_rollback) {
  auto accessor =
      refusing_accessor{converge::reconcile::state_field_t::default_action_type};

  auto synchronized = converge::reconcile::synchronize(
      make_remote("Terraform Access Policy"), accessor);
  ASSERT_FALSE(synchronized.has_value());
  const auto& diagnostics = synchronized.error();
  ASSERT_EQ(diagnostics.size(), 1u);
  EXPECT_EQ(diagnostics[0].severity, converge::schema::severity_t::error);
  EXPECT_EQ(diagnostics[0].summary, "unable to read access policy");
  EXPECT_EQ(diagnostics[0].detail,
            "failed to set \"default_action_type\": storage refused");

  EXPECT_EQ(accessor.written.size(), 3u);
  EXPECT_EQ(accessor.written.count(
                converge::reconcile::state_field_t::default_action_id),
            0u);
}

TEST(synchronizer, empty_remote_name_is_a_failed_write) {
  auto state = converge::testing::make_state();
  auto accessor = converge::reconcile::resource_state_accessor{state};

  auto synchronized =
      converge::reconcile::synchronize(make_remote(""), accessor);
  ASSERT_FALSE(synchronized.has_value());
  const auto& diagnostics = synchronized.error();
  ASSERT_EQ(diagnostics.size(), 2u);
  EXPECT_EQ(diagnostics[0].severity, converge::schema::severity_t::warning);
  EXPECT_EQ(diagnostics[1].severity, converge::schema::severity_t::error);
  EXPECT_EQ(state.declaration.name, "Terraform Access Policy");
}
