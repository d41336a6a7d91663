#include <gtest/gtest.h>
#include <converge/reconcile/translator.hpp>
#include <converge/testing/common.hpp>

TEST(translator, builds_nested_wire_object) {
  auto declaration = converge::testing::make_declaration();
  declaration.default_action.base_intrusion_policy_id = "ips-1";
  declaration.default_action.send_events_to_fmc = true;

  auto translated = converge::reconcile::translate(declaration);
  ASSERT_TRUE(translated.has_value());
  const auto& policy = translated.value();
  EXPECT_FALSE(policy.id.has_value());
  EXPECT_EQ(policy.name, "Terraform Access Policy");
  EXPECT_EQ(policy.description, "managed by converge");
  EXPECT_EQ(policy.type, "AccessPolicy");
  EXPECT_EQ(policy.default_action.type, "AccessPolicyDefaultAction");
  EXPECT_EQ(policy.default_action.action, "PERMIT");
  ASSERT_TRUE(policy.default_action.intrusion_policy.has_value());
  EXPECT_EQ(policy.default_action.intrusion_policy->id, "ips-1");
  EXPECT_EQ(policy.default_action.intrusion_policy->type, "IntrusionPolicy");
  EXPECT_FALSE(policy.default_action.syslog_config.has_value());
  EXPECT_EQ(policy.default_action.send_events_to_fmc, true);
  EXPECT_FALSE(policy.default_action.log_begin.has_value());
}

TEST(translator, is_deterministic) {
  auto declaration = converge::testing::make_declaration();
  declaration.default_action.syslog_config_id = "syslog-1";
  auto first = converge::reconcile::translate(declaration);
  auto second = converge::reconcile::translate(declaration);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(first.value().default_action.syslog_config->type, "SyslogAlert");
}

TEST(translator, unset_action_and_description_are_empty) {
  auto declaration = converge::schema::access_policy_declaration_t{};
  declaration.name = "bare";
  auto translated = converge::reconcile::translate(declaration);
  ASSERT_TRUE(translated.has_value());
  EXPECT_TRUE(translated.value().description.empty());
  EXPECT_TRUE(translated.value().default_action.action.empty());
}

TEST(translator, rejects_malformed_references) {
  auto declaration = converge::testing::make_declaration();
  declaration.default_action.base_intrusion_policy_id = "not an id";
  declaration.default_action.syslog_config_id = "also/bad";

  auto translated = converge::reconcile::translate(declaration);
  ASSERT_FALSE(translated.has_value());
  const auto& diagnostics = translated.error();
  ASSERT_EQ(diagnostics.size(), 2u);
  EXPECT_EQ(diagnostics[0].summary, "invalid access policy");
  EXPECT_EQ(diagnostics[0].detail,
            "\"default_action_base_intrusion_policy_id\" is not a "
            "well-formed identity: \"not an id\"");
  EXPECT_FALSE(diagnostics[1].detail.empty());
}
