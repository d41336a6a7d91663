#include <gtest/gtest.h>
#include <converge/remote/convert.hpp>
#include <converge/remote/grpc_client.hpp>

TEST(convert, unset_references_and_flags_stay_unset) {
  auto policy = converge::schema::access_policy{
      .id = std::nullopt,
      .name = "Terraform Access Policy",
      .description = "",
      .type = "AccessPolicy",
      .default_action = converge::schema::access_policy_default_action{
          .id = std::nullopt,
          .type = "AccessPolicyDefaultAction",
          .action = "PERMIT",
          .intrusion_policy = std::nullopt,
          .syslog_config = std::nullopt,
          .send_events_to_fmc = std::nullopt,
          .log_begin = false,
          .log_end = std::nullopt}};

  auto message = converge::remote::v1::AccessPolicy{};
  converge::remote::to_proto(policy, &message);
  EXPECT_FALSE(message.default_action().has_intrusion_policy());
  EXPECT_FALSE(message.default_action().has_send_events_to_fmc());
  EXPECT_TRUE(message.default_action().has_log_begin());

  EXPECT_EQ(converge::remote::from_proto(message), policy);
}

TEST(convert, references_carry_discriminators) {
  auto message = converge::remote::v1::AccessPolicy{};
  message.set_id("abc123");
  auto* reference =
      message.mutable_default_action()->mutable_syslog_config();
  reference->set_id("syslog-1");
  reference->set_type("SyslogAlert");

  auto policy = converge::remote::from_proto(message);
  EXPECT_EQ(policy.id, "abc123");
  ASSERT_TRUE(policy.default_action.syslog_config.has_value());
  EXPECT_EQ(policy.default_action.syslog_config->type, "SyslogAlert");
  EXPECT_FALSE(policy.default_action.id.has_value());
}

TEST(convert, status_codes_map_to_remote_errors) {
  auto not_found = converge::remote::map_status(
      ::grpc::Status{::grpc::StatusCode::NOT_FOUND, "gone"});
  EXPECT_EQ(not_found.code, converge::remote::remote_error_code_t::not_found);
  EXPECT_EQ(not_found.message, "gone");

  EXPECT_EQ(converge::remote::map_status(
                ::grpc::Status{::grpc::StatusCode::ALREADY_EXISTS, "dup"})
                .code,
            converge::remote::remote_error_code_t::rejected);
  EXPECT_EQ(converge::remote::map_status(
                ::grpc::Status{::grpc::StatusCode::DEADLINE_EXCEEDED, "late"})
                .code,
            converge::remote::remote_error_code_t::deadline_exceeded);
  EXPECT_EQ(converge::remote::map_status(
                ::grpc::Status{::grpc::StatusCode::UNKNOWN, "?"})
                .code,
            converge::remote::remote_error_code_t::internal);
}
