#include <converge/reconcile/state_accessor.hpp>

#include <utility>

namespace converge::reconcile {

namespace {

std::optional<std::string> optional_string(const std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return std::string{value};
}

}  // namespace

resource_state_accessor::resource_state_accessor(
    schema::resource_state_t& state)
    : state_{state} {}

const schema::access_policy_declaration_t&
resource_state_accessor::declaration() const {
  return state_.declaration;
}

const schema::identity_t& resource_state_accessor::identity() const {
  return state_.identity;
}

void resource_state_accessor::set_identity(schema::identity_t identity) {
  state_.identity = std::move(identity);
}

bool resource_state_accessor::write(const state_field_t field,
                                    const std::string_view value,
                                    std::string& error) {
  switch (field) {
    case state_field_t::name:
      if (value.empty()) {
        error = "name is required but the remote returned an empty value";
        return false;
      }
      state_.declaration.name = std::string{value};
      return true;
    case state_field_t::description:
      state_.declaration.description = optional_string(value);
      return true;
    case state_field_t::type:
      state_.type = optional_string(value);
      return true;
    case state_field_t::default_action_type:
      state_.default_action_type = optional_string(value);
      return true;
    case state_field_t::default_action_id:
      if (!value.empty() && !schema::is_well_formed_identity(value)) {
        error = "default action id is not a well-formed identity";
        return false;
      }
      state_.default_action_id = optional_string(value);
      return true;
  }
  error = "unknown state field";
  return false;
}

}  // namespace converge::reconcile
