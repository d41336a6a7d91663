#pragma once

#include <converge/schema/access_policy_declaration.hpp>
#include <converge/schema/enum_string.hpp>
#include <converge/schema/primitives.hpp>
#include <converge/schema/resource_state.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace converge::reconcile {

/// Fields the synchronizer writes back from the remote object.
enum class state_field_t : uint8_t {
  name = 0,
  description = 1,
  type = 2,
  default_action_type = 3,
  default_action_id = 4,
};

inline constexpr auto kStateFieldMappings = std::array{
    std::pair<std::string_view, state_field_t>{"name", state_field_t::name},
    std::pair<std::string_view, state_field_t>{"description",
                                               state_field_t::description},
    std::pair<std::string_view, state_field_t>{"type", state_field_t::type},
    std::pair<std::string_view, state_field_t>{
        "default_action_type", state_field_t::default_action_type},
    std::pair<std::string_view, state_field_t>{
        "default_action_id", state_field_t::default_action_id},
};

inline constexpr std::string_view to_string(const state_field_t value) {
  return schema::to_string(value, kStateFieldMappings).value_or("unknown");
}

/// Local view of one declared resource, shared by the translator (reads the
/// declaration) and the synchronizer (writes observed fields).
class state_accessor {
 public:
  virtual ~state_accessor() = default;

  virtual const schema::access_policy_declaration_t& declaration() const = 0;

  /// Persisted remote handle; empty when the resource does not exist.
  virtual const schema::identity_t& identity() const = 0;

  /// Infallible. An empty identity marks the resource as gone.
  virtual void set_identity(schema::identity_t identity) = 0;

  /// Write one observed field. Returns false and sets `error` when the value
  /// can not be stored; earlier writes are left in place.
  virtual bool write(state_field_t field,
                     std::string_view value,
                     std::string& error) = 0;
};

/// Accessor over a caller-owned resource_state_t.
class resource_state_accessor final : public state_accessor {
 public:
  explicit resource_state_accessor(schema::resource_state_t& state);

  const schema::access_policy_declaration_t& declaration() const override;
  const schema::identity_t& identity() const override;
  void set_identity(schema::identity_t identity) override;
  bool write(state_field_t field,
             std::string_view value,
             std::string& error) override;

 private:
  schema::resource_state_t& state_;
};

}  // namespace converge::reconcile
