#pragma once

#include <converge/schema/default_action.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    converge::schema,
    default_action_t,
    converge::schema::default_action_t::block,
    converge::schema::default_action_t::trust,
    converge::schema::default_action_t::permit,
    converge::schema::default_action_t::network_discovery,
    converge::schema::default_action_t::inherit_from_parent)
