#pragma once

#include <converge/remote/v1/access_policy.pb.h>
#include <converge/schema/access_policy.hpp>

namespace converge::remote {

/// Wire object to protobuf. Absent references leave the sub-message unset.
void to_proto(const schema::access_policy& policy, v1::AccessPolicy* out);

/// Protobuf to wire object. Empty ids map to std::nullopt.
schema::access_policy from_proto(const v1::AccessPolicy& policy);

}  // namespace converge::remote
