#pragma once

#include "impact/v1/types.pb.h"
#include "impact/v1/inventory.pb.h"
#include "impact/v1/analysis.pb.h"

#include <google/protobuf/repeated_ptr_field.h>

namespace impact::v1 {

using Components   = ::google::protobuf::RepeatedPtrField<Component>;
using Dependencies = ::google::protobuf::RepeatedPtrField<Dependency>;
using Workflows    = ::google::protobuf::RepeatedPtrField<BusinessWorkflow>;

}
