//*****************************************************************************
// Copyright 2025 Intel Corporation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//*****************************************************************************
#pragma once

#include "model.hpp"
#include "status.hpp"
#include "tensor.hpp"

namespace mserve {
namespace request_validation_utils {

/**
 * @brief Checks decoded request against model declared inputs and outputs.
 *
 * Per input: value count against shape, shape against model shape, datatype,
 * then input name. Afterwards missing inputs and requested outputs are checked.
 * The first failure is returned.
 */
Status validateRequest(const InferenceRequest& request, const ModelDescription& description);

Status validateValueCount(const Tensor& input);
Status validateShape(const Tensor& input, const TensorSpec& spec);
Status validateDatatype(const Tensor& input, const TensorSpec& spec);

}  // namespace request_validation_utils
}  // namespace mserve
