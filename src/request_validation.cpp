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
#include "request_validation.hpp"

#include <sstream>
#include <string>

#include "logging.hpp"

namespace mserve {
namespace request_validation_utils {

Status validateValueCount(const Tensor& input) {
    auto expected = input.shapeElementCount();
    size_t actual = input.elementCount();
    if (!expected) {
        std::stringstream ss;
        ss << "Shape " << shapeToString(input.getShape()) << " element count out of range; Actual: " << actual << "; input name: " << input.getName();
        const std::string details = ss.str();
        SPDLOG_DEBUG("Invalid number of values in tensor data - {}", details);
        return Status(StatusCode::INVALID_VALUE_COUNT, details);
    }
    if (expected.value() != actual) {
        std::stringstream ss;
        ss << "Expected: " << expected.value() << "; Actual: " << actual << "; input name: " << input.getName();
        const std::string details = ss.str();
        SPDLOG_DEBUG("Invalid number of values in tensor data - {}", details);
        return Status(StatusCode::INVALID_VALUE_COUNT, details);
    }
    return StatusCode::OK;
}

Status validateShape(const Tensor& input, const TensorSpec& spec) {
    const auto& shape = input.getShape();
    bool matches = shape.size() == spec.shape.size();
    for (size_t i = 0; matches && i < shape.size(); ++i) {
        if (spec.shape[i] != DYNAMIC_DIMENSION && spec.shape[i] != shape[i]) {
            matches = false;
        }
    }
    if (!matches) {
        std::stringstream ss;
        ss << "Expected shape: " << shapeToString(spec.shape) << "; Actual: " << shapeToString(shape) << "; input name: " << input.getName();
        const std::string details = ss.str();
        SPDLOG_DEBUG("Invalid shape - {}", details);
        return Status(StatusCode::INVALID_SHAPE, details);
    }
    return StatusCode::OK;
}

Status validateDatatype(const Tensor& input, const TensorSpec& spec) {
    if (input.getDatatype() != spec.datatype) {
        std::stringstream ss;
        ss << "Expected: " << toString(spec.datatype)
           << "; Actual: " << toString(input.getDatatype())
           << "; input name: " << input.getName();
        const std::string details = ss.str();
        SPDLOG_DEBUG("Invalid precision - {}", details);
        return Status(StatusCode::INVALID_PRECISION, details);
    }
    return StatusCode::OK;
}

Status validateRequest(const InferenceRequest& request, const ModelDescription& description) {
    for (const auto& input : request.inputs) {
        RETURN_IF_ERR(validateValueCount(input));
        const TensorSpec* spec = description.findInput(input.getName());
        if (spec == nullptr) {
            SPDLOG_DEBUG("Got unexpected input name: {}", input.getName());
            return Status(StatusCode::INVALID_UNEXPECTED_INPUT, "input name: " + input.getName());
        }
        RETURN_IF_ERR(validateShape(input, *spec));
        RETURN_IF_ERR(validateDatatype(input, *spec));
    }
    for (const auto& spec : description.inputs) {
        if (request.findInput(spec.name) == nullptr) {
            SPDLOG_DEBUG("Missing input with specific name: {}", spec.name);
            return Status(StatusCode::INVALID_MISSING_INPUT, "Required input: " + spec.name);
        }
    }
    for (const auto& outputName : request.requestedOutputs) {
        if (description.findOutput(outputName) == nullptr) {
            SPDLOG_DEBUG("Requested output does not exist: {}", outputName);
            return Status(StatusCode::INVALID_MISSING_OUTPUT, "output name: " + outputName);
        }
    }
    return StatusCode::OK;
}

}  // namespace request_validation_utils
}  // namespace mserve
