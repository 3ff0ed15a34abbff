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

#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#include <rapidjson/document.h>
#pragma GCC diagnostic pop

#include "status.hpp"
#include "tensor.hpp"

namespace mserve {

/**
 * @brief Decodes V2 inference protocol JSON body into InferenceRequest
 *
 * Parser does not look into model semantics. Element count against shape and
 * input names are checked later by request validation.
 */
class KFSRestParser {
    InferenceRequest request;

    Status parseId(rapidjson::Value& node);
    Status parseParameters(rapidjson::Value& node);
    Status parseOutput(rapidjson::Value& node);
    Status parseOutputs(rapidjson::Value& node);
    Status parseData(rapidjson::Value& node, Datatype datatype, Tensor::data_t& values);
    Status parseInput(rapidjson::Value& node);
    Status parseInputs(rapidjson::Value& node);

public:
    Status parse(const char* json, size_t size);
    Status parse(const std::string& json) { return parse(json.data(), json.size()); }
    InferenceRequest& getRequest() { return request; }
};

/**
 * @brief Convenience wrapper decoding raw request body
 */
Status decodeInferenceRequest(const std::string& body, InferenceRequest& request);

}  // namespace mserve
