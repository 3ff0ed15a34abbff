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
#include <vector>

#include "model.hpp"
#include "status.hpp"
#include "tensor.hpp"

namespace mserve {

/**
 * @brief Encodes V2 protocol response. Non finite floating point values are written as null.
 */
Status makeJsonFromInferenceResponse(const InferenceResponse& response, std::string* response_json);

void makeJsonFromModelDescription(const ModelDescription& description, std::string* response_json);

/**
 * @brief Encodes error body: {"error": message, "kind": error kind, "type": error class}
 */
void makeJsonFromStatus(const Status& status, std::string* response_json);

void makeHealthJson(bool healthy, bool modelLoaded, const std::string& modelName, const std::string& state, std::string* response_json);

void makeReadyJson(bool ready, const std::string& state, std::string* response_json);

/**
 * @brief Encodes KServe probe body such as {"live": true}
 */
void makeProbeJson(const char* key, bool value, std::string* response_json);

void makeServerMetadataJson(std::string* response_json);

// Service name, served model and the list of exposed endpoints
void makeServiceDescriptionJson(const std::string& modelName, const std::vector<std::string>& endpoints, std::string* response_json);

}  // namespace mserve
