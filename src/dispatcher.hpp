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

#include <functional>
#include <string>

#include "status.hpp"
#include "tensor.hpp"

namespace mserve {

class Model;
class ModelMetricReporter;
class ModelStateMachine;

/**
 * @brief Runs a single inference request through decode, validation, prediction and encoding
 *
 * Holds references only. Model, state machine and metric reporter are owned by
 * the caller and have to outlive the dispatcher. Requests are not serialized
 * against each other.
 */
class InferenceDispatcher {
    Model& model;
    ModelStateMachine& modelState;
    ModelMetricReporter& reporter;

public:
    // Returns true when the client that sent the request is gone
    using CancellationCheck = std::function<bool()>;

    InferenceDispatcher(Model& model, ModelStateMachine& modelState, ModelMetricReporter& reporter);

    /**
     * @brief Handles raw request body
     *
     * Every outcome except cancellation is recorded exactly once in metrics.
     * On failure response holds nothing, error body is produced by the caller.
     *
     * @return REQUEST_CANCELLED when isCancelled reported disconnected client, nothing is recorded then
     */
    Status dispatch(const std::string& body, std::string& response, const CancellationCheck& isCancelled = nullptr);

    /**
     * @brief Validation, readiness check and prediction on decoded request
     */
    Status infer(const InferenceRequest& request, InferenceResponse& response);

    static std::string generateRequestId();
};

}  // namespace mserve
