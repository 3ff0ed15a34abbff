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

#include <memory>
#include <string>

#include "dispatcher.hpp"
#include "model.hpp"
#include "model_metric_reporter.hpp"
#include "model_state.hpp"

namespace mserve {

class MetricConfig;
class MetricRegistry;

struct ServableSettings {
    uint32_t degradedThreshold = ModelStateMachine::DEFAULT_DEGRADED_THRESHOLD;
    std::chrono::milliseconds degradedWindow = ModelStateMachine::DEFAULT_DEGRADED_WINDOW;
    std::chrono::milliseconds loadTimeout = ModelStateMachine::DEFAULT_LOAD_TIMEOUT;
};

/**
 * @brief Served model with its metrics, lifecycle state and request dispatcher
 *
 * Members are declared in dependency order so that the state machine, which
 * may wait for a background load, is destroyed before the model.
 */
class Servable {
    std::unique_ptr<Model> model;
    ModelMetricReporter reporter;
    ModelStateMachine state;
    InferenceDispatcher dispatcher;

public:
    /**
     * @throws std::logic_error when metric families cannot be registered
     */
    Servable(std::unique_ptr<Model> model, const MetricConfig* metricConfig, MetricRegistry* registry, const ServableSettings& settings = {});

    Status load() { return state.load(*model); }

    Model& getModel() { return *model; }
    const ModelDescription& describe() const { return model->describe(); }
    ModelStateMachine& getState() { return state; }
    const ModelStateMachine& getState() const { return state; }
    ModelMetricReporter& getReporter() { return reporter; }
    InferenceDispatcher& getDispatcher() { return dispatcher; }
};

}  // namespace mserve
