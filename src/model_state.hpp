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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "status.hpp"

namespace mserve {

class Model;
class ModelMetricReporter;

enum class ModelState : int {
    UNLOADED = 0,
    LOADING = 1,
    READY = 2,
    DEGRADED = 3,
    FAILED = 4
};

const std::string& ModelStateToString(ModelState state);

/**
 * @brief Lifecycle of the served model answering liveness and readiness probes
 *
 * Transitions are serialized on a single mutex. Reads of the current state are
 * lock free atomic snapshots.
 *
 * UNLOADED -> LOADING -> READY | FAILED, READY <-> DEGRADED.
 * FAILED is terminal. DEGRADED is entered after degradedThreshold consecutive
 * prediction failures within degradedWindow and left on the next success.
 */
class ModelStateMachine {
    const std::string modelName;
    const uint32_t degradedThreshold;
    const std::chrono::milliseconds degradedWindow;
    const std::chrono::milliseconds loadTimeout;
    ModelMetricReporter* reporter;

    std::atomic<ModelState> state{ModelState::UNLOADED};
    // mirrors failureTimestamps.size() so that success path does not lock when nothing failed
    std::atomic<uint32_t> consecutiveFailures{0};

    std::mutex transitionMutex;
    std::deque<std::chrono::steady_clock::time_point> failureTimestamps;

    std::thread loaderThread;

    void setState(ModelState newState, const Status& reason);
    void logStatus(const Status& reason) const;

public:
    static constexpr uint32_t DEFAULT_DEGRADED_THRESHOLD = 5;
    static constexpr std::chrono::seconds DEFAULT_DEGRADED_WINDOW{60};
    static constexpr std::chrono::seconds DEFAULT_LOAD_TIMEOUT{30};

    /**
     * @param degradedThreshold number of consecutive failures entering DEGRADED, 0 disables degradation
     * @param degradedWindow failures older than window do not count
     * @param loadTimeout bound on load() and warmUp() together
     * @param reporter optional, receives model loaded and state gauges
     */
    ModelStateMachine(const std::string& modelName,
        uint32_t degradedThreshold = DEFAULT_DEGRADED_THRESHOLD,
        std::chrono::milliseconds degradedWindow = DEFAULT_DEGRADED_WINDOW,
        std::chrono::milliseconds loadTimeout = DEFAULT_LOAD_TIMEOUT,
        ModelMetricReporter* reporter = nullptr);
    ModelStateMachine(const ModelStateMachine&) = delete;
    ModelStateMachine& operator=(const ModelStateMachine&) = delete;
    ~ModelStateMachine();

    /**
     * @brief Loads and warms up the model on a worker thread
     *
     * Model has to outlive the state machine since a timed out load keeps
     * running in background until it finishes.
     */
    Status load(Model& model);

    void recordPredictionSuccess();
    void recordPredictionFailure();

    ModelState getState() const { return state.load(); }
    const std::string& getStateString() const { return ModelStateToString(getState()); }
    const std::string& getModelName() const { return modelName; }
    uint32_t getRecentFailureCount() const { return consecutiveFailures.load(); }

    bool isLive() const { return getState() != ModelState::FAILED; }
    bool isReady() const { return getState() == ModelState::READY; }
    bool isLoaded() const {
        auto current = getState();
        return current == ModelState::READY || current == ModelState::DEGRADED;
    }
};

}  // namespace mserve
