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
#include "model_state.hpp"

#include <exception>
#include <future>
#include <memory>
#include <unordered_map>
#include <utility>

#include "logging.hpp"
#include "model.hpp"
#include "model_metric_reporter.hpp"

namespace mserve {

static const std::unordered_map<ModelState, std::string> modelStatesStrings = {
    {ModelState::UNLOADED, "UNLOADED"},
    {ModelState::LOADING, "LOADING"},
    {ModelState::READY, "READY"},
    {ModelState::DEGRADED, "DEGRADED"},
    {ModelState::FAILED, "FAILED"}};

const std::string& ModelStateToString(ModelState state) {
    return modelStatesStrings.at(state);
}

ModelStateMachine::ModelStateMachine(const std::string& modelName, uint32_t degradedThreshold, std::chrono::milliseconds degradedWindow, std::chrono::milliseconds loadTimeout, ModelMetricReporter* reporter) :
    modelName(modelName),
    degradedThreshold(degradedThreshold),
    degradedWindow(degradedWindow),
    loadTimeout(loadTimeout),
    reporter(reporter) {
    if (reporter) {
        SET_IF_ENABLED(reporter->modelLoaded, 0);
        SET_IF_ENABLED(reporter->modelState, static_cast<int>(ModelState::UNLOADED));
    }
    logStatus(StatusCode::OK);
}

ModelStateMachine::~ModelStateMachine() {
    if (loaderThread.joinable()) {
        loaderThread.join();
    }
}

void ModelStateMachine::logStatus(const Status& reason) const {
    SPDLOG_LOGGER_INFO(modelmanager_logger, "STATUS CHANGE: Model {} status change. New status: ( \"state\": \"{}\", \"error_code\": \"{}\" )",
        this->modelName,
        ModelStateToString(state.load()),
        reason.ok() ? "OK" : reason.string());
}

void ModelStateMachine::setState(ModelState newState, const Status& reason) {
    SPDLOG_LOGGER_DEBUG(modelmanager_logger, "{}: {} (previous state: {}) -> {}", __func__, this->modelName, ModelStateToString(state.load()), ModelStateToString(newState));
    state.store(newState);
    if (reporter) {
        SET_IF_ENABLED(reporter->modelState, static_cast<int>(newState));
        SET_IF_ENABLED(reporter->modelLoaded, (newState == ModelState::READY || newState == ModelState::DEGRADED) ? 1 : 0);
    }
    logStatus(reason);
}

Status ModelStateMachine::load(Model& model) {
    {
        std::lock_guard<std::mutex> lock(transitionMutex);
        if (state.load() != ModelState::UNLOADED) {
            SPDLOG_LOGGER_ERROR(modelmanager_logger, "Model {} load requested in state: {}", modelName, ModelStateToString(state.load()));
            return StatusCode::MODEL_ALREADY_LOADED;
        }
        setState(ModelState::LOADING, StatusCode::OK);
    }

    auto promise = std::make_shared<std::promise<Status>>();
    auto future = promise->get_future();
    loaderThread = std::thread([&model, promise]() {
        Status status;
        try {
            status = model.load();
            if (status.ok()) {
                status = model.warmUp();
            }
        } catch (const std::exception& e) {
            status = Status(StatusCode::MODEL_LOAD_FAILED, e.what());
        }
        promise->set_value(std::move(status));
    });

    Status result;
    if (future.wait_for(loadTimeout) != std::future_status::ready) {
        SPDLOG_LOGGER_ERROR(modelmanager_logger, "Model {} did not load within {} ms", modelName, loadTimeout.count());
        result = Status(StatusCode::MODEL_LOAD_TIMEOUT, std::to_string(loadTimeout.count()) + " ms");
    } else {
        result = future.get();
        if (!result.ok() && errorKind(result.getCode()) != ErrorKind::LoadError) {
            result = Status(StatusCode::MODEL_LOAD_FAILED, result.string());
        }
    }

    std::lock_guard<std::mutex> lock(transitionMutex);
    if (result.ok()) {
        setState(ModelState::READY, result);
    } else {
        SPDLOG_LOGGER_ERROR(modelmanager_logger, "Model {} load failed: {}", modelName, result.string());
        setState(ModelState::FAILED, result);
    }
    return result;
}

void ModelStateMachine::recordPredictionSuccess() {
    if (consecutiveFailures.load() == 0 && state.load() != ModelState::DEGRADED) {
        return;
    }
    std::lock_guard<std::mutex> lock(transitionMutex);
    failureTimestamps.clear();
    consecutiveFailures.store(0);
    if (state.load() == ModelState::DEGRADED) {
        setState(ModelState::READY, StatusCode::OK);
    }
}

void ModelStateMachine::recordPredictionFailure() {
    if (degradedThreshold == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(transitionMutex);
    auto current = state.load();
    if (current != ModelState::READY && current != ModelState::DEGRADED) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    failureTimestamps.push_back(now);
    // only the latest degradedThreshold failures decide about the transition
    while (failureTimestamps.size() > degradedThreshold) {
        failureTimestamps.pop_front();
    }
    while (!failureTimestamps.empty() && now - failureTimestamps.front() > degradedWindow) {
        failureTimestamps.pop_front();
    }
    consecutiveFailures.store(static_cast<uint32_t>(failureTimestamps.size()));
    SPDLOG_LOGGER_DEBUG(modelmanager_logger, "Model {} consecutive prediction failures: {}", modelName, failureTimestamps.size());
    if (current == ModelState::READY && failureTimestamps.size() >= degradedThreshold) {
        setState(ModelState::DEGRADED, Status(StatusCode::PREDICTION_INTERNAL_ERROR,
                                           std::to_string(failureTimestamps.size()) + " consecutive prediction failures"));
    }
}

}  // namespace mserve
