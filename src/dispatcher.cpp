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
#include "dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <random>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "metric.hpp"
#include "model.hpp"
#include "model_metric_reporter.hpp"
#include "model_state.hpp"
#include "request_validation.hpp"
#include "rest_parser.hpp"
#include "rest_utils.hpp"
#include "timer.hpp"

namespace mserve {

enum : unsigned int {
    TOTAL,
    DECODE,
    PREDICT,
    TIMER_END
};

InferenceDispatcher::InferenceDispatcher(Model& model, ModelStateMachine& modelState, ModelMetricReporter& reporter) :
    model(model),
    modelState(modelState),
    reporter(reporter) {}

std::string InferenceDispatcher::generateRequestId() {
    static std::atomic<uint64_t> sequence{0};
    thread_local std::mt19937_64 generator{std::random_device{}()};
    return fmt::format("{:016x}-{}", generator(), sequence.fetch_add(1));
}

Status InferenceDispatcher::infer(const InferenceRequest& request, InferenceResponse& response) {
    const auto& description = model.describe();
    auto status = request_validation_utils::validateRequest(request, description);
    if (!status.ok()) {
        return status;
    }
    // DEGRADED keeps serving so that a successful prediction can restore READY
    if (!modelState.isLoaded()) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Model {} is not ready, state: {}", description.name, modelState.getStateString());
        return Status(StatusCode::MODEL_NOT_READY, "state: " + modelState.getStateString());
    }

    std::vector<Tensor> outputs;
    try {
        status = model.predict(request.inputs, outputs);
    } catch (const std::exception& e) {
        SPDLOG_LOGGER_ERROR(rest_logger, "Model {} prediction threw exception: {}", description.name, e.what());
        status = Status(StatusCode::PREDICTION_INTERNAL_ERROR, e.what());
    }
    if (!status.ok()) {
        if (errorKind(status.getCode()) != ErrorKind::PredictionError) {
            status = Status(StatusCode::PREDICTION_INTERNAL_ERROR, status.string());
        }
        modelState.recordPredictionFailure();
        return status;
    }
    modelState.recordPredictionSuccess();

    response.id = request.id.has_value() ? request.id.value() : generateRequestId();
    response.modelName = description.name;
    response.modelVersion = description.version;
    response.outputs.clear();
    for (auto& output : outputs) {
        if (!request.requestedOutputs.empty() &&
            std::find(request.requestedOutputs.begin(), request.requestedOutputs.end(), output.getName()) == request.requestedOutputs.end()) {
            continue;
        }
        response.outputs.push_back(std::move(output));
    }
    return StatusCode::OK;
}

Status InferenceDispatcher::dispatch(const std::string& body, std::string& response, const CancellationCheck& isCancelled) {
    Timer<TIMER_END> timer;
    using std::chrono::microseconds;
    timer.start(TOTAL);
    MetricGaugeGuard activeGuard(reporter.getActiveRequestsMetric());

    Status status;
    std::string output;
    {
        InferenceRequest request;
        timer.start(DECODE);
        status = decodeInferenceRequest(body, request);
        timer.stop(DECODE);
        if (status.ok()) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "Request decoding: {:.3f} ms", timer.elapsed<microseconds>(DECODE) / 1000);
            InferenceResponse inferenceResponse;
            timer.start(PREDICT);
            status = infer(request, inferenceResponse);
            timer.stop(PREDICT);
            if (status.ok()) {
                SPDLOG_LOGGER_DEBUG(rest_logger, "Prediction: {:.3f} ms", timer.elapsed<microseconds>(PREDICT) / 1000);
                status = makeJsonFromInferenceResponse(inferenceResponse, &output);
            }
        }
    }
    timer.stop(TOTAL);

    if (isCancelled && isCancelled()) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Client disconnected, dropping response for model: {}", reporter.getModelName());
        return StatusCode::REQUEST_CANCELLED;
    }
    reporter.record(status, timer.elapsedDuration(TOTAL));
    if (!status.ok()) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Inference request for model: {} failed: {} kind: {}", reporter.getModelName(), status.string(), toString(errorKind(status.getCode())));
        return status;
    }
    SPDLOG_LOGGER_DEBUG(rest_logger, "Total REST request processing time: {:.3f} ms", timer.elapsed<microseconds>(TOTAL) / 1000);
    response = std::move(output);
    return StatusCode::OK;
}

}  // namespace mserve
