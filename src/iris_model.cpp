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
#include "iris_model.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "logging.hpp"

namespace mserve {

const std::string IrisClassifier::MODEL_NAME = "iris-classifier";
const std::string IrisClassifier::MODEL_VERSION = "v1.0.0";
const std::array<std::string, IrisClassifier::CLASSES> IrisClassifier::CLASS_NAMES = {"setosa", "versicolor", "virginica"};

IrisClassifier::IrisClassifier() {
    description.name = MODEL_NAME;
    description.version = MODEL_VERSION;
    description.platform = "mserve_native";
    description.inputs = {{"input", Datatype::FP32, {DYNAMIC_DIMENSION, static_cast<dimension_value_t>(FEATURES)}}};
    description.outputs = {
        {"probabilities", Datatype::FP32, {DYNAMIC_DIMENSION, static_cast<dimension_value_t>(CLASSES)}},
        {"predicted_class", Datatype::BYTES, {DYNAMIC_DIMENSION}},
        {"confidence", Datatype::FP32, {DYNAMIC_DIMENSION}}};
}

Status IrisClassifier::load() {
    if (loaded.load()) {
        return StatusCode::MODEL_ALREADY_LOADED;
    }
    SPDLOG_LOGGER_INFO(modelmanager_logger, "Loading model weights for: {}", MODEL_NAME);
    // rows: sepal length, sepal width, petal length, petal width
    weights = {{{0.41f, 0.27f, -0.68f},
        {1.46f, -0.62f, -0.84f},
        {-2.26f, 0.08f, 2.18f},
        {-1.02f, -0.91f, 1.93f}}};
    bias = {0.26f, 1.09f, -1.35f};
    loaded.store(true);
    SPDLOG_LOGGER_INFO(modelmanager_logger, "Model: {} version: {} loaded", MODEL_NAME, MODEL_VERSION);
    return StatusCode::OK;
}

Status IrisClassifier::warmUp() {
    std::vector<Tensor> inputs;
    inputs.emplace_back("input", signed_shape_t{1, static_cast<dimension_value_t>(FEATURES)}, std::vector<float>{5.1f, 3.5f, 1.4f, 0.2f});
    std::vector<Tensor> outputs;
    auto status = predict(inputs, outputs);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(modelmanager_logger, "Warm up of model: {} failed: {}", MODEL_NAME, status.string());
        return Status(StatusCode::MODEL_WARMUP_FAILED, status.string());
    }
    SPDLOG_LOGGER_DEBUG(modelmanager_logger, "Warm up of model: {} finished", MODEL_NAME);
    return StatusCode::OK;
}

Status IrisClassifier::predict(const std::vector<Tensor>& inputs, std::vector<Tensor>& outputs) const {
    if (!loaded.load()) {
        return Status(StatusCode::PREDICTION_INTERNAL_ERROR, "weights not loaded");
    }
    if (inputs.size() != 1 || !inputs[0].holds<float>()) {
        return Status(StatusCode::PREDICTION_INVALID_INPUT, "expected single FP32 input");
    }
    const auto& input = inputs[0];
    const auto& values = input.data<float>();
    if (values.size() % FEATURES != 0) {
        return Status(StatusCode::PREDICTION_INVALID_INPUT, "input size is not a multiple of feature count");
    }
    const size_t batch = values.size() / FEATURES;

    std::vector<float> probabilities;
    probabilities.reserve(batch * CLASSES);
    std::vector<std::string> predictedClass;
    predictedClass.reserve(batch);
    std::vector<float> confidence;
    confidence.reserve(batch);

    for (size_t row = 0; row < batch; ++row) {
        std::array<float, CLASSES> logits = bias;
        for (size_t f = 0; f < FEATURES; ++f) {
            float x = values[row * FEATURES + f];
            if (!std::isfinite(x)) {
                return Status(StatusCode::PREDICTION_NUMERICAL_ERROR, "non finite input value");
            }
            for (size_t c = 0; c < CLASSES; ++c) {
                logits[c] += x * weights[f][c];
            }
        }
        float maxLogit = *std::max_element(logits.begin(), logits.end());
        float sum = 0.0f;
        for (auto& logit : logits) {
            logit = std::exp(logit - maxLogit);
            sum += logit;
        }
        if (!std::isfinite(sum) || sum <= 0.0f) {
            return Status(StatusCode::PREDICTION_NUMERICAL_ERROR, "softmax normalization failed");
        }
        size_t best = 0;
        for (size_t c = 0; c < CLASSES; ++c) {
            logits[c] /= sum;
            probabilities.push_back(logits[c]);
            if (logits[c] > logits[best]) {
                best = c;
            }
        }
        predictedClass.push_back(CLASS_NAMES[best]);
        confidence.push_back(logits[best]);
    }

    const auto batchDim = static_cast<dimension_value_t>(batch);
    outputs.clear();
    outputs.emplace_back("probabilities", signed_shape_t{batchDim, static_cast<dimension_value_t>(CLASSES)}, std::move(probabilities));
    outputs.emplace_back("predicted_class", signed_shape_t{batchDim}, std::move(predictedClass));
    outputs.emplace_back("confidence", signed_shape_t{batchDim}, std::move(confidence));
    return StatusCode::OK;
}

}  // namespace mserve
