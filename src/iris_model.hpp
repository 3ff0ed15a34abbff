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

#include <array>
#include <atomic>
#include <string>
#include <vector>

#include "model.hpp"

namespace mserve {

/**
 * @brief Linear softmax classifier over four iris flower measurements
 *
 * Input "input" FP32 [-1,4]. Outputs "probabilities" FP32 [-1,3],
 * "predicted_class" BYTES [-1] and "confidence" FP32 [-1].
 */
class IrisClassifier : public Model {
public:
    static constexpr size_t FEATURES = 4;
    static constexpr size_t CLASSES = 3;
    static const std::string MODEL_NAME;
    static const std::string MODEL_VERSION;
    static const std::array<std::string, CLASSES> CLASS_NAMES;

private:
    ModelDescription description;
    std::array<std::array<float, CLASSES>, FEATURES> weights{};
    std::array<float, CLASSES> bias{};
    std::atomic<bool> loaded{false};

public:
    IrisClassifier();

    Status load() override;
    Status warmUp() override;
    Status predict(const std::vector<Tensor>& inputs, std::vector<Tensor>& outputs) const override;
    const ModelDescription& describe() const override { return description; }

    bool isLoaded() const { return loaded.load(); }
};

}  // namespace mserve
