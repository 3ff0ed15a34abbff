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

#include "status.hpp"
#include "tensor.hpp"

namespace mserve {

/**
 * @brief Declared input or output of a model. Dimension equal to -1 accepts any size.
 */
struct TensorSpec {
    std::string name;
    Datatype datatype;
    signed_shape_t shape;
};

struct ModelDescription {
    std::string name;
    std::string version;
    std::string platform;
    std::vector<TensorSpec> inputs;
    std::vector<TensorSpec> outputs;

    const TensorSpec* findInput(const std::string& inputName) const;
    const TensorSpec* findOutput(const std::string& outputName) const;
};

/**
 * @brief Prediction runtime served by the process
 *
 * Exactly one instance is resident per process. Parameters loaded by load()
 * are read only afterwards so predict() may be called concurrently without
 * synchronization.
 */
class Model {
public:
    virtual ~Model() = default;

    /**
     * @brief Prepares backing resources. Called once at process start.
     */
    virtual Status load() = 0;

    /**
     * @brief Runs a sample prediction so the first request does not pay initialization cost
     */
    virtual Status warmUp() = 0;

    /**
     * @brief Computes outputs for already validated inputs
     *
     * @param inputs tensors matching describe().inputs
     * @param outputs filled with one tensor per describe().outputs entry
     */
    virtual Status predict(const std::vector<Tensor>& inputs, std::vector<Tensor>& outputs) const = 0;

    virtual const ModelDescription& describe() const = 0;
};

}  // namespace mserve
