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

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mserve {

using dimension_value_t = std::int64_t;

constexpr dimension_value_t DYNAMIC_DIMENSION = -1;

using signed_shape_t = std::vector<dimension_value_t>;

template <typename T>
std::string shapeToString(const T& shape) {
    std::ostringstream oss;
    oss << "(";
    size_t i = 0;
    if (shape.size() > 0) {
        for (; i < shape.size() - 1; i++) {
            oss << shape[i] << ",";
        }
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

enum class Datatype {
    FP32,
    FP64,
    INT32,
    INT64,
    BOOL,
    BYTES,
    UNDEFINED,
    DATATYPE_END
};

const std::string& toString(Datatype datatype);

/**
 * @brief Converts V2 protocol datatype name. STRING is accepted as an alias of BYTES.
 *
 * @return Datatype::UNDEFINED for unsupported names
 */
Datatype fromString(const std::string& s);

/**
 * @brief Named, typed and shaped array of values. Immutable once constructed.
 *
 * Datatype is derived from the storage type so that both can never diverge.
 */
class Tensor {
public:
    using data_t = std::variant<
        std::vector<float>,
        std::vector<double>,
        std::vector<int32_t>,
        std::vector<int64_t>,
        std::vector<bool>,
        std::vector<std::string>>;

private:
    std::string name;
    signed_shape_t shape;
    data_t values;

public:
    Tensor(std::string name, signed_shape_t shape, data_t values) :
        name(std::move(name)),
        shape(std::move(shape)),
        values(std::move(values)) {}

    const std::string& getName() const { return name; }
    const signed_shape_t& getShape() const { return shape; }
    Datatype getDatatype() const;

    /**
     * @brief Number of stored values. For BYTES tensors every string counts as one element.
     */
    size_t elementCount() const;

    /**
     * @brief Product of shape dimensions. Empty shape describes a scalar.
     * Empty when the product does not fit in size_t or a dimension is negative.
     */
    std::optional<size_t> shapeElementCount() const;

    const data_t& getValues() const { return values; }

    template <typename T>
    const std::vector<T>& data() const {
        return std::get<std::vector<T>>(values);
    }

    template <typename T>
    bool holds() const {
        return std::holds_alternative<std::vector<T>>(values);
    }
};

struct InferenceRequest {
    std::optional<std::string> id;
    std::vector<Tensor> inputs;
    std::vector<std::string> requestedOutputs;

    const Tensor* findInput(const std::string& name) const;
};

struct InferenceResponse {
    std::string id;
    std::string modelName;
    std::string modelVersion;
    std::vector<Tensor> outputs;
};

}  // namespace mserve
