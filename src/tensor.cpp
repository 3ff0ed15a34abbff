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
#include "tensor.hpp"

#include <limits>
#include <unordered_map>

namespace mserve {

const std::string& toString(Datatype datatype) {
    static std::unordered_map<Datatype, std::string> datatypeMap{
        {Datatype::FP32, "FP32"},
        {Datatype::FP64, "FP64"},
        {Datatype::INT32, "INT32"},
        {Datatype::INT64, "INT64"},
        {Datatype::BOOL, "BOOL"},
        {Datatype::BYTES, "BYTES"},
        {Datatype::UNDEFINED, "UNDEFINED"}};
    auto it = datatypeMap.find(datatype);
    if (it == datatypeMap.end()) {
        static const std::string UNKNOWN{"UNKNOWN"};
        return UNKNOWN;
    }
    return it->second;
}

Datatype fromString(const std::string& s) {
    static std::unordered_map<std::string, Datatype> datatypeMap{
        {"FP32", Datatype::FP32},
        {"FP64", Datatype::FP64},
        {"INT32", Datatype::INT32},
        {"INT64", Datatype::INT64},
        {"BOOL", Datatype::BOOL},
        {"BYTES", Datatype::BYTES},
        {"STRING", Datatype::BYTES}};
    auto it = datatypeMap.find(s);
    if (it == datatypeMap.end()) {
        return Datatype::UNDEFINED;
    }
    return it->second;
}

Datatype Tensor::getDatatype() const {
    // order follows data_t alternatives
    static const Datatype byIndex[] = {
        Datatype::FP32,
        Datatype::FP64,
        Datatype::INT32,
        Datatype::INT64,
        Datatype::BOOL,
        Datatype::BYTES};
    return byIndex[values.index()];
}

size_t Tensor::elementCount() const {
    return std::visit([](const auto& v) { return v.size(); }, values);
}

std::optional<size_t> Tensor::shapeElementCount() const {
    size_t count = 1;
    for (auto dim : shape) {
        if (dim < 0) {
            return std::nullopt;
        }
        size_t udim = static_cast<size_t>(dim);
        if (udim != 0 && count > std::numeric_limits<size_t>::max() / udim) {
            return std::nullopt;
        }
        count *= udim;
    }
    return count;
}

const Tensor* InferenceRequest::findInput(const std::string& name) const {
    for (const auto& input : inputs) {
        if (input.getName() == name) {
            return &input;
        }
    }
    return nullptr;
}

}  // namespace mserve
