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
#include "rest_parser.hpp"

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

#include "logging.hpp"

namespace mserve {

namespace {
template <typename T>
bool isValueOf(const rapidjson::Value& value);
template <typename T>
T valueOf(const rapidjson::Value& value);

template <>
bool isValueOf<float>(const rapidjson::Value& value) {
    return value.IsNumber() && std::fabs(value.GetDouble()) <= std::numeric_limits<float>::max();
}
template <>
float valueOf<float>(const rapidjson::Value& value) { return static_cast<float>(value.GetDouble()); }
template <>
bool isValueOf<double>(const rapidjson::Value& value) { return value.IsNumber(); }
template <>
double valueOf<double>(const rapidjson::Value& value) { return value.GetDouble(); }
template <>
bool isValueOf<int32_t>(const rapidjson::Value& value) { return value.IsInt(); }
template <>
int32_t valueOf<int32_t>(const rapidjson::Value& value) { return value.GetInt(); }
template <>
bool isValueOf<int64_t>(const rapidjson::Value& value) { return value.IsInt64(); }
template <>
int64_t valueOf<int64_t>(const rapidjson::Value& value) { return value.GetInt64(); }
template <>
bool isValueOf<bool>(const rapidjson::Value& value) { return value.IsBool(); }
template <>
bool valueOf<bool>(const rapidjson::Value& value) { return value.GetBool(); }
template <>
bool isValueOf<std::string>(const rapidjson::Value& value) { return value.IsString(); }
template <>
std::string valueOf<std::string>(const rapidjson::Value& value) { return std::string(value.GetString(), value.GetStringLength()); }

// Nested arrays are flattened in row-major order
template <typename T>
Status collectValues(const rapidjson::Value& node, std::vector<T>& values) {
    for (auto& value : node.GetArray()) {
        if (value.IsArray()) {
            auto status = collectValues(value, values);
            if (!status.ok()) {
                return status;
            }
            continue;
        }
        if (!isValueOf<T>(value)) {
            return StatusCode::REST_COULD_NOT_PARSE_INPUT;
        }
        values.push_back(valueOf<T>(value));
    }
    return StatusCode::OK;
}

template <typename T>
Status collectInto(const rapidjson::Value& node, Tensor::data_t& values) {
    std::vector<T> collected;
    auto status = collectValues(node, collected);
    if (!status.ok()) {
        return status;
    }
    values = std::move(collected);
    return StatusCode::OK;
}
}  // namespace

Status KFSRestParser::parseId(rapidjson::Value& node) {
    if (!node.IsString()) {
        return StatusCode::REST_REQUEST_ID_NOT_A_STRING;
    }
    request.id = std::string(node.GetString(), node.GetStringLength());
    return StatusCode::OK;
}

Status KFSRestParser::parseParameters(rapidjson::Value& node) {
    if (!node.IsObject()) {
        return StatusCode::REST_PARAMETERS_NOT_AN_OBJECT;
    }
    for (auto& parameter : node.GetObject()) {
        SPDLOG_LOGGER_TRACE(rest_logger, "Ignoring request parameter: {}", parameter.name.GetString());
    }
    return StatusCode::OK;
}

Status KFSRestParser::parseOutput(rapidjson::Value& node) {
    if (!node.IsObject()) {
        return StatusCode::REST_COULD_NOT_PARSE_OUTPUT;
    }
    auto nameItr = node.FindMember("name");
    if ((nameItr == node.MemberEnd()) || !(nameItr->value.IsString())) {
        return StatusCode::REST_COULD_NOT_PARSE_OUTPUT;
    }
    auto parametersItr = node.FindMember("parameters");
    if (parametersItr != node.MemberEnd()) {
        auto status = parseParameters(parametersItr->value);
        if (!status.ok()) {
            return status;
        }
    }
    request.requestedOutputs.emplace_back(nameItr->value.GetString(), nameItr->value.GetStringLength());
    return StatusCode::OK;
}

Status KFSRestParser::parseOutputs(rapidjson::Value& node) {
    if (!node.IsArray()) {
        return StatusCode::REST_COULD_NOT_PARSE_OUTPUT;
    }
    request.requestedOutputs.clear();
    for (auto& output : node.GetArray()) {
        auto status = parseOutput(output);
        if (!status.ok()) {
            return status;
        }
    }
    return StatusCode::OK;
}

Status KFSRestParser::parseData(rapidjson::Value& node, Datatype datatype, Tensor::data_t& values) {
    switch (datatype) {
    case Datatype::FP32:
        return collectInto<float>(node, values);
    case Datatype::FP64:
        return collectInto<double>(node, values);
    case Datatype::INT32:
        return collectInto<int32_t>(node, values);
    case Datatype::INT64:
        return collectInto<int64_t>(node, values);
    case Datatype::BOOL:
        return collectInto<bool>(node, values);
    case Datatype::BYTES: {
        auto status = collectInto<std::string>(node, values);
        if (!status.ok()) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "BYTES datatype used in REST request, but data contains non string JSON values");
        }
        return status;
    }
    default:
        return StatusCode::REST_UNSUPPORTED_PRECISION;
    }
}

Status KFSRestParser::parseInput(rapidjson::Value& node) {
    if (!node.IsObject()) {
        return StatusCode::REST_COULD_NOT_PARSE_INPUT;
    }

    auto nameItr = node.FindMember("name");
    if ((nameItr == node.MemberEnd()) || !(nameItr->value.IsString())) {
        return StatusCode::REST_NO_INPUT_NAME;
    }
    std::string name(nameItr->value.GetString(), nameItr->value.GetStringLength());
    if (request.findInput(name) != nullptr) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Input name: {} used more than once", name);
        return StatusCode::REST_DUPLICATED_INPUT_NAME;
    }

    auto shapeItr = node.FindMember("shape");
    if ((shapeItr == node.MemberEnd()) || !(shapeItr->value.IsArray())) {
        return StatusCode::REST_NO_SHAPE_FOUND;
    }
    signed_shape_t shape;
    for (auto& dim : shapeItr->value.GetArray()) {
        if (!dim.IsInt64()) {
            return StatusCode::REST_NO_SHAPE_FOUND;
        }
        if (dim.GetInt64() < 0) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "Shape dimension is invalid: {}", dim.GetInt64());
            return StatusCode::REST_NEGATIVE_SHAPE_DIMENSION;
        }
        shape.push_back(dim.GetInt64());
    }

    auto datatypeItr = node.FindMember("datatype");
    if ((datatypeItr == node.MemberEnd()) || !(datatypeItr->value.IsString())) {
        return StatusCode::REST_NO_DATATYPE_FOUND;
    }
    Datatype datatype = fromString(datatypeItr->value.GetString());
    if (datatype == Datatype::UNDEFINED) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Input: {} has unsupported datatype: {}", name, datatypeItr->value.GetString());
        return Status(StatusCode::REST_UNSUPPORTED_PRECISION, datatypeItr->value.GetString());
    }

    auto parametersItr = node.FindMember("parameters");
    if (parametersItr != node.MemberEnd()) {
        auto status = parseParameters(parametersItr->value);
        if (!status.ok()) {
            return status;
        }
    }

    auto dataItr = node.FindMember("data");
    if ((dataItr == node.MemberEnd()) || !(dataItr->value.IsArray())) {
        return StatusCode::REST_NO_DATA_FOUND;
    }
    Tensor::data_t values;
    auto status = parseData(dataItr->value, datatype, values);
    if (!status.ok()) {
        return Status(status.getCode(), "input: " + name);
    }
    request.inputs.emplace_back(std::move(name), std::move(shape), std::move(values));
    return StatusCode::OK;
}

Status KFSRestParser::parseInputs(rapidjson::Value& node) {
    if (!node.IsArray()) {
        return StatusCode::REST_INPUTS_NOT_AN_ARRAY;
    }
    if (node.GetArray().Size() == 0) {
        return StatusCode::REST_NO_INPUTS_FOUND;
    }
    request.inputs.clear();
    request.inputs.reserve(node.GetArray().Size());
    for (auto& input : node.GetArray()) {
        auto status = parseInput(input);
        if (!status.ok()) {
            return status;
        }
    }
    return StatusCode::OK;
}

Status KFSRestParser::parse(const char* json, size_t size) {
    request = InferenceRequest();
    if (json == nullptr || size == 0) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Request body is empty");
        return StatusCode::REST_EMPTY_BODY;
    }
    rapidjson::Document doc;
    if (doc.Parse(json, size).HasParseError()) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Request parsing is not a valid JSON");
        return StatusCode::JSON_INVALID;
    }
    if (!doc.IsObject()) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Request body is not an object");
        return StatusCode::REST_BODY_IS_NOT_AN_OBJECT;
    }
    auto idItr = doc.FindMember("id");
    if (idItr != doc.MemberEnd()) {
        auto status = parseId(idItr->value);
        if (!status.ok()) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "Parsing request ID failed");
            return status;
        }
    }

    auto parametersItr = doc.FindMember("parameters");
    if (parametersItr != doc.MemberEnd()) {
        auto status = parseParameters(parametersItr->value);
        if (!status.ok()) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "Parsing request parameters failed");
            return status;
        }
    }

    auto outputsItr = doc.FindMember("outputs");
    if (outputsItr != doc.MemberEnd()) {
        auto status = parseOutputs(outputsItr->value);
        if (!status.ok()) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "Parsing request outputs failed");
            return status;
        }
    }

    auto inputsItr = doc.FindMember("inputs");
    if (inputsItr == doc.MemberEnd()) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "No inputs found in request");
        return StatusCode::REST_NO_INPUTS_FOUND;
    }
    auto status = parseInputs(inputsItr->value);
    if (!status.ok()) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Parsing request inputs failed: {}", status.string());
        return status;
    }

    return StatusCode::OK;
}

Status decodeInferenceRequest(const std::string& body, InferenceRequest& request) {
    KFSRestParser parser;
    auto status = parser.parse(body);
    if (!status.ok()) {
        return status;
    }
    request = std::move(parser.getRequest());
    return StatusCode::OK;
}

}  // namespace mserve
