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
#include "rest_utils.hpp"

#include <cmath>
#include <type_traits>
#include <variant>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#pragma GCC diagnostic pop

#include "logging.hpp"
#include "version.hpp"
#include "timer.hpp"

namespace mserve {

enum : unsigned int {
    CONVERT,
    TIMER_END
};

namespace {
template <typename Writer>
void writeShape(Writer& writer, const signed_shape_t& shape) {
    writer.StartArray();
    for (auto dim : shape) {
        writer.Int64(dim);
    }
    writer.EndArray();
}

template <typename Writer>
void writeValues(Writer& writer, const Tensor::data_t& values) {
    writer.StartArray();
    std::visit([&writer](const auto& data) {
        using T = typename std::decay_t<decltype(data)>::value_type;
        for (const auto& value : data) {
            if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                if (std::isfinite(value)) {
                    writer.Double(static_cast<double>(value));
                } else {
                    writer.Null();
                }
            } else if constexpr (std::is_same_v<T, int32_t>) {
                writer.Int(value);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                writer.Int64(value);
            } else if constexpr (std::is_same_v<T, bool>) {
                writer.Bool(value);
            } else {
                writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
            }
        }
    },
        values);
    writer.EndArray();
}

template <typename Writer>
void writeTensorSpecs(Writer& writer, const std::vector<TensorSpec>& specs) {
    writer.StartArray();
    for (const auto& spec : specs) {
        writer.StartObject();
        writer.Key("name");
        writer.String(spec.name.c_str());
        writer.Key("datatype");
        writer.String(toString(spec.datatype).c_str());
        writer.Key("shape");
        writeShape(writer, spec.shape);
        writer.EndObject();
    }
    writer.EndArray();
}
}  // namespace

Status makeJsonFromInferenceResponse(const InferenceResponse& response, std::string* response_json) {
    Timer<TIMER_END> timer;
    using std::chrono::microseconds;
    timer.start(CONVERT);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetFormatOptions(rapidjson::kFormatSingleLineArray);
    writer.StartObject();
    writer.Key("id");
    writer.String(response.id.c_str(), static_cast<rapidjson::SizeType>(response.id.size()));
    writer.Key("model_name");
    writer.String(response.modelName.c_str());
    writer.Key("model_version");
    writer.String(response.modelVersion.c_str());
    writer.Key("outputs");
    writer.StartArray();
    for (const auto& tensor : response.outputs) {
        writer.StartObject();
        writer.Key("name");
        writer.String(tensor.getName().c_str());
        writer.Key("shape");
        writeShape(writer, tensor.getShape());
        writer.Key("datatype");
        writer.String(toString(tensor.getDatatype()).c_str());
        writer.Key("data");
        writeValues(writer, tensor.getValues());
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
    if (!writer.IsComplete()) {
        SPDLOG_LOGGER_ERROR(rest_logger, "Creating json from response failed");
        return StatusCode::JSON_SERIALIZATION_ERROR;
    }
    response_json->assign(buffer.GetString(), buffer.GetSize());

    timer.stop(CONVERT);
    SPDLOG_LOGGER_DEBUG(rest_logger, "Response to JSON conversion: {:.3f} ms", timer.elapsed<microseconds>(CONVERT) / 1000);
    return StatusCode::OK;
}

void makeJsonFromModelDescription(const ModelDescription& description, std::string* response_json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("name");
    writer.String(description.name.c_str());
    writer.Key("versions");
    writer.StartArray();
    writer.String(description.version.c_str());
    writer.EndArray();
    writer.Key("platform");
    writer.String(description.platform.c_str());
    writer.Key("inputs");
    writeTensorSpecs(writer, description.inputs);
    writer.Key("outputs");
    writeTensorSpecs(writer, description.outputs);
    writer.EndObject();
    response_json->assign(buffer.GetString(), buffer.GetSize());
}

void makeJsonFromStatus(const Status& status, std::string* response_json) {
    auto kind = errorKind(status.getCode());
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("error");
    writer.String(status.string().c_str());
    writer.Key("kind");
    writer.String(toString(kind).c_str());
    writer.Key("type");
    writer.String(errorClass(kind).c_str());
    writer.EndObject();
    response_json->assign(buffer.GetString(), buffer.GetSize());
}

void makeHealthJson(bool healthy, bool modelLoaded, const std::string& modelName, const std::string& state, std::string* response_json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("status");
    writer.String(healthy ? "ok" : "unhealthy");
    writer.Key("model_loaded");
    writer.Bool(modelLoaded);
    writer.Key("model");
    writer.String(modelName.c_str());
    writer.Key("state");
    writer.String(state.c_str());
    writer.EndObject();
    response_json->assign(buffer.GetString(), buffer.GetSize());
}

void makeReadyJson(bool ready, const std::string& state, std::string* response_json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("status");
    writer.String(ready ? "ready" : "not ready");
    writer.Key("state");
    writer.String(state.c_str());
    writer.EndObject();
    response_json->assign(buffer.GetString(), buffer.GetSize());
}

void makeProbeJson(const char* key, bool value, std::string* response_json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key(key);
    writer.Bool(value);
    writer.EndObject();
    response_json->assign(buffer.GetString(), buffer.GetSize());
}

void makeServerMetadataJson(std::string* response_json) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("name");
    writer.String(PROJECT_NAME);
    writer.Key("version");
    writer.String(PROJECT_VERSION);
    writer.Key("extensions");
    writer.StartArray();
    writer.EndArray();
    writer.EndObject();
    response_json->assign(buffer.GetString(), buffer.GetSize());
}

void makeServiceDescriptionJson(const std::string& modelName, const std::vector<std::string>& endpoints, std::string* response_json) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("service");
    writer.String(PROJECT_NAME);
    writer.Key("version");
    writer.String(PROJECT_VERSION);
    writer.Key("model");
    writer.String(modelName.c_str());
    writer.Key("endpoints");
    writer.StartArray();
    for (const auto& endpoint : endpoints) {
        writer.String(endpoint.c_str());
    }
    writer.EndArray();
    writer.EndObject();
    response_json->assign(buffer.GetString(), buffer.GetSize());
}

}  // namespace mserve
