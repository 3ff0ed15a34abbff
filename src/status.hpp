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

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace mserve {

enum class StatusCode {
    OK, /*!< Success */

    NOT_IMPLEMENTED,
    INTERNAL_ERROR,
    JSON_SERIALIZATION_ERROR, /*!< Data serialization to json format failed */

    // Request decoding
    JSON_INVALID,                   /*!< The request body is not valid json */
    REST_EMPTY_BODY,                /*!< The request body is empty */
    REST_BODY_IS_NOT_AN_OBJECT,     /*!< The request body is not a json object */
    REST_NO_INPUTS_FOUND,           /*!< Missing inputs field */
    REST_INPUTS_NOT_AN_ARRAY,       /*!< Inputs field is not an array */
    REST_NO_INPUT_NAME,             /*!< Input has no name or name is not a string */
    REST_DUPLICATED_INPUT_NAME,     /*!< Two inputs share the same name */
    REST_NO_SHAPE_FOUND,            /*!< Input has no shape or shape is not an array of integers */
    REST_NEGATIVE_SHAPE_DIMENSION,  /*!< Input shape contains a negative dimension */
    REST_NO_DATATYPE_FOUND,         /*!< Input has no datatype or datatype is not a string */
    REST_NO_DATA_FOUND,             /*!< Input has no data or data is not an array */
    REST_COULD_NOT_PARSE_INPUT,     /*!< Data value type does not fit declared datatype */
    REST_COULD_NOT_PARSE_OUTPUT,    /*!< Requested outputs field is malformed */
    REST_REQUEST_ID_NOT_A_STRING,   /*!< Request id is not a string */
    REST_PARAMETERS_NOT_AN_OBJECT,  /*!< Parameters field is not an object */
    REST_UNSUPPORTED_PRECISION,     /*!< Datatype is outside of supported set */

    // Request validation
    INVALID_SHAPE,            /*!< Shape is incompatible with the model input */
    INVALID_VALUE_COUNT,      /*!< Number of values does not match the shape */
    INVALID_PRECISION,        /*!< Datatype not accepted by the model input */
    INVALID_UNEXPECTED_INPUT, /*!< Input name unknown to the model */
    INVALID_MISSING_INPUT,    /*!< Missing one or more of inputs */
    INVALID_MISSING_OUTPUT,   /*!< Requested output unknown to the model */

    // Model lifecycle
    MODEL_NAME_MISSING,        /*!< Model with requested name is not found */
    MODEL_VERSION_MISSING,     /*!< Model with requested version is not found */
    MODEL_NOT_READY,           /*!< Model is not in ready state */
    MODEL_LOAD_FAILED,         /*!< Model load failed */
    MODEL_LOAD_TIMEOUT,        /*!< Model load did not finish in time */
    MODEL_WARMUP_FAILED,       /*!< Warm up inference failed */
    MODEL_ALREADY_LOADED,      /*!< Model load was requested more than once */

    // Prediction
    PREDICTION_NUMERICAL_ERROR, /*!< Non finite value in model computation */
    PREDICTION_INVALID_INPUT,   /*!< Input out of range for the model */
    PREDICTION_INTERNAL_ERROR,  /*!< Unexpected runtime failure */

    // REST handler
    REST_INVALID_URL,       /*!< Malformed REST request url */
    REST_UNSUPPORTED_METHOD, /*!< Request sent with unsupported method */
    REST_METRICS_DISABLED,   /*!< Metrics endpoint requested while metrics are disabled */
    SERVER_NOT_LIVE,         /*!< Liveness probe failed */
    UNKNOWN_REQUEST_COMPONENTS_TYPE, /*!< No handler registered for the request type */
    REQUEST_CANCELLED,       /*!< Client disconnected before the response was produced */

    // Metrics
    INVALID_METRICS_BUCKETS,     /*!< Histogram buckets are not strictly increasing positive values */
    INVALID_METRICS_FAMILY_NAME, /*!< Unknown name in metrics list */

    // Server start
    OPTIONS_USAGE_ERROR,
    FAILED_TO_START_REST_SERVER,
    SERVER_ALREADY_STARTED,
    MODULE_ALREADY_INSERTED,

    STATUS_CODE_END
};

class Status {
    StatusCode code;
    std::unique_ptr<std::string> message;

    static const std::unordered_map<const StatusCode, const std::string> statusMessageMap;

    void appendDetails(const std::string& details) {
        ensureMessageAllocated();
        *this->message += " - " + details;
    }

public:
    void ensureMessageAllocated() {
        if (nullptr == message) {
            message = std::make_unique<std::string>();
        }
    }

    Status(StatusCode code = StatusCode::OK) :
        code(code) {
        if (code == StatusCode::OK) {
            return;
        }
        auto it = statusMessageMap.find(code);
        if (it != statusMessageMap.end())
            this->message = std::make_unique<std::string>(it->second);
        else
            this->message = std::make_unique<std::string>("Undefined error");
    }

    Status(StatusCode code, const std::string& details) :
        Status(code) {
        appendDetails(details);
    }

    Status(const Status& rhs) :
        code(rhs.code),
        message(rhs.message != nullptr ? std::make_unique<std::string>(*(rhs.message)) : nullptr) {}

    Status(Status&& rhs) = default;

    Status& operator=(const Status& rhs) {
        this->code = rhs.code;
        this->message = (rhs.message != nullptr ? std::make_unique<std::string>(*rhs.message) : nullptr);
        return *this;
    }

    Status& operator=(Status&&) = default;

    bool ok() const {
        return code == StatusCode::OK;
    }

    const StatusCode getCode() const {
        return this->code;
    }

    bool operator==(const Status& status) const {
        return this->code == status.code;
    }

    bool operator!=(const Status& status) const {
        return this->code != status.code;
    }

    const std::string& string() const {
        return this->message ? *this->message : statusMessageMap.at(code);
    }
    operator const std::string&() const {
        return this->string();
    }
};

/**
 * @brief Error family a status code belongs to
 */
enum class ErrorKind {
    None,
    MalformedPayload,
    UnsupportedDatatype,
    ShapeMismatch,
    DatatypeMismatch,
    UnknownInput,
    MissingInput,
    UnknownOutput,
    ModelNotFound,
    RouteNotFound,
    ServiceUnavailable,
    PredictionError,
    LoadError,
    Cancelled,
    Internal,
};

ErrorKind errorKind(StatusCode code);
const std::string& toString(ErrorKind kind);

/**
 * @brief Class of the failure used in responses, either a client error or a server side one
 */
const std::string& errorClass(ErrorKind kind);

#define RETURN_IF_ERR(X)   \
    {                      \
        auto status = (X); \
        if (!status.ok())  \
            return status; \
    }
}  // namespace mserve
