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
#include "status.hpp"

namespace mserve {

const std::unordered_map<const StatusCode, const std::string> Status::statusMessageMap = {
    {StatusCode::OK, ""},

    {StatusCode::NOT_IMPLEMENTED, "Functionality not implemented"},
    {StatusCode::INTERNAL_ERROR, "Internal server error"},
    {StatusCode::JSON_SERIALIZATION_ERROR, "Data serialization to json format failed"},

    // Request decoding
    {StatusCode::JSON_INVALID, "The request body is not valid json"},
    {StatusCode::REST_EMPTY_BODY, "The request body is empty"},
    {StatusCode::REST_BODY_IS_NOT_AN_OBJECT, "Request body should be JSON object"},
    {StatusCode::REST_NO_INPUTS_FOUND, "Missing inputs in request"},
    {StatusCode::REST_INPUTS_NOT_AN_ARRAY, "Inputs field is not an array"},
    {StatusCode::REST_NO_INPUT_NAME, "Input name is missing or is not a string"},
    {StatusCode::REST_DUPLICATED_INPUT_NAME, "Input name is duplicated in request"},
    {StatusCode::REST_NO_SHAPE_FOUND, "Input shape is missing or is not an array of integers"},
    {StatusCode::REST_NEGATIVE_SHAPE_DIMENSION, "Input shape contains negative dimension"},
    {StatusCode::REST_NO_DATATYPE_FOUND, "Input datatype is missing or is not a string"},
    {StatusCode::REST_NO_DATA_FOUND, "Input data is missing or is not an array"},
    {StatusCode::REST_COULD_NOT_PARSE_INPUT, "Could not parse input content"},
    {StatusCode::REST_COULD_NOT_PARSE_OUTPUT, "Could not parse requested outputs"},
    {StatusCode::REST_REQUEST_ID_NOT_A_STRING, "Request id should be a string"},
    {StatusCode::REST_PARAMETERS_NOT_AN_OBJECT, "Parameters field should be JSON object"},
    {StatusCode::REST_UNSUPPORTED_PRECISION, "Could not parse input content. Not supported datatype"},

    // Request validation
    {StatusCode::INVALID_SHAPE, "Invalid input shape"},
    {StatusCode::INVALID_VALUE_COUNT, "Number of values does not match input shape"},
    {StatusCode::INVALID_PRECISION, "Invalid input datatype"},
    {StatusCode::INVALID_UNEXPECTED_INPUT, "Unexpected input name"},
    {StatusCode::INVALID_MISSING_INPUT, "Missing input with specific name"},
    {StatusCode::INVALID_MISSING_OUTPUT, "Requested output does not exist"},

    // Model lifecycle
    {StatusCode::MODEL_NAME_MISSING, "Model with requested name is not found"},
    {StatusCode::MODEL_VERSION_MISSING, "Model with requested version is not found"},
    {StatusCode::MODEL_NOT_READY, "Model is not ready"},
    {StatusCode::MODEL_LOAD_FAILED, "Error while loading a model"},
    {StatusCode::MODEL_LOAD_TIMEOUT, "Model load exceeded time limit"},
    {StatusCode::MODEL_WARMUP_FAILED, "Model warm up inference failed"},
    {StatusCode::MODEL_ALREADY_LOADED, "Model load was already requested"},

    // Prediction
    {StatusCode::PREDICTION_NUMERICAL_ERROR, "Non finite value during prediction"},
    {StatusCode::PREDICTION_INVALID_INPUT, "Input value out of range for prediction"},
    {StatusCode::PREDICTION_INTERNAL_ERROR, "Internal prediction error"},

    // REST handler
    {StatusCode::REST_INVALID_URL, "Malformed REST request url"},
    {StatusCode::REST_UNSUPPORTED_METHOD, "Unsupported method"},
    {StatusCode::REST_METRICS_DISABLED, "Metrics are disabled"},
    {StatusCode::SERVER_NOT_LIVE, "Server is not live"},
    {StatusCode::UNKNOWN_REQUEST_COMPONENTS_TYPE, "Request components type not recognized"},
    {StatusCode::REQUEST_CANCELLED, "Request cancelled by client"},

    // Metrics
    {StatusCode::INVALID_METRICS_BUCKETS, "Histogram buckets should be increasing positive values"},
    {StatusCode::INVALID_METRICS_FAMILY_NAME, "Invalid name in metrics_list"},

    // Server start
    {StatusCode::OPTIONS_USAGE_ERROR, "options validation error"},
    {StatusCode::FAILED_TO_START_REST_SERVER, "Failed to start REST server"},
    {StatusCode::SERVER_ALREADY_STARTED, "Server has already started"},
    {StatusCode::MODULE_ALREADY_INSERTED, "Module already inserted"},
};

ErrorKind errorKind(StatusCode code) {
    switch (code) {
    case StatusCode::OK:
        return ErrorKind::None;
    case StatusCode::JSON_INVALID:
    case StatusCode::REST_EMPTY_BODY:
    case StatusCode::REST_BODY_IS_NOT_AN_OBJECT:
    case StatusCode::REST_NO_INPUTS_FOUND:
    case StatusCode::REST_INPUTS_NOT_AN_ARRAY:
    case StatusCode::REST_NO_INPUT_NAME:
    case StatusCode::REST_DUPLICATED_INPUT_NAME:
    case StatusCode::REST_NO_SHAPE_FOUND:
    case StatusCode::REST_NEGATIVE_SHAPE_DIMENSION:
    case StatusCode::REST_NO_DATATYPE_FOUND:
    case StatusCode::REST_NO_DATA_FOUND:
    case StatusCode::REST_COULD_NOT_PARSE_INPUT:
    case StatusCode::REST_COULD_NOT_PARSE_OUTPUT:
    case StatusCode::REST_REQUEST_ID_NOT_A_STRING:
    case StatusCode::REST_PARAMETERS_NOT_AN_OBJECT:
        return ErrorKind::MalformedPayload;
    case StatusCode::REST_UNSUPPORTED_PRECISION:
        return ErrorKind::UnsupportedDatatype;
    case StatusCode::INVALID_SHAPE:
    case StatusCode::INVALID_VALUE_COUNT:
        return ErrorKind::ShapeMismatch;
    case StatusCode::INVALID_PRECISION:
        return ErrorKind::DatatypeMismatch;
    case StatusCode::INVALID_UNEXPECTED_INPUT:
        return ErrorKind::UnknownInput;
    case StatusCode::INVALID_MISSING_INPUT:
        return ErrorKind::MissingInput;
    case StatusCode::INVALID_MISSING_OUTPUT:
        return ErrorKind::UnknownOutput;
    case StatusCode::MODEL_NAME_MISSING:
    case StatusCode::MODEL_VERSION_MISSING:
        return ErrorKind::ModelNotFound;
    case StatusCode::REST_INVALID_URL:
    case StatusCode::REST_UNSUPPORTED_METHOD:
    case StatusCode::REST_METRICS_DISABLED:
        return ErrorKind::RouteNotFound;
    case StatusCode::MODEL_NOT_READY:
    case StatusCode::SERVER_NOT_LIVE:
        return ErrorKind::ServiceUnavailable;
    case StatusCode::PREDICTION_NUMERICAL_ERROR:
    case StatusCode::PREDICTION_INVALID_INPUT:
    case StatusCode::PREDICTION_INTERNAL_ERROR:
        return ErrorKind::PredictionError;
    case StatusCode::MODEL_LOAD_FAILED:
    case StatusCode::MODEL_LOAD_TIMEOUT:
    case StatusCode::MODEL_WARMUP_FAILED:
    case StatusCode::MODEL_ALREADY_LOADED:
        return ErrorKind::LoadError;
    case StatusCode::REQUEST_CANCELLED:
        return ErrorKind::Cancelled;
    default:
        return ErrorKind::Internal;
    }
}

const std::string& toString(ErrorKind kind) {
    static const std::unordered_map<ErrorKind, std::string> kindNames = {
        {ErrorKind::None, "None"},
        {ErrorKind::MalformedPayload, "MalformedPayload"},
        {ErrorKind::UnsupportedDatatype, "UnsupportedDatatype"},
        {ErrorKind::ShapeMismatch, "ShapeMismatch"},
        {ErrorKind::DatatypeMismatch, "DatatypeMismatch"},
        {ErrorKind::UnknownInput, "UnknownInput"},
        {ErrorKind::MissingInput, "MissingInput"},
        {ErrorKind::UnknownOutput, "UnknownOutput"},
        {ErrorKind::ModelNotFound, "ModelNotFound"},
        {ErrorKind::RouteNotFound, "RouteNotFound"},
        {ErrorKind::ServiceUnavailable, "ServiceUnavailable"},
        {ErrorKind::PredictionError, "PredictionError"},
        {ErrorKind::LoadError, "LoadError"},
        {ErrorKind::Cancelled, "Cancelled"},
        {ErrorKind::Internal, "Internal"}};
    return kindNames.at(kind);
}

const std::string& errorClass(ErrorKind kind) {
    static const std::string decodeError = "DecodeError";
    static const std::string validationError = "ValidationError";
    static const std::string serviceUnavailable = "ServiceUnavailable";
    static const std::string predictionError = "PredictionError";
    static const std::string loadError = "LoadError";
    static const std::string notFound = "NotFound";
    static const std::string internal = "InternalError";
    switch (kind) {
    case ErrorKind::MalformedPayload:
    case ErrorKind::UnsupportedDatatype:
        return decodeError;
    case ErrorKind::ShapeMismatch:
    case ErrorKind::DatatypeMismatch:
    case ErrorKind::UnknownInput:
    case ErrorKind::MissingInput:
    case ErrorKind::UnknownOutput:
        return validationError;
    case ErrorKind::ServiceUnavailable:
        return serviceUnavailable;
    case ErrorKind::PredictionError:
        return predictionError;
    case ErrorKind::LoadError:
        return loadError;
    case ErrorKind::ModelNotFound:
    case ErrorKind::RouteNotFound:
        return notFound;
    default:
        return internal;
    }
}
}  // namespace mserve
