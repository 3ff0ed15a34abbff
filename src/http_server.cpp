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
#include "http_server.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

#include <httplib.h>

#include "http_rest_api_handler.hpp"
#include "http_status_code.hpp"
#include "logging.hpp"
#include "rest_utils.hpp"
#include "status.hpp"

namespace mserve {

HTTPStatusCode http(const Status& status) {
    static const std::unordered_map<StatusCode, HTTPStatusCode> httpStatusMap = {
        {StatusCode::OK, HTTPStatusCode::OK},

        // REST handler failure
        {StatusCode::REST_INVALID_URL, HTTPStatusCode::NOT_FOUND},
        {StatusCode::REST_UNSUPPORTED_METHOD, HTTPStatusCode::NONE_ACC},
        {StatusCode::REST_METRICS_DISABLED, HTTPStatusCode::NOT_FOUND},
        {StatusCode::SERVER_NOT_LIVE, HTTPStatusCode::SERVICE_UNAV},

        // REST parser failure
        {StatusCode::JSON_INVALID, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_EMPTY_BODY, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_BODY_IS_NOT_AN_OBJECT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NO_INPUTS_FOUND, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_INPUTS_NOT_AN_ARRAY, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NO_INPUT_NAME, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_DUPLICATED_INPUT_NAME, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NO_SHAPE_FOUND, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NEGATIVE_SHAPE_DIMENSION, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NO_DATATYPE_FOUND, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NO_DATA_FOUND, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_COULD_NOT_PARSE_INPUT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_COULD_NOT_PARSE_OUTPUT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_REQUEST_ID_NOT_A_STRING, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_PARAMETERS_NOT_AN_OBJECT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_UNSUPPORTED_PRECISION, HTTPStatusCode::BAD_REQUEST},

        // Request validation
        {StatusCode::INVALID_SHAPE, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::INVALID_VALUE_COUNT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::INVALID_PRECISION, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::INVALID_UNEXPECTED_INPUT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::INVALID_MISSING_INPUT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::INVALID_MISSING_OUTPUT, HTTPStatusCode::BAD_REQUEST},

        // Model lifecycle
        {StatusCode::MODEL_NAME_MISSING, HTTPStatusCode::NOT_FOUND},
        {StatusCode::MODEL_VERSION_MISSING, HTTPStatusCode::NOT_FOUND},
        {StatusCode::MODEL_NOT_READY, HTTPStatusCode::SERVICE_UNAV},

        // Inference
        {StatusCode::PREDICTION_NUMERICAL_ERROR, HTTPStatusCode::ERROR},
        {StatusCode::PREDICTION_INVALID_INPUT, HTTPStatusCode::ERROR},
        {StatusCode::PREDICTION_INTERNAL_ERROR, HTTPStatusCode::ERROR},
    };
    auto it = httpStatusMap.find(status.getCode());
    if (it != httpStatusMap.end()) {
        return it->second;
    } else {
        return HTTPStatusCode::ERROR;
    }
}

std::unique_ptr<CppHttpLibHttpServer> createAndStartCppHttpLibHttpServer(const std::string& address, int port, int num_threads, Servable& servable, const MetricRegistry* registry) {
    auto server = std::make_unique<CppHttpLibHttpServer>(num_threads, port, address);
    auto handler = std::make_shared<HttpRestApiHandler>(servable, registry);
    server->registerRequestDispatcher([handler](const httplib::Request& req, httplib::Response& res) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Processing HTTP request: {} {} body: {} bytes",
            req.method,
            req.path,
            req.body.size());

        std::string output;
        HttpResponseComponents responseComponents;
        InferenceDispatcher::CancellationCheck isCancelled = [&req]() {
            return req.is_connection_closed && req.is_connection_closed();
        };

        const auto status = handler->processRequest(
            req.method,
            req.path,
            req.body,
            &output,
            responseComponents,
            isCancelled);
        if (status == StatusCode::REQUEST_CANCELLED) {
            // Client is gone, nothing to respond to
            SPDLOG_LOGGER_DEBUG(rest_logger, "Dropping response to {} {}, client disconnected", req.method, req.path);
            return;
        }
        if (!status.ok() && output.empty()) {
            makeJsonFromStatus(status, &output);
        }

        const auto http_status = http(status);
        if (http_status != HTTPStatusCode::OK) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "Processing HTTP/REST request failed: {} {}. Reason: {}",
                req.method,
                req.path,
                status.string());
        }
        res.status = static_cast<int>(http_status);
        res.set_content(output, responseComponents.contentType);
    });
    if (!server->startAcceptingRequests()) {
        SPDLOG_LOGGER_ERROR(rest_logger, "Failed to start cpp-httplib server on {}:{}", address, port);
        return nullptr;
    }
    return server;
}

}  // namespace mserve
