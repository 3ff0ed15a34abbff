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
#include "http_rest_api_handler.hpp"

#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "metric_registry.hpp"
#include "model.hpp"
#include "model_state.hpp"
#include "rest_utils.hpp"
#include "servable.hpp"

namespace mserve {

const std::string HttpRestApiHandler::kfs_modelreadyRegexExp =
    R"(/v2/models/([^/]+)(?:/versions/([^/]+))?(?:/(ready)))";
const std::string HttpRestApiHandler::kfs_modelmetadataRegexExp =
    R"(/v2/models/([^/]+)(?:/versions/([^/]+))?(?:/)?)";
const std::string HttpRestApiHandler::kfs_inferRegexExp =
    R"(/v2/models/([^/]+)(?:/versions/([^/]+))?(?:/(infer)))";
const std::string HttpRestApiHandler::kfs_serverreadyRegexExp =
    R"(/v2/health/ready)";
const std::string HttpRestApiHandler::kfs_serverliveRegexExp =
    R"(/v2/health/live)";
const std::string HttpRestApiHandler::kfs_servermetadataRegexExp =
    R"(/v2/?)";

const std::string HttpRestApiHandler::healthRegexExp = R"(/health)";
const std::string HttpRestApiHandler::readyRegexExp = R"(/ready)";
const std::string HttpRestApiHandler::metricsRegexExp = R"((.?)\/metrics(\?(.*))?)";
const std::string HttpRestApiHandler::serviceDescriptionRegexExp = R"(/?)";

static const std::vector<std::string> SERVICE_ENDPOINTS{
    "POST /v2/models/{name}[/versions/{version}]/infer",
    "GET /v2/models/{name}[/versions/{version}]",
    "GET /v2/models/{name}[/versions/{version}]/ready",
    "GET /v2/health/live",
    "GET /v2/health/ready",
    "GET /v2",
    "GET /health",
    "GET /ready",
    "GET /metrics"};

HttpRestApiHandler::HttpRestApiHandler(Servable& servable, const MetricRegistry* registry) :
    kfs_modelreadyRegex(kfs_modelreadyRegexExp),
    kfs_modelmetadataRegex(kfs_modelmetadataRegexExp),
    kfs_inferRegex(kfs_inferRegexExp),
    kfs_serverreadyRegex(kfs_serverreadyRegexExp),
    kfs_serverliveRegex(kfs_serverliveRegexExp),
    kfs_servermetadataRegex(kfs_servermetadataRegexExp),
    healthRegex(healthRegexExp),
    readyRegex(readyRegexExp),
    metricsRegex(metricsRegexExp),
    serviceDescriptionRegex(serviceDescriptionRegexExp),
    servable(servable),
    metricRegistry(registry) {
    registerAll();
}

void HttpRestApiHandler::registerHandler(RequestType type, HandlerCallbackFn f) {
    handlers[type] = std::move(f);
}

void HttpRestApiHandler::registerAll() {
    registerHandler(KFS_Infer, [this](const HttpRequestComponents& request_components, std::string& response, const std::string& request_body, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck& isCancelled) -> Status {
        return processInferKFSRequest(request_components, response, request_body, isCancelled);
    });
    registerHandler(KFS_GetModelMetadata, [this](const HttpRequestComponents& request_components, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processModelMetadataKFSRequest(request_components, response);
    });
    registerHandler(KFS_GetModelReady, [this](const HttpRequestComponents& request_components, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processModelReadyKFSRequest(request_components, response);
    });
    registerHandler(KFS_GetServerLive, [this](const HttpRequestComponents&, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processServerLiveKFSRequest(response);
    });
    registerHandler(KFS_GetServerReady, [this](const HttpRequestComponents&, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processServerReadyKFSRequest(response);
    });
    registerHandler(KFS_GetServerMetadata, [this](const HttpRequestComponents&, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processServerMetadataKFSRequest(response);
    });
    registerHandler(Health, [this](const HttpRequestComponents&, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processHealth(response);
    });
    registerHandler(Ready, [this](const HttpRequestComponents&, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processReady(response);
    });
    registerHandler(Metrics, [this](const HttpRequestComponents&, std::string& response, const std::string&, HttpResponseComponents& response_components, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processMetrics(response, response_components);
    });
    registerHandler(ServiceDescription, [this](const HttpRequestComponents&, std::string& response, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&) -> Status {
        return processServiceDescription(response);
    });
}

Status HttpRestApiHandler::dispatchToProcessor(
    const std::string& request_body,
    std::string* response,
    const HttpRequestComponents& request_components,
    HttpResponseComponents& response_components,
    const InferenceDispatcher::CancellationCheck& isCancelled) {

    auto handler = handlers.find(request_components.type);
    if (handler != handlers.end()) {
        return handler->second(request_components, *response, request_body, response_components, isCancelled);
    }
    return StatusCode::UNKNOWN_REQUEST_COMPONENTS_TYPE;
}

Status HttpRestApiHandler::checkModelIdentity(const HttpRequestComponents& request_components) const {
    const auto& description = servable.describe();
    if (request_components.model_name != description.name) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Requested model: {} is not served", request_components.model_name);
        return Status(StatusCode::MODEL_NAME_MISSING, request_components.model_name);
    }
    if (request_components.model_version.has_value() && request_components.model_version.value() != description.version) {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Requested model: {} version: {} is not served", request_components.model_name, request_components.model_version.value());
        return Status(StatusCode::MODEL_VERSION_MISSING, request_components.model_version.value());
    }
    return StatusCode::OK;
}

Status HttpRestApiHandler::processInferKFSRequest(const HttpRequestComponents& request_components, std::string& response, const std::string& request_body, const InferenceDispatcher::CancellationCheck& isCancelled) {
    SPDLOG_LOGGER_DEBUG(rest_logger, "Processing REST request for model: {}; version: {}",
        request_components.model_name, request_components.model_version.value_or("default"));
    RETURN_IF_ERR(checkModelIdentity(request_components));
    return servable.getDispatcher().dispatch(request_body, response, isCancelled);
}

Status HttpRestApiHandler::processModelMetadataKFSRequest(const HttpRequestComponents& request_components, std::string& response) {
    RETURN_IF_ERR(checkModelIdentity(request_components));
    makeJsonFromModelDescription(servable.describe(), &response);
    return StatusCode::OK;
}

Status HttpRestApiHandler::processModelReadyKFSRequest(const HttpRequestComponents& request_components, std::string& response) {
    RETURN_IF_ERR(checkModelIdentity(request_components));
    bool ready = servable.getState().isReady();
    makeProbeJson("ready", ready, &response);
    return ready ? StatusCode::OK : StatusCode::MODEL_NOT_READY;
}

Status HttpRestApiHandler::processServerLiveKFSRequest(std::string& response) {
    bool live = servable.getState().isLive();
    makeProbeJson("live", live, &response);
    return live ? StatusCode::OK : StatusCode::SERVER_NOT_LIVE;
}

Status HttpRestApiHandler::processServerReadyKFSRequest(std::string& response) {
    bool ready = servable.getState().isReady();
    makeProbeJson("ready", ready, &response);
    return ready ? StatusCode::OK : StatusCode::MODEL_NOT_READY;
}

Status HttpRestApiHandler::processServerMetadataKFSRequest(std::string& response) {
    makeServerMetadataJson(&response);
    return StatusCode::OK;
}

Status HttpRestApiHandler::processHealth(std::string& response) {
    const auto& state = servable.getState();
    bool live = state.isLive();
    makeHealthJson(live, state.isLoaded(), servable.describe().name, state.getStateString(), &response);
    return live ? StatusCode::OK : StatusCode::SERVER_NOT_LIVE;
}

Status HttpRestApiHandler::processReady(std::string& response) {
    const auto& state = servable.getState();
    bool ready = state.isReady();
    makeReadyJson(ready, state.getStateString(), &response);
    return ready ? StatusCode::OK : StatusCode::MODEL_NOT_READY;
}

Status HttpRestApiHandler::processMetrics(std::string& response, HttpResponseComponents& response_components) {
    if (nullptr == metricRegistry) {
        return StatusCode::REST_METRICS_DISABLED;
    }
    response = metricRegistry->collect();
    response_components.contentType = "text/plain; version=0.0.4; charset=utf-8";
    return StatusCode::OK;
}

Status HttpRestApiHandler::processServiceDescription(std::string& response) {
    makeServiceDescriptionJson(servable.describe().name, SERVICE_ENDPOINTS, &response);
    return StatusCode::OK;
}

Status HttpRestApiHandler::parseRequestComponents(HttpRequestComponents& requestComponents,
    const std::string_view http_method,
    const std::string& request_path) {
    std::smatch sm;
    requestComponents.http_method = http_method;

    if (http_method == "POST") {
        if (std::regex_match(request_path, sm, kfs_inferRegex)) {
            requestComponents.type = KFS_Infer;
            requestComponents.model_name = urlDecode(sm[1]);
            std::string model_version_str = sm[2];
            if (!model_version_str.empty()) {
                requestComponents.model_version = urlDecode(model_version_str);
            }
            return StatusCode::OK;
        }
    } else if (http_method == "GET") {
        if (std::regex_match(request_path, sm, kfs_modelreadyRegex)) {
            requestComponents.type = KFS_GetModelReady;
            requestComponents.model_name = urlDecode(sm[1]);
            std::string model_version_str = sm[2];
            if (!model_version_str.empty()) {
                requestComponents.model_version = urlDecode(model_version_str);
            }
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, kfs_modelmetadataRegex)) {
            requestComponents.type = KFS_GetModelMetadata;
            requestComponents.model_name = urlDecode(sm[1]);
            std::string model_version_str = sm[2];
            if (!model_version_str.empty()) {
                requestComponents.model_version = urlDecode(model_version_str);
            }
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, kfs_serverliveRegex)) {
            requestComponents.type = KFS_GetServerLive;
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, kfs_serverreadyRegex)) {
            requestComponents.type = KFS_GetServerReady;
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, kfs_servermetadataRegex)) {
            requestComponents.type = KFS_GetServerMetadata;
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, healthRegex)) {
            requestComponents.type = Health;
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, readyRegex)) {
            requestComponents.type = Ready;
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, metricsRegex)) {
            requestComponents.type = Metrics;
            return StatusCode::OK;
        }
        if (std::regex_match(request_path, sm, serviceDescriptionRegex)) {
            requestComponents.type = ServiceDescription;
            return StatusCode::OK;
        }
    }

    // route exists but was requested with different method
    return (std::regex_match(request_path, sm, kfs_inferRegex) ||
               std::regex_match(request_path, sm, kfs_modelreadyRegex) ||
               std::regex_match(request_path, sm, kfs_modelmetadataRegex) ||
               std::regex_match(request_path, sm, kfs_serverliveRegex) ||
               std::regex_match(request_path, sm, kfs_serverreadyRegex) ||
               std::regex_match(request_path, sm, kfs_servermetadataRegex) ||
               std::regex_match(request_path, sm, healthRegex) ||
               std::regex_match(request_path, sm, readyRegex) ||
               std::regex_match(request_path, sm, metricsRegex) ||
               std::regex_match(request_path, sm, serviceDescriptionRegex))
               ? StatusCode::REST_UNSUPPORTED_METHOD
               : StatusCode::REST_INVALID_URL;
}

Status HttpRestApiHandler::processRequest(
    const std::string_view http_method,
    const std::string_view request_path,
    const std::string& request_body,
    std::string* response,
    HttpResponseComponents& responseComponents,
    const InferenceDispatcher::CancellationCheck& isCancelled) {

    std::string request_path_str(request_path);
    HttpRequestComponents requestComponents;
    auto status = parseRequestComponents(requestComponents, http_method, request_path_str);

    if (!status.ok())
        return status;

    response->clear();
    return dispatchToProcessor(request_body, response, requestComponents, responseComponents, isCancelled);
}

std::string urlDecode(const std::string& encoded) {
    std::ostringstream decoded;
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size() &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            decoded << static_cast<char>(std::stoi(encoded.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            decoded << encoded[i];
        }
    }
    return decoded.str();
}

}  // namespace mserve
