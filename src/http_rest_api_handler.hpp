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

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "dispatcher.hpp"
#include "status.hpp"

namespace mserve {
class MetricRegistry;
class Servable;

enum RequestType { KFS_Infer,
    KFS_GetModelMetadata,
    KFS_GetModelReady,
    KFS_GetServerLive,
    KFS_GetServerReady,
    KFS_GetServerMetadata,
    Health,
    Ready,
    Metrics,
    ServiceDescription };

struct HttpRequestComponents {
    RequestType type;
    std::string_view http_method;
    std::string model_name;
    std::optional<std::string> model_version;
};

struct HttpResponseComponents {
    std::string contentType = "application/json";
};

using HandlerCallbackFn = std::function<Status(const HttpRequestComponents&, std::string&, const std::string&, HttpResponseComponents&, const InferenceDispatcher::CancellationCheck&)>;

std::string urlDecode(const std::string& encoded);

class HttpRestApiHandler {
public:
    static const std::string kfs_modelreadyRegexExp;
    static const std::string kfs_modelmetadataRegexExp;
    static const std::string kfs_inferRegexExp;

    static const std::string kfs_serverreadyRegexExp;
    static const std::string kfs_serverliveRegexExp;
    static const std::string kfs_servermetadataRegexExp;

    static const std::string healthRegexExp;
    static const std::string readyRegexExp;
    static const std::string metricsRegexExp;
    static const std::string serviceDescriptionRegexExp;

    /**
     * @brief Construct a new HttpRest Api Handler
     *
     * @param servable served model, has to outlive the handler
     * @param registry metrics registry, nullptr when metrics are disabled
     */
    HttpRestApiHandler(Servable& servable, const MetricRegistry* registry);

    Status parseRequestComponents(HttpRequestComponents& components,
        const std::string_view http_method,
        const std::string& request_path);

    void registerHandler(RequestType type, HandlerCallbackFn);
    void registerAll();

    Status dispatchToProcessor(
        const std::string& request_body,
        std::string* response,
        const HttpRequestComponents& request_components,
        HttpResponseComponents& response_components,
        const InferenceDispatcher::CancellationCheck& isCancelled);

    /**
     * @brief Process Request
     *
     * Response may be filled also when returned status is not ok, probes
     * describe unhealthy state in the body. Caller encodes an error body
     * only when response is left empty.
     *
     * @param http_method
     * @param request_path
     * @param request_body
     * @param response
     * @param responseComponents
     * @param isCancelled reports disconnected client, may be empty
     *
     * @return StatusCode
     */
    Status processRequest(
        const std::string_view http_method,
        const std::string_view request_path,
        const std::string& request_body,
        std::string* response,
        HttpResponseComponents& responseComponents,
        const InferenceDispatcher::CancellationCheck& isCancelled = nullptr);

    Status processInferKFSRequest(const HttpRequestComponents& request_components, std::string& response, const std::string& request_body, const InferenceDispatcher::CancellationCheck& isCancelled);
    Status processModelMetadataKFSRequest(const HttpRequestComponents& request_components, std::string& response);
    Status processModelReadyKFSRequest(const HttpRequestComponents& request_components, std::string& response);
    Status processServerLiveKFSRequest(std::string& response);
    Status processServerReadyKFSRequest(std::string& response);
    Status processServerMetadataKFSRequest(std::string& response);
    Status processHealth(std::string& response);
    Status processReady(std::string& response);
    Status processMetrics(std::string& response, HttpResponseComponents& response_components);
    Status processServiceDescription(std::string& response);

private:
    Status checkModelIdentity(const HttpRequestComponents& request_components) const;

    const std::regex kfs_modelreadyRegex;
    const std::regex kfs_modelmetadataRegex;
    const std::regex kfs_inferRegex;
    const std::regex kfs_serverreadyRegex;
    const std::regex kfs_serverliveRegex;
    const std::regex kfs_servermetadataRegex;
    const std::regex healthRegex;
    const std::regex readyRegex;
    const std::regex metricsRegex;
    const std::regex serviceDescriptionRegex;

    std::unordered_map<RequestType, HandlerCallbackFn> handlers;

    Servable& servable;
    const MetricRegistry* metricRegistry;
};

}  // namespace mserve
