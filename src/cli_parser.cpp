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
#include "cli_parser.hpp"

#include <stdexcept>
#include <string>

#include "mserve_exit_codes.hpp"
#include "server_settings.hpp"
#include "version.hpp"

namespace mserve {

std::variant<bool, std::pair<int, std::string>> CLIParser::parse(int argc, char** argv) {
    try {
        options = std::make_unique<cxxopts::Options>(argv[0], "KServe V2 inference server");

        // clang-format off
        options->add_options()
            ("h, help",
                "Show this help message and exit")
            ("version",
                "Show binary version")
            ("rest_port",
                "REST server port",
                cxxopts::value<uint32_t>()->default_value("8080"),
                "REST_PORT")
            ("rest_bind_address",
                "Network interface address to bind to for the REST API",
                cxxopts::value<std::string>()->default_value("0.0.0.0"),
                "REST_BIND_ADDRESS")
            ("rest_workers",
                "Number of worker threads in REST server. Default value depends on number of CPUs.",
                cxxopts::value<uint32_t>(),
                "REST_WORKERS")
            ("log_level",
                "serving log level - one of TRACE, DEBUG, INFO, WARNING, ERROR",
                cxxopts::value<std::string>()->default_value("INFO"), "LOG_LEVEL")
            ("log_path",
                "Optional path to the log file",
                cxxopts::value<std::string>(), "LOG_PATH")
            ("metrics_enable",
                "Flag enabling metrics endpoint on rest_port.",
                cxxopts::value<bool>()->default_value("true"),
                "METRICS")
            ("metrics_list",
                "Comma separated list of metrics. If unset, all metrics are enabled. Available: mserve_requests_total, mserve_request_errors_total, mserve_request_duration_seconds, mserve_active_requests, mserve_model_loaded, mserve_model_state.",
                cxxopts::value<std::string>()->default_value(""),
                "METRICS_LIST")
            ("metrics_buckets",
                "Comma separated, strictly increasing upper bounds in seconds of the request duration histogram.",
                cxxopts::value<std::string>()->default_value(""),
                "METRICS_BUCKETS")
            ("degraded_threshold",
                "Number of consecutive prediction failures marking the model as degraded. Zero disables degradation.",
                cxxopts::value<uint32_t>()->default_value("5"),
                "DEGRADED_THRESHOLD")
            ("degraded_window_seconds",
                "Time window in which consecutive failures are counted.",
                cxxopts::value<uint32_t>()->default_value("60"),
                "DEGRADED_WINDOW_SECONDS")
            ("load_timeout_seconds",
                "Maximum time for model load and warm up.",
                cxxopts::value<uint32_t>()->default_value("30"),
                "LOAD_TIMEOUT_SECONDS");
        // clang-format on

        result = std::make_unique<cxxopts::ParseResult>(options->parse(argc, argv));

        if (result->count("version")) {
            std::string project_name(PROJECT_NAME);
            std::string project_version(PROJECT_VERSION);
            return std::make_pair(MSERVE_EX_OK, project_name + " " + project_version + "\n");
        }

        if (result->count("help")) {
            return std::make_pair(MSERVE_EX_OK, options->help() + "\n");
        }
    } catch (const std::exception& e) {
        return std::make_pair(MSERVE_EX_USAGE, std::string("error parsing options: ") + e.what() + "\n");
    }
    return true;
}

void CLIParser::prepare(ServerSettings* serverSettings) {
    if (nullptr == result) {
        throw std::logic_error("Tried to prepare server settings without parse result");
    }

    serverSettings->restPort = result->operator[]("rest_port").as<uint32_t>();
    serverSettings->restBindAddress = result->operator[]("rest_bind_address").as<std::string>();
    serverSettings->metricsEnabled = result->operator[]("metrics_enable").as<bool>();
    serverSettings->metricsList = result->operator[]("metrics_list").as<std::string>();
    serverSettings->metricsBuckets = result->operator[]("metrics_buckets").as<std::string>();
    serverSettings->logLevel = result->operator[]("log_level").as<std::string>();
    serverSettings->degradedThreshold = result->operator[]("degraded_threshold").as<uint32_t>();
    serverSettings->degradedWindowSeconds = result->operator[]("degraded_window_seconds").as<uint32_t>();
    serverSettings->loadTimeoutSeconds = result->operator[]("load_timeout_seconds").as<uint32_t>();

    if (result->count("log_path"))
        serverSettings->logPath = result->operator[]("log_path").as<std::string>();

    if (result->count("rest_workers"))
        serverSettings->restWorkers = result->operator[]("rest_workers").as<uint32_t>();
}

}  // namespace mserve
