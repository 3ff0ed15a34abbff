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
#include "config.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <regex>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <netdb.h>

#include "cli_parser.hpp"
#include "metric_config.hpp"
#include "mserve_exit_codes.hpp"
#include "status.hpp"

namespace mserve {

const uint32_t AVAILABLE_CORES = std::max(1u, std::thread::hardware_concurrency());
const uint32_t MAX_PORT_NUMBER = std::numeric_limits<uint16_t>::max();

const uint64_t DEFAULT_REST_WORKERS = AVAILABLE_CORES;
const uint64_t MAX_REST_WORKERS = 10'000;

Config& Config::parse(int argc, char** argv) {
    mserve::CLIParser parser;
    mserve::ServerSettings serverSettings;
    auto successOrExit = parser.parse(argc, argv);
    // Check for error in parsing
    if (std::holds_alternative<std::pair<int, std::string>>(successOrExit)) {
        auto printAndExit = std::get<std::pair<int, std::string>>(successOrExit);
        if (printAndExit.first > 0) {
            std::cerr << printAndExit.second;
        } else {
            std::cout << printAndExit.second;
        }
        exit(printAndExit.first);
    }
    parser.prepare(&serverSettings);
    if (!this->parse(&serverSettings))
        exit(MSERVE_EX_USAGE);
    return *this;
}

bool Config::parse(ServerSettings* serverSettings) {
    this->serverSettings = *serverSettings;
    return validate();
}

bool Config::is_ipv6(const std::string& s) {
    addrinfo hints{};
    hints.ai_family = AF_INET6;
    hints.ai_flags = AI_NUMERICHOST;
    addrinfo* res = nullptr;
    const int rc = getaddrinfo(s.c_str(), nullptr, &hints, &res);
    if (res) {
        freeaddrinfo(res);
    }
    return rc == 0;
}

bool Config::check_hostname_or_ip(const std::string& input) {
    if (input.size() > 255) {
        return false;
    }
    bool all_numeric = true;
    for (char c : input) {
        if (c == '.' || c == ':') {
            continue;
        }
        if (!::isxdigit(c)) {
            all_numeric = false;
        }
    }
    if (all_numeric) {
        static const std::regex valid_ipv4_regex("^(([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])\\.){3}([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])$");
        return std::regex_match(input, valid_ipv4_regex) || is_ipv6(input);
    } else {
        static const std::regex valid_hostname_regex("^(([a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9\\-]*[a-zA-Z0-9])\\.)*([A-Za-z0-9]|[A-Za-z0-9][A-Za-z0-9\\-]*[A-Za-z0-9])$");
        return std::regex_match(input, valid_hostname_regex);
    }
}

bool Config::validate() {
    if (restPort() == 0 || restPort() > MAX_PORT_NUMBER) {
        std::cerr << "rest_port number out of range from 1 to " << MAX_PORT_NUMBER << std::endl;
        return false;
    }

    if ((restWorkers() > MAX_REST_WORKERS) || (restWorkers() < 1)) {
        std::cerr << "rest_workers count should be from 1 to " << MAX_REST_WORKERS << std::endl;
        return false;
    }

    // check bind address:
    if (restBindAddress().empty() || check_hostname_or_ip(restBindAddress()) == false) {
        std::cerr << "rest_bind_address has invalid format: proper hostname or IP address expected." << std::endl;
        return false;
    }

    // check log_level values
    std::vector<std::string> v({"TRACE", "DEBUG", "INFO", "WARNING", "ERROR"});
    if (std::find(v.begin(), v.end(), logLevel()) == v.end()) {
        std::cerr << "log_level should be one of: TRACE, DEBUG, INFO, WARNING, ERROR" << std::endl;
        return false;
    }

    if (!metricsEnabled() && (!metricsList().empty() || !metricsBuckets().empty())) {
        std::cerr << "metrics_list and metrics_buckets require metrics_enable" << std::endl;
        return false;
    }

    if (!metricsBuckets().empty()) {
        std::vector<double> boundaries;
        auto status = MetricConfig::parseBuckets(metricsBuckets(), boundaries);
        if (!status.ok()) {
            std::cerr << "metrics_buckets: " << status.string() << std::endl;
            return false;
        }
    }

    if (degradedWindow().count() == 0) {
        std::cerr << "degraded_window_seconds has to be greater than 0" << std::endl;
        return false;
    }

    if (loadTimeout().count() == 0) {
        std::cerr << "load_timeout_seconds has to be greater than 0" << std::endl;
        return false;
    }
    return true;
}

uint32_t Config::restPort() const { return this->serverSettings.restPort; }
const std::string& Config::restBindAddress() const { return this->serverSettings.restBindAddress; }
uint32_t Config::restWorkers() const { return this->serverSettings.restWorkers.value_or(DEFAULT_REST_WORKERS); }
const std::string& Config::logLevel() const { return this->serverSettings.logLevel; }
const std::string& Config::logPath() const { return this->serverSettings.logPath; }
bool Config::metricsEnabled() const { return this->serverSettings.metricsEnabled; }
const std::string& Config::metricsList() const { return this->serverSettings.metricsList; }
const std::string& Config::metricsBuckets() const { return this->serverSettings.metricsBuckets; }
uint32_t Config::degradedThreshold() const { return this->serverSettings.degradedThreshold; }
std::chrono::seconds Config::degradedWindow() const { return std::chrono::seconds(this->serverSettings.degradedWindowSeconds); }
std::chrono::seconds Config::loadTimeout() const { return std::chrono::seconds(this->serverSettings.loadTimeoutSeconds); }

}  // namespace mserve
