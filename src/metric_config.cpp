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
#include "metric_config.hpp"

#include <sstream>
#include <string>
#include <utility>

#include "logging.hpp"
#include "status.hpp"
#include "stringutils.hpp"

namespace mserve {

const std::string METRIC_NAME_REQUESTS = "mserve_requests_total";
const std::string METRIC_NAME_REQUEST_ERRORS = "mserve_request_errors_total";
const std::string METRIC_NAME_REQUEST_DURATION = "mserve_request_duration_seconds";
const std::string METRIC_NAME_ACTIVE_REQUESTS = "mserve_active_requests";
const std::string METRIC_NAME_MODEL_LOADED = "mserve_model_loaded";
const std::string METRIC_NAME_MODEL_STATE = "mserve_model_state";

const std::vector<double> MetricConfig::DEFAULT_BUCKETS = {
    0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0};

Status MetricConfig::parseMetricsList(const std::string& metricsList) {
    this->enabledFamiliesList.clear();
    for (auto& metric : tokenize(metricsList, ',')) {
        trim(metric);
        if (metric.empty()) {
            continue;
        }
        if (this->defaultMetricFamilies.find(metric) == this->defaultMetricFamilies.end()) {
            SPDLOG_LOGGER_WARN(metrics_logger, "Metrics family name not supported: {}", metric);
            return Status(StatusCode::INVALID_METRICS_FAMILY_NAME, metric);
        }
        this->enabledFamiliesList.insert(metric);
    }
    return StatusCode::OK;
}

Status MetricConfig::parseBuckets(const std::string& buckets, std::vector<double>& boundaries) {
    std::vector<double> parsed;
    for (auto& token : tokenize(buckets, ',')) {
        trim(token);
        auto value = mserve::stod(token);
        if (!value.has_value()) {
            return Status(StatusCode::INVALID_METRICS_BUCKETS, token);
        }
        if (value.value() <= 0 || (!parsed.empty() && value.value() <= parsed.back())) {
            return Status(StatusCode::INVALID_METRICS_BUCKETS, token);
        }
        parsed.push_back(value.value());
    }
    if (parsed.empty()) {
        return StatusCode::INVALID_METRICS_BUCKETS;
    }
    boundaries = std::move(parsed);
    return StatusCode::OK;
}

bool MetricConfig::isFamilyEnabled(const std::string& family) const {
    return this->enabledFamiliesList.find(family) != this->enabledFamiliesList.end();
}

void MetricConfig::setDefaultMetricsTo(bool enabled) {
    this->enabledFamiliesList.clear();
    if (enabled) {
        for (const auto& family : this->defaultMetricFamilies) {
            this->enabledFamiliesList.insert(family);
        }
    }
}

Status MetricConfig::loadFromCLIString(bool isEnabled, const std::string& metricsList, const std::string& buckets) {
    this->metricsEnabled = isEnabled;
    if (!buckets.empty()) {
        auto status = parseBuckets(buckets, this->bucketBoundaries);
        if (!status.ok()) {
            SPDLOG_LOGGER_ERROR(metrics_logger, "Invalid histogram buckets: {}", status.string());
            return status;
        }
    }
    if (!isEnabled || metricsList.empty()) {
        setDefaultMetricsTo(isEnabled);
    } else {
        auto status = parseMetricsList(metricsList);
        if (!status.ok()) {
            return status;
        }
    }
    if (this->metricsEnabled) {
        SPDLOG_LOGGER_INFO(metrics_logger, "Metrics enabled.");
        std::stringstream ss;
        for (const auto& family : this->enabledFamiliesList) {
            ss << family << ", ";
        }
        SPDLOG_LOGGER_DEBUG(metrics_logger, "Enabled metrics list: {}", ss.str());
    }
    return StatusCode::OK;
}

}  // namespace mserve
