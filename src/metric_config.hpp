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

#include <string>
#include <unordered_set>
#include <vector>

namespace mserve {

extern const std::string METRIC_NAME_REQUESTS;
extern const std::string METRIC_NAME_REQUEST_ERRORS;
extern const std::string METRIC_NAME_REQUEST_DURATION;
extern const std::string METRIC_NAME_ACTIVE_REQUESTS;
extern const std::string METRIC_NAME_MODEL_LOADED;
extern const std::string METRIC_NAME_MODEL_STATE;

class Status;
/**
     * @brief This class represents metrics configuration
     */
class MetricConfig {
public:
    static const std::vector<double> DEFAULT_BUCKETS;

    bool metricsEnabled;
    std::string endpointsPath;
    std::vector<double> bucketBoundaries;

    bool isFamilyEnabled(const std::string& family) const;

    void setDefaultMetricsTo(bool enabled);
    /**
     * @brief Loads settings from command line values
     *
     * @param isEnabled metrics switch
     * @param metricsList comma separated family names, empty means all
     * @param buckets comma separated histogram bounds in seconds, empty means defaults
     */
    Status loadFromCLIString(bool isEnabled, const std::string& metricsList, const std::string& buckets = "");

    static Status parseBuckets(const std::string& buckets, std::vector<double>& boundaries);

    MetricConfig() :
        MetricConfig(false) {}

    MetricConfig(bool enabled) :
        metricsEnabled(enabled),
        endpointsPath("/metrics"),
        bucketBoundaries(DEFAULT_BUCKETS) {
        setDefaultMetricsTo(metricsEnabled);
    }

protected:
    std::unordered_set<std::string> enabledFamiliesList;

private:
    Status parseMetricsList(const std::string& metricsList);

    std::unordered_set<std::string> defaultMetricFamilies = {
        {METRIC_NAME_REQUESTS},
        {METRIC_NAME_REQUEST_ERRORS},
        {METRIC_NAME_REQUEST_DURATION},
        {METRIC_NAME_ACTIVE_REQUESTS},
        {METRIC_NAME_MODEL_LOADED},
        {METRIC_NAME_MODEL_STATE}};
};
}  // namespace mserve
