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

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "metric.hpp"
#include "status.hpp"

namespace mserve {

class MetricRegistry;
class MetricConfig;

/**
 * @brief Request counters, latency histogram and lifecycle gauges of a single model
 *
 * All metrics are created in the constructor, so recording only touches
 * prometheus atomics and never allocates or locks shared maps.
 * Metric pointers stay null when metrics or a particular family are disabled.
 */
class ModelMetricReporter {
    MetricRegistry* registry;
    std::string modelName;

protected:
    std::vector<double> buckets;

public:
    ModelMetricReporter(const MetricConfig* metricConfig, MetricRegistry* registry, const std::string& modelName);
    virtual ~ModelMetricReporter();

    std::unique_ptr<MetricCounter> requestSuccess;
    std::unique_ptr<MetricCounter> requestFail;
    std::unordered_map<ErrorKind, std::unique_ptr<MetricCounter>> requestFailByKind;

    std::unique_ptr<MetricHistogram> requestDuration;

    std::unique_ptr<MetricGauge> activeRequests;
    std::unique_ptr<MetricGauge> modelLoaded;
    std::unique_ptr<MetricGauge> modelState;

    /**
     * @brief Records one finished dispatch. Errors are counted under kind of the status code.
     */
    void record(const Status& outcome, std::chrono::duration<double> duration);

    MetricGauge* getActiveRequestsMetric() { return this->activeRequests.get(); }

    const std::string& getModelName() const { return this->modelName; }
};

}  // namespace mserve
