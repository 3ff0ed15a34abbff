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
#include "metric_module.hpp"

#include "config.hpp"
#include "logging.hpp"
#include "metric_registry.hpp"
#include "module_names.hpp"

namespace mserve {

MetricModule::MetricModule() :
    registry(std::make_unique<MetricRegistry>()) {}

MetricModule::~MetricModule() {
    this->shutdown();
}

Status MetricModule::start(const mserve::Config& config) {
    state = ModuleState::STARTED_INITIALIZE;
    SPDLOG_INFO("{} starting", METRICS_MODULE_NAME);
    auto status = metricConfig.loadFromCLIString(config.metricsEnabled(), config.metricsList(), config.metricsBuckets());
    if (!status.ok()) {
        SPDLOG_ERROR("Invalid metrics configuration: {}", status.string());
        return status;
    }
    state = ModuleState::INITIALIZED;
    SPDLOG_INFO("{} started", METRICS_MODULE_NAME);
    return StatusCode::OK;
}

void MetricModule::shutdown() {
    if (state == ModuleState::SHUTDOWN)
        return;
    state = ModuleState::STARTED_SHUTDOWN;
    SPDLOG_INFO("{} shutting down", METRICS_MODULE_NAME);
    state = ModuleState::SHUTDOWN;
    SPDLOG_INFO("{} shutdown", METRICS_MODULE_NAME);
}

MetricRegistry& MetricModule::getRegistry() const {
    return *this->registry;
}

}  // namespace mserve
