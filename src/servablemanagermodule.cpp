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
#include "servablemanagermodule.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "config.hpp"
#include "iris_model.hpp"
#include "logging.hpp"
#include "metric_module.hpp"
#include "module_names.hpp"
#include "servable.hpp"
#include "server.hpp"

namespace mserve {

static const MetricModule& getMetricModule(mserve::Server& server) {
    auto module = server.getModule(METRICS_MODULE_NAME);
    if (nullptr == module) {
        const char* message = "Tried to create servable manager module without metrics module";
        SPDLOG_ERROR(message);
        throw std::logic_error(message);
    }
    return dynamic_cast<const MetricModule&>(*module);
}

ServableManagerModule::ServableManagerModule(mserve::Server& server) :
    metricModule(getMetricModule(server)) {}

Status ServableManagerModule::start(const mserve::Config& config) {
    state = ModuleState::STARTED_INITIALIZE;
    SPDLOG_INFO("{} starting", SERVABLE_MANAGER_MODULE_NAME);
    ServableSettings settings;
    settings.degradedThreshold = config.degradedThreshold();
    settings.degradedWindow = config.degradedWindow();
    settings.loadTimeout = config.loadTimeout();
    try {
        this->servable = std::make_unique<Servable>(std::make_unique<IrisClassifier>(),
            &metricModule.getMetricConfig(), &metricModule.getRegistry(), settings);
    } catch (const std::logic_error& e) {
        SPDLOG_ERROR("Failed to create servable: {}", e.what());
        return Status(StatusCode::INTERNAL_ERROR, e.what());
    }
    auto status = this->servable->load();
    if (!status.ok()) {
        SPDLOG_ERROR("Model: {} failed to load: {}", this->servable->describe().name, status.string());
    }
    state = ModuleState::INITIALIZED;
    SPDLOG_INFO("{} started", SERVABLE_MANAGER_MODULE_NAME);
    return StatusCode::OK;
}

void ServableManagerModule::shutdown() {
    if (state == ModuleState::SHUTDOWN)
        return;
    state = ModuleState::STARTED_SHUTDOWN;
    SPDLOG_INFO("{} shutting down", SERVABLE_MANAGER_MODULE_NAME);
    this->servable.reset();
    state = ModuleState::SHUTDOWN;
    SPDLOG_INFO("{} shutdown", SERVABLE_MANAGER_MODULE_NAME);
}

ServableManagerModule::~ServableManagerModule() {
    this->shutdown();
}

Servable& ServableManagerModule::getServable() const {
    if (nullptr == this->servable) {
        throw std::logic_error("Servable requested before servable manager module was started");
    }
    return *this->servable;
}
}  // namespace mserve
