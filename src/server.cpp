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
#include "server.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <thread>
#include <tuple>
#include <utility>

#include <signal.h>

#include "config.hpp"
#include "httpservermodule.hpp"
#include "logging.hpp"
#include "metric_module.hpp"
#include "mserve_exit_codes.hpp"
#include "servablemanagermodule.hpp"
#include "status.hpp"
#include "version.hpp"

namespace mserve {
namespace {
volatile sig_atomic_t shutdown_request = 0;
}

Server& Server::instance() {
    static Server global;
    return global;
}

static void logConfig(const Config& config) {
    std::string project_name(PROJECT_NAME);
    std::string project_version(PROJECT_VERSION);
    SPDLOG_INFO(project_name + " " + project_version);
    SPDLOG_DEBUG("CLI parameters passed to mserve server");
    SPDLOG_DEBUG("REST port: {}", config.restPort());
    SPDLOG_DEBUG("REST bind address: {}", config.restBindAddress());
    SPDLOG_DEBUG("REST workers: {}", config.restWorkers());
    SPDLOG_DEBUG("log level: {}", config.logLevel());
    SPDLOG_DEBUG("log path: {}", config.logPath());
    SPDLOG_DEBUG("metrics_enabled: {}", config.metricsEnabled());
    SPDLOG_DEBUG("metrics_list: {}", config.metricsList());
    SPDLOG_DEBUG("metrics_buckets: {}", config.metricsBuckets());
    SPDLOG_DEBUG("degraded_threshold: {}", config.degradedThreshold());
    SPDLOG_DEBUG("degraded_window_seconds: {}", config.degradedWindow().count());
    SPDLOG_DEBUG("load_timeout_seconds: {}", config.loadTimeout().count());
}

static void onInterrupt(int status) {
    shutdown_request = 1;
}

static void onTerminate(int status) {
    shutdown_request = 1;
}

static void installSignalHandlers() {
    static struct sigaction sigIntHandler;
    sigIntHandler.sa_handler = onInterrupt;
    sigemptyset(&sigIntHandler.sa_mask);
    sigIntHandler.sa_flags = 0;
    sigaction(SIGINT, &sigIntHandler, NULL);

    static struct sigaction sigTermHandler;
    sigTermHandler.sa_handler = onTerminate;
    sigemptyset(&sigTermHandler.sa_mask);
    sigTermHandler.sa_flags = 0;
    sigaction(SIGTERM, &sigTermHandler, NULL);
}

ModuleState Server::getModuleState(const std::string& name) const {
    std::shared_lock lock(modulesMtx);
    auto it = modules.find(name);
    if (it == modules.end())
        return ModuleState::NOT_INITIALIZED;
    return it->second->getState();
}

const Module* Server::getModule(const std::string& name) const {
    std::shared_lock lock(modulesMtx);
    auto it = modules.find(name);
    if (it == modules.end())
        return nullptr;
    return it->second.get();
}

void Server::setShutdownRequest(int i) {
    shutdown_request = i;
}

int Server::getShutdownStatus() const {
    return shutdown_request;
}

Server::~Server() {
    this->shutdownModules();
}

std::unique_ptr<Module> Server::createModule(const std::string& name) {
    if (name == HTTP_SERVER_MODULE_NAME)
        return std::make_unique<HTTPServerModule>(*this);
    if (name == SERVABLE_MANAGER_MODULE_NAME)
        return std::make_unique<ServableManagerModule>(*this);
    if (name == METRICS_MODULE_NAME)
        return std::make_unique<MetricModule>();
    return nullptr;
}

#define INSERT_MODULE(MODULE_NAME, IT_NAME)                                                  \
    {                                                                                        \
        auto module = this->createModule(MODULE_NAME);                                       \
        std::unique_lock lock(modulesMtx);                                                   \
        std::tie(IT_NAME, inserted) = this->modules.emplace(MODULE_NAME, std::move(module)); \
    }                                                                                        \
    if (!inserted)                                                                           \
    return Status(StatusCode::MODULE_ALREADY_INSERTED, MODULE_NAME)

#define START_MODULE(IT_NAME)                \
    status = IT_NAME->second->start(config); \
    if (!status.ok())                        \
        return status;

Status Server::startModules(mserve::Config& config) {
    Status status;
    bool inserted = false;
    auto it = modules.end();
    INSERT_MODULE(METRICS_MODULE_NAME, it);
    START_MODULE(it);
    INSERT_MODULE(SERVABLE_MANAGER_MODULE_NAME, it);
    START_MODULE(it);
    INSERT_MODULE(HTTP_SERVER_MODULE_NAME, it);
    START_MODULE(it);
    return status;
}

void Server::ensureModuleShutdown(const std::string& name) {
    std::shared_lock lock(modulesMtx);
    auto it = modules.find(name);
    if (it != modules.end())
        it->second->shutdown();
}

class ModulesShutdownGuard {
    Server& server;

public:
    ModulesShutdownGuard(Server& server) :
        server(server) {}
    ~ModulesShutdownGuard() {
        this->server.shutdownModules();
    }
};

void Server::shutdownModules() {
    // first stop incoming requests, then release the model they were served by
    ensureModuleShutdown(HTTP_SERVER_MODULE_NAME);
    ensureModuleShutdown(SERVABLE_MANAGER_MODULE_NAME);
    ensureModuleShutdown(METRICS_MODULE_NAME);
    std::unique_lock lock(modulesMtx);
    modules.clear();
}

static int statusToExitCode(const Status& status) {
    if (status.ok()) {
        return MSERVE_EX_OK;
    } else if (status == StatusCode::OPTIONS_USAGE_ERROR) {
        return MSERVE_EX_USAGE;
    }
    return MSERVE_EX_FAILURE;
}

int Server::start(int argc, char** argv) {
    installSignalHandlers();
    try {
        std::unique_lock lock{this->startMtx, std::defer_lock};
        if (!lock.try_lock()) {
            return statusToExitCode(StatusCode::SERVER_ALREADY_STARTED);
        }
        {
            std::shared_lock lockModules(modulesMtx);
            if (!modules.empty()) {
                return statusToExitCode(StatusCode::SERVER_ALREADY_STARTED);
            }
        }
        auto& config = mserve::Config::instance().parse(argc, argv);
        configure_logger(config.logLevel(), config.logPath());
        logConfig(config);

        ModulesShutdownGuard shutdownGuard(*this);
        auto ret = startModules(config);
        if (!ret.ok()) {
            SPDLOG_ERROR("Server failed to start: {}", ret.string());
            return statusToExitCode(ret);
        }
        while (!shutdown_request) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        SPDLOG_INFO("Shutdown requested");
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Exception; {}", e.what());
        return MSERVE_EX_FAILURE;
    }

    return MSERVE_EX_OK;
}

}  // namespace mserve
