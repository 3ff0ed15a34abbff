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
#include <csignal>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "module.hpp"
#include "module_names.hpp"

namespace mserve {
class Config;
class Status;

/**
 * @brief Process wide owner of modules. Modules start in dependency order
 * (metrics, servable manager, HTTP server) and shut down in reverse.
 */
class Server {
    mutable std::shared_mutex modulesMtx;
    mutable std::mutex startMtx;

protected:
    std::unordered_map<std::string, std::unique_ptr<Module>> modules;
    Server() = default;
    virtual std::unique_ptr<Module> createModule(const std::string& name);

public:
    static Server& instance();
    int start(int argc, char** argv);
    Status startModules(mserve::Config& config);
    ModuleState getModuleState(const std::string& name) const;
    const Module* getModule(const std::string& name) const;

    void setShutdownRequest(int i);
    int getShutdownStatus() const;
    virtual ~Server();
    void shutdownModules();

private:
    void ensureModuleShutdown(const std::string& name);
};
}  // namespace mserve
