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
#include <memory>

#include "module.hpp"

namespace mserve {
class Config;
class MetricModule;
class Servable;
class Server;

/**
 * @brief Owns the served model. Start loads it, a failed load keeps the module
 * initialized so that health probes report the failure.
 */
class ServableManagerModule : public Module {
protected:
    const MetricModule& metricModule;
    std::unique_ptr<Servable> servable;

public:
    ServableManagerModule(mserve::Server& server);
    ~ServableManagerModule();
    Status start(const mserve::Config& config) override;

    void shutdown() override;
    virtual Servable& getServable() const;
};
}  // namespace mserve
