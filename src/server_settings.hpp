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

#include <cstdint>
#include <optional>
#include <string>

namespace mserve {

struct ServerSettings {
    uint32_t restPort = 8080;
    std::string restBindAddress = "0.0.0.0";
    std::optional<uint32_t> restWorkers;
    std::string logLevel = "INFO";
    std::string logPath;
    bool metricsEnabled = true;
    std::string metricsList;
    std::string metricsBuckets;
    uint32_t degradedThreshold = 5;
    uint32_t degradedWindowSeconds = 60;
    uint32_t loadTimeoutSeconds = 30;
};

}  // namespace mserve
