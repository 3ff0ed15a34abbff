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
#include <string>

#include "cpphttplib_http_server.hpp"

namespace mserve {
class MetricRegistry;
class Servable;

/**
 * @brief Creates REST server bound to address:port and starts accepting requests
 *
 * @param registry metrics registry exposed on /metrics, nullptr when metrics are disabled
 * @return nullptr when the server could not start listening
 */
std::unique_ptr<CppHttpLibHttpServer> createAndStartCppHttpLibHttpServer(const std::string& address, int port, int num_threads, Servable& servable, const MetricRegistry* registry);

}  // namespace mserve
