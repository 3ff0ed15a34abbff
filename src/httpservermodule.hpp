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

#include "cpphttplib_http_server.hpp"
#include "module.hpp"

namespace mserve {
class Config;
class Server;
class HTTPServerModule : public Module {
    std::unique_ptr<CppHttpLibHttpServer> cppHttpLibServer;
    Server& server;

public:
    HTTPServerModule(Server& server);
    ~HTTPServerModule();
    Status start(const mserve::Config& config) override;

    void shutdown() override;
};
}  // namespace mserve
