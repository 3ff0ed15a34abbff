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
#include "cpphttplib_http_server.hpp"

#include <chrono>
#include <utility>

#include <httplib.h>

#include "logging.hpp"

namespace mserve {

CppHttpLibHttpServer::CppHttpLibHttpServer(size_t num_workers, int port, const std::string& address) :
    num_workers(num_workers),
    port_(port),
    address_(address),
    server_(std::make_unique<httplib::Server>()) {
    SPDLOG_LOGGER_DEBUG(rest_logger, "Creating thread pool ({} threads)", num_workers);
    server_->new_task_queue = [num_workers] {
        return new httplib::ThreadPool(num_workers);
    };
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"}});
}

CppHttpLibHttpServer::~CppHttpLibHttpServer() {
    terminate();
}

bool CppHttpLibHttpServer::startAcceptingRequests() {
    SPDLOG_LOGGER_DEBUG(rest_logger, "CppHttpLibHttpServer::startAcceptingRequests()");

    auto handle = [this](const httplib::Request& req, httplib::Response& res) {
        auto start = std::chrono::steady_clock::now();

        this->dispatcher_(req, res);

        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        SPDLOG_LOGGER_DEBUG(rest_logger, "CppHttpLibHttpServer request handling took {} milliseconds", duration.count() / 1000.f);
    };

    // Any method is dispatched so that the handler decides between unknown url and wrong method
    server_->Get(R"(/.*)", handle);
    server_->Post(R"(/.*)", handle);
    server_->Put(R"(/.*)", handle);
    server_->Patch(R"(/.*)", handle);
    server_->Delete(R"(/.*)", handle);
    server_->Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "*");
        res.status = 204;
    });

    // bind in caller thread so that unavailable address is reported before listener starts
    if (!server_->bind_to_port(address_, port_)) {
        SPDLOG_LOGGER_ERROR(rest_logger, "Failed to bind cpp-httplib server to {}:{}", address_, port_);
        return false;
    }

    listener_ = std::thread([this] {
        SPDLOG_LOGGER_DEBUG(rest_logger, "Starting to listen on port {}", port_);
        if (!server_->listen_after_bind()) {
            SPDLOG_LOGGER_DEBUG(rest_logger, "Listening on {}:{} ended with failure", address_, port_);
        }
        SPDLOG_LOGGER_DEBUG(rest_logger, "Stopped listening");
    });

    server_->wait_until_ready();

    SPDLOG_LOGGER_INFO(rest_logger, "REST server listening on port {} with {} threads", port_, num_workers);
    return true;
}

void CppHttpLibHttpServer::terminate() {
    if (!listener_.joinable())
        return;
    SPDLOG_LOGGER_DEBUG(rest_logger, "CppHttpLibHttpServer::terminate()");
    server_->stop();
    listener_.join();  // listen() returns after worker threads finished
}

void CppHttpLibHttpServer::registerRequestDispatcher(
    std::function<void(
        const httplib::Request& req, httplib::Response& res)>
        dispatcher) {
    dispatcher_ = std::move(dispatcher);
}

}  // namespace mserve
