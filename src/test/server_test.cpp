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
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>

#include "../metric_module.hpp"
#include "../model_state.hpp"
#include "../module_names.hpp"
#include "../mserve_exit_codes.hpp"
#include "../servable.hpp"
#include "../servablemanagermodule.hpp"
#include "../server.hpp"
#include "../server_settings.hpp"
#include "../status.hpp"
#include "test_utils.hpp"

using mserve::ModuleState;
using mserve::Server;
using mserve::StatusCode;
using testing::HasSubstr;

namespace {
class ConstructorEnabledServer : public Server {
public:
    ConstructorEnabledServer() = default;
};

class ServerTest : public ::testing::Test {
protected:
    std::string port = "9000";
    ConstructorEnabledConfig config;
    mserve::ServerSettings settings;
    std::unique_ptr<ConstructorEnabledServer> server;

    void SetUp() override {
        randomizePort(port);
        settings.restPort = std::stoul(port);
        settings.restBindAddress = "127.0.0.1";
        settings.restWorkers = 4;
        server = std::make_unique<ConstructorEnabledServer>();
    }
    void TearDown() override {
        server->shutdownModules();
        server.reset();
    }

    std::unique_ptr<httplib::Client> client() {
        auto cli = std::make_unique<httplib::Client>("127.0.0.1", std::stoi(port));
        cli->set_connection_timeout(std::chrono::seconds(5));
        cli->set_read_timeout(std::chrono::seconds(5));
        return cli;
    }
};
}  // namespace

TEST_F(ServerTest, ModulesStartInOrderAndShutDown) {
    ASSERT_TRUE(config.parse(&settings));
    ASSERT_EQ(server->startModules(config), StatusCode::OK);
    EXPECT_EQ(server->getModuleState(mserve::METRICS_MODULE_NAME), ModuleState::INITIALIZED);
    EXPECT_EQ(server->getModuleState(mserve::SERVABLE_MANAGER_MODULE_NAME), ModuleState::INITIALIZED);
    EXPECT_EQ(server->getModuleState(mserve::HTTP_SERVER_MODULE_NAME), ModuleState::INITIALIZED);

    auto servableModule = dynamic_cast<const mserve::ServableManagerModule*>(server->getModule(mserve::SERVABLE_MANAGER_MODULE_NAME));
    ASSERT_NE(servableModule, nullptr);
    EXPECT_EQ(servableModule->getServable().getState().getState(), mserve::ModelState::READY);

    server->shutdownModules();
    EXPECT_EQ(server->getModule(mserve::HTTP_SERVER_MODULE_NAME), nullptr);
    EXPECT_EQ(server->getModuleState(mserve::SERVABLE_MANAGER_MODULE_NAME), ModuleState::NOT_INITIALIZED);
}

TEST_F(ServerTest, ModulesCannotBeStartedTwice) {
    ASSERT_TRUE(config.parse(&settings));
    ASSERT_EQ(server->startModules(config), StatusCode::OK);
    EXPECT_EQ(server->startModules(config), StatusCode::MODULE_ALREADY_INSERTED);
}

TEST_F(ServerTest, InferenceOverHttp) {
    ASSERT_TRUE(config.parse(&settings));
    ASSERT_EQ(server->startModules(config), StatusCode::OK);
    auto cli = client();

    auto res = cli->Get("/v2/health/live");
    ASSERT_TRUE(res) << httplib::to_string(res.error());
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, R"({"live":true})");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");

    res = cli->Post("/v2/models/iris-classifier/infer", IRIS_REQUEST_TEMPLATE, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
    EXPECT_THAT(res->body, HasSubstr("\"id\": \"req-001\""));
    EXPECT_THAT(res->body, HasSubstr("setosa"));

    res = cli->Post("/v2/models/iris-classifier/infer", IRIS_SHAPE_MISMATCH_REQUEST, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_THAT(res->body, HasSubstr(R"("kind":"ShapeMismatch","type":"ValidationError")"));

    res = cli->Post("/v2/models/resnet/infer", IRIS_REQUEST_TEMPLATE, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    res = cli->Get("/v2/models/iris-classifier/infer");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 405);

    res = cli->Get("/unknown/route");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    res = cli->Options("/v2/models/iris-classifier/infer");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);

    res = cli->Get("/metrics");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_THAT(res->get_header_value("Content-Type"), HasSubstr("text/plain"));
    EXPECT_THAT(res->body, HasSubstr("mserve_requests_total{model=\"iris-classifier\",status=\"success\"} 1\n"));
    EXPECT_THAT(res->body, HasSubstr("mserve_request_errors_total{kind=\"ShapeMismatch\",model=\"iris-classifier\"} 1\n"));
    EXPECT_THAT(res->body, HasSubstr("mserve_model_state{model=\"iris-classifier\"} 2\n"));
}

TEST_F(ServerTest, MetricsEndpointDisabled) {
    settings.metricsEnabled = false;
    ASSERT_TRUE(config.parse(&settings));
    ASSERT_EQ(server->startModules(config), StatusCode::OK);
    auto cli = client();
    auto res = cli->Get("/metrics");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    res = cli->Get("/ready");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
}

TEST_F(ServerTest, UnavailableBindAddress) {
    // TEST-NET-3 address is valid but not assigned to any local interface
    settings.restBindAddress = "203.0.113.7";
    ASSERT_TRUE(config.parse(&settings));
    EXPECT_EQ(server->startModules(config), StatusCode::FAILED_TO_START_REST_SERVER);
    EXPECT_NE(server->getModuleState(mserve::HTTP_SERVER_MODULE_NAME), ModuleState::INITIALIZED);
}

TEST(Server, ShutdownRequest) {
    Server& server = Server::instance();
    server.setShutdownRequest(1);
    EXPECT_EQ(server.getShutdownStatus(), 1);
    server.setShutdownRequest(0);
    EXPECT_EQ(server.getShutdownStatus(), 0);
}

TEST(Server, ProperShutdownInCaseOfStartError) {
    std::string port = "9000";
    randomizePort(port);
    char* argv[] = {
        (char*)"mserve",
        (char*)"--rest_port",
        (char*)port.c_str(),
        (char*)"--rest_bind_address",
        (char*)"203.0.113.7",
        nullptr};
    ConstructorEnabledServer server;
    std::thread t([&argv, &server]() {
        EXPECT_EQ(MSERVE_EX_FAILURE, server.start(5, argv));
    });
    t.join();
    // this test should not hang
}
