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
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#include <rapidjson/document.h>
#pragma GCC diagnostic pop

#include "../http_rest_api_handler.hpp"
#include "../http_status_code.hpp"
#include "../iris_model.hpp"
#include "../metric_config.hpp"
#include "../metric_registry.hpp"
#include "../servable.hpp"
#include "../status.hpp"
#include "test_utils.hpp"

using namespace mserve;
using namespace testing;

class HttpRestApiHandlerTest : public Test {
protected:
    MetricRegistry registry;
    MetricConfig metricConfig{true};
    std::unique_ptr<Servable> servable;
    std::unique_ptr<HttpRestApiHandler> handler;
    HttpRequestComponents comp;
    HttpResponseComponents responseComponents;
    std::string response;

    void SetUp() override {
        servable = std::make_unique<Servable>(std::make_unique<IrisClassifier>(), &metricConfig, &registry);
        handler = std::make_unique<HttpRestApiHandler>(*servable, &registry);
    }
    void TearDown() override {
        handler.reset();
        servable.reset();
    }

    Status process(const std::string& method, const std::string& path, const std::string& body = "") {
        responseComponents = HttpResponseComponents();
        return handler->processRequest(method, path, body, &response, responseComponents);
    }
};

TEST_F(HttpRestApiHandlerTest, RegexParseInfer) {
    std::string request = "/v2/models/iris-classifier/versions/v1.0.0/infer";
    ASSERT_EQ(handler->parseRequestComponents(comp, "POST", request), StatusCode::OK);
    EXPECT_EQ(comp.type, KFS_Infer);
    EXPECT_EQ(comp.model_name, "iris-classifier");
    EXPECT_EQ(comp.model_version, "v1.0.0");
}

TEST_F(HttpRestApiHandlerTest, RegexParseInferWithoutVersion) {
    std::string request = "/v2/models/iris-classifier/infer";
    ASSERT_EQ(handler->parseRequestComponents(comp, "POST", request), StatusCode::OK);
    EXPECT_EQ(comp.type, KFS_Infer);
    EXPECT_EQ(comp.model_name, "iris-classifier");
    EXPECT_FALSE(comp.model_version.has_value());
}

TEST_F(HttpRestApiHandlerTest, RegexParseEncodedModelName) {
    std::string request = "/v2/models/iris%2Dclassifier/infer";
    ASSERT_EQ(handler->parseRequestComponents(comp, "POST", request), StatusCode::OK);
    EXPECT_EQ(comp.model_name, "iris-classifier");
}

TEST_F(HttpRestApiHandlerTest, RegexParseReadyAndMetadata) {
    std::string request = "/v2/models/iris-classifier/versions/v1.0.0/ready";
    ASSERT_EQ(handler->parseRequestComponents(comp, "GET", request), StatusCode::OK);
    EXPECT_EQ(comp.type, KFS_GetModelReady);
    EXPECT_EQ(comp.model_version, "v1.0.0");

    request = "/v2/models/iris-classifier";
    HttpRequestComponents metadata;
    ASSERT_EQ(handler->parseRequestComponents(metadata, "GET", request), StatusCode::OK);
    EXPECT_EQ(metadata.type, KFS_GetModelMetadata);
    EXPECT_EQ(metadata.model_name, "iris-classifier");
}

TEST_F(HttpRestApiHandlerTest, RegexParseServerEndpoints) {
    const std::pair<std::string, RequestType> routes[] = {
        {"/v2/health/live", KFS_GetServerLive},
        {"/v2/health/ready", KFS_GetServerReady},
        {"/v2", KFS_GetServerMetadata},
        {"/v2/", KFS_GetServerMetadata},
        {"/health", Health},
        {"/ready", Ready},
        {"/metrics", Metrics},
        {"/", ServiceDescription}};
    for (const auto& [path, type] : routes) {
        HttpRequestComponents components;
        ASSERT_EQ(handler->parseRequestComponents(components, "GET", path), StatusCode::OK) << path;
        EXPECT_EQ(components.type, type) << path;
    }
}

TEST_F(HttpRestApiHandlerTest, UnknownRoute) {
    auto status = process("GET", "/v3/models/iris-classifier");
    EXPECT_EQ(status, StatusCode::REST_INVALID_URL);
    EXPECT_EQ(http(status), HTTPStatusCode::NOT_FOUND);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::RouteNotFound);
}

TEST_F(HttpRestApiHandlerTest, WrongMethod) {
    auto status = process("GET", "/v2/models/iris-classifier/infer");
    EXPECT_EQ(status, StatusCode::REST_UNSUPPORTED_METHOD);
    EXPECT_EQ(http(status), HTTPStatusCode::NONE_ACC);
    EXPECT_EQ(process("POST", "/health"), StatusCode::REST_UNSUPPORTED_METHOD);
    EXPECT_EQ(process("DELETE", "/metrics"), StatusCode::REST_UNSUPPORTED_METHOD);
}

TEST_F(HttpRestApiHandlerTest, InferIrisRequest) {
    ASSERT_EQ(servable->load(), StatusCode::OK);
    ASSERT_EQ(process("POST", "/v2/models/iris-classifier/infer", IRIS_REQUEST_TEMPLATE), StatusCode::OK);
    EXPECT_EQ(responseComponents.contentType, "application/json");

    rapidjson::Document doc;
    doc.Parse(response.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["id"].GetString(), "req-001");
    EXPECT_STREQ(doc["model_name"].GetString(), "iris-classifier");
    EXPECT_STREQ(doc["model_version"].GetString(), "v1.0.0");
    ASSERT_EQ(doc["outputs"].Size(), 3);
    EXPECT_STREQ(doc["outputs"][1]["name"].GetString(), "predicted_class");
    EXPECT_STREQ(doc["outputs"][1]["datatype"].GetString(), "BYTES");
    EXPECT_STREQ(doc["outputs"][1]["data"][0].GetString(), "setosa");

    EXPECT_THAT(registry.collect(), HasSubstr("mserve_requests_total{model=\"iris-classifier\",status=\"success\"} 1\n"));
}

TEST_F(HttpRestApiHandlerTest, InferWithVersion) {
    ASSERT_EQ(servable->load(), StatusCode::OK);
    EXPECT_EQ(process("POST", "/v2/models/iris-classifier/versions/v1.0.0/infer", IRIS_REQUEST_TEMPLATE), StatusCode::OK);
}

TEST_F(HttpRestApiHandlerTest, InferShapeMismatch) {
    ASSERT_EQ(servable->load(), StatusCode::OK);
    auto status = process("POST", "/v2/models/iris-classifier/infer", IRIS_SHAPE_MISMATCH_REQUEST);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::ShapeMismatch);
    EXPECT_EQ(http(status), HTTPStatusCode::BAD_REQUEST);
    EXPECT_TRUE(response.empty());
    EXPECT_THAT(registry.collect(), HasSubstr("mserve_request_errors_total{kind=\"ShapeMismatch\",model=\"iris-classifier\"} 1\n"));
}

TEST_F(HttpRestApiHandlerTest, InferMalformedBody) {
    ASSERT_EQ(servable->load(), StatusCode::OK);
    auto status = process("POST", "/v2/models/iris-classifier/infer", "not json");
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::MalformedPayload);
    EXPECT_EQ(http(status), HTTPStatusCode::BAD_REQUEST);
}

TEST_F(HttpRestApiHandlerTest, InferUnknownModel) {
    ASSERT_EQ(servable->load(), StatusCode::OK);
    auto status = process("POST", "/v2/models/resnet/infer", IRIS_REQUEST_TEMPLATE);
    EXPECT_EQ(status, StatusCode::MODEL_NAME_MISSING);
    EXPECT_EQ(http(status), HTTPStatusCode::NOT_FOUND);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::ModelNotFound);
}

TEST_F(HttpRestApiHandlerTest, InferUnknownVersion) {
    ASSERT_EQ(servable->load(), StatusCode::OK);
    auto status = process("POST", "/v2/models/iris-classifier/versions/2/infer", IRIS_REQUEST_TEMPLATE);
    EXPECT_EQ(status, StatusCode::MODEL_VERSION_MISSING);
    EXPECT_EQ(http(status), HTTPStatusCode::NOT_FOUND);
}

TEST_F(HttpRestApiHandlerTest, InferBeforeLoad) {
    auto status = process("POST", "/v2/models/iris-classifier/infer", IRIS_REQUEST_TEMPLATE);
    EXPECT_EQ(status, StatusCode::MODEL_NOT_READY);
    EXPECT_EQ(http(status), HTTPStatusCode::SERVICE_UNAV);
}

TEST_F(HttpRestApiHandlerTest, ModelMetadata) {
    ASSERT_EQ(process("GET", "/v2/models/iris-classifier"), StatusCode::OK);
    rapidjson::Document doc;
    doc.Parse(response.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["name"].GetString(), "iris-classifier");
    EXPECT_STREQ(doc["versions"][0].GetString(), "v1.0.0");
    ASSERT_EQ(doc["inputs"].Size(), 1);
    EXPECT_STREQ(doc["inputs"][0]["name"].GetString(), "input");
    EXPECT_STREQ(doc["inputs"][0]["datatype"].GetString(), "FP32");
    EXPECT_EQ(doc["inputs"][0]["shape"][0].GetInt(), -1);
    EXPECT_EQ(doc["inputs"][0]["shape"][1].GetInt(), 4);
    EXPECT_EQ(doc["outputs"].Size(), 3);

    EXPECT_EQ(process("GET", "/v2/models/other"), StatusCode::MODEL_NAME_MISSING);
}

TEST_F(HttpRestApiHandlerTest, ProbesAfterSuccessfulLoad) {
    ASSERT_EQ(servable->load(), StatusCode::OK);

    ASSERT_EQ(process("GET", "/health"), StatusCode::OK);
    EXPECT_EQ(response, R"({"status":"ok","model_loaded":true,"model":"iris-classifier","state":"READY"})");
    ASSERT_EQ(process("GET", "/ready"), StatusCode::OK);
    EXPECT_EQ(response, R"({"status":"ready","state":"READY"})");
    ASSERT_EQ(process("GET", "/v2/health/live"), StatusCode::OK);
    EXPECT_EQ(response, R"({"live":true})");
    ASSERT_EQ(process("GET", "/v2/health/ready"), StatusCode::OK);
    EXPECT_EQ(response, R"({"ready":true})");
    ASSERT_EQ(process("GET", "/v2/models/iris-classifier/ready"), StatusCode::OK);
    EXPECT_EQ(response, R"({"ready":true})");
}

TEST_F(HttpRestApiHandlerTest, ProbesBeforeLoad) {
    EXPECT_EQ(process("GET", "/health"), StatusCode::OK);
    EXPECT_EQ(response, R"({"status":"ok","model_loaded":false,"model":"iris-classifier","state":"UNLOADED"})");
    auto status = process("GET", "/ready");
    EXPECT_EQ(status, StatusCode::MODEL_NOT_READY);
    EXPECT_EQ(http(status), HTTPStatusCode::SERVICE_UNAV);
    EXPECT_EQ(response, R"({"status":"not ready","state":"UNLOADED"})");
}

TEST_F(HttpRestApiHandlerTest, Metrics) {
    ASSERT_EQ(process("GET", "/metrics"), StatusCode::OK);
    EXPECT_EQ(responseComponents.contentType, "text/plain; version=0.0.4; charset=utf-8");
    EXPECT_THAT(response, HasSubstr("# TYPE mserve_requests_total counter\n"));
    EXPECT_THAT(response, HasSubstr("mserve_model_state{model=\"iris-classifier\"} 0\n"));
}

TEST_F(HttpRestApiHandlerTest, MetricsDisabled) {
    HttpRestApiHandler disabledHandler(*servable, nullptr);
    auto status = disabledHandler.processRequest("GET", "/metrics", "", &response, responseComponents);
    EXPECT_EQ(status, StatusCode::REST_METRICS_DISABLED);
    EXPECT_EQ(http(status), HTTPStatusCode::NOT_FOUND);
    EXPECT_TRUE(response.empty());
}

TEST_F(HttpRestApiHandlerTest, ServerMetadata) {
    ASSERT_EQ(process("GET", "/v2"), StatusCode::OK);
    rapidjson::Document doc;
    doc.Parse(response.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["name"].GetString(), "mserve");
    EXPECT_TRUE(doc["extensions"].IsArray());
}

TEST_F(HttpRestApiHandlerTest, ServiceDescription) {
    ASSERT_EQ(process("GET", "/"), StatusCode::OK);
    rapidjson::Document doc;
    doc.Parse(response.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["model"].GetString(), "iris-classifier");
    EXPECT_GT(doc["endpoints"].Size(), 0);
}

class HttpRestApiHandlerStubTest : public Test {
protected:
    MetricRegistry registry;
    MetricConfig metricConfig{true};
    StubModel* model = nullptr;
    std::unique_ptr<Servable> servable;
    std::unique_ptr<HttpRestApiHandler> handler;
    HttpResponseComponents responseComponents;
    std::string response;

    void create(ServableSettings settings = {}) {
        auto stub = std::make_unique<StubModel>();
        model = stub.get();
        servable = std::make_unique<Servable>(std::move(stub), &metricConfig, &registry, settings);
        handler = std::make_unique<HttpRestApiHandler>(*servable, &registry);
    }
    void TearDown() override {
        handler.reset();
        servable.reset();
    }

    Status process(const std::string& method, const std::string& path, const std::string& body = "") {
        return handler->processRequest(method, path, body, &response, responseComponents);
    }
};

TEST_F(HttpRestApiHandlerStubTest, ProbesAfterFailedLoad) {
    create();
    model->loadResult = StatusCode::MODEL_LOAD_FAILED;
    EXPECT_EQ(servable->load(), StatusCode::MODEL_LOAD_FAILED);

    auto status = process("GET", "/health");
    EXPECT_EQ(status, StatusCode::SERVER_NOT_LIVE);
    EXPECT_EQ(http(status), HTTPStatusCode::SERVICE_UNAV);
    EXPECT_EQ(response, R"({"status":"unhealthy","model_loaded":false,"model":"stub","state":"FAILED"})");

    EXPECT_EQ(process("GET", "/ready"), StatusCode::MODEL_NOT_READY);
    EXPECT_EQ(response, R"({"status":"not ready","state":"FAILED"})");
    EXPECT_EQ(process("GET", "/v2/health/live"), StatusCode::SERVER_NOT_LIVE);
    EXPECT_EQ(response, R"({"live":false})");
    EXPECT_EQ(process("POST", "/v2/models/stub/infer", stubRequest()), StatusCode::MODEL_NOT_READY);
}

TEST_F(HttpRestApiHandlerStubTest, DegradedNotReadyThenRecovers) {
    ServableSettings settings;
    settings.degradedThreshold = 2;
    create(settings);
    ASSERT_EQ(servable->load(), StatusCode::OK);

    model->predictResult = StatusCode::PREDICTION_INTERNAL_ERROR;
    for (int i = 0; i < 2; ++i) {
        auto status = process("POST", "/v2/models/stub/infer", stubRequest());
        EXPECT_EQ(http(status), HTTPStatusCode::ERROR);
    }
    EXPECT_EQ(process("GET", "/ready"), StatusCode::MODEL_NOT_READY);
    EXPECT_EQ(response, R"({"status":"not ready","state":"DEGRADED"})");
    EXPECT_EQ(process("GET", "/health"), StatusCode::OK);
    EXPECT_THAT(registry.collect(), HasSubstr("mserve_model_state{model=\"stub\"} 3\n"));

    model->predictResult = StatusCode::OK;
    EXPECT_EQ(process("POST", "/v2/models/stub/infer", stubRequest()), StatusCode::OK);
    EXPECT_EQ(process("GET", "/ready"), StatusCode::OK);
    EXPECT_EQ(response, R"({"status":"ready","state":"READY"})");
}

TEST_F(HttpRestApiHandlerStubTest, CancelledInferProducesNoResponse) {
    create();
    ASSERT_EQ(servable->load(), StatusCode::OK);
    auto status = handler->processRequest("POST", "/v2/models/stub/infer", stubRequest(), &response, responseComponents, []() { return true; });
    EXPECT_EQ(status, StatusCode::REQUEST_CANCELLED);
    EXPECT_TRUE(response.empty());
}

TEST(UrlDecode, Decodes) {
    EXPECT_EQ(urlDecode("iris%20model"), "iris model");
    EXPECT_EQ(urlDecode("plain"), "plain");
    EXPECT_EQ(urlDecode("bad%2"), "bad%2");
    EXPECT_EQ(urlDecode("bad%zz"), "bad%zz");
}
