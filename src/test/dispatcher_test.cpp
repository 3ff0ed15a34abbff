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
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#include <rapidjson/document.h>
#pragma GCC diagnostic pop

#include "../dispatcher.hpp"
#include "../metric_config.hpp"
#include "../metric_registry.hpp"
#include "../model_metric_reporter.hpp"
#include "../model_state.hpp"
#include "../status.hpp"
#include "test_utils.hpp"

using namespace mserve;
using namespace testing;

class InferenceDispatcherTest : public Test {
protected:
    StubModel model;
    MetricRegistry registry;
    MetricConfig metricConfig{true};
    std::unique_ptr<ModelMetricReporter> reporter;
    std::unique_ptr<ModelStateMachine> state;
    std::unique_ptr<InferenceDispatcher> dispatcher;
    std::string response;

    void SetUp() override {
        reporter = std::make_unique<ModelMetricReporter>(&metricConfig, &registry, "stub");
        state = std::make_unique<ModelStateMachine>("stub", 3, std::chrono::seconds(60), std::chrono::seconds(30), reporter.get());
        dispatcher = std::make_unique<InferenceDispatcher>(model, *state, *reporter);
    }
    void TearDown() override {
        dispatcher.reset();
        state.reset();
        reporter.reset();
    }
};

TEST_F(InferenceDispatcherTest, Success) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    ASSERT_EQ(dispatcher->dispatch(stubRequest(), response), StatusCode::OK);
    EXPECT_EQ(model.predictCalls, 1);

    rapidjson::Document doc;
    doc.Parse(response.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["id"].GetString(), "req-001");
    EXPECT_STREQ(doc["model_name"].GetString(), "stub");
    EXPECT_STREQ(doc["model_version"].GetString(), "1");
    ASSERT_EQ(doc["outputs"].Size(), 2);
    EXPECT_STREQ(doc["outputs"][0]["name"].GetString(), "output");
    EXPECT_STREQ(doc["outputs"][0]["datatype"].GetString(), "FP32");
    EXPECT_STREQ(doc["outputs"][1]["name"].GetString(), "label");
    EXPECT_STREQ(doc["outputs"][1]["data"][0].GetString(), "stub");

    auto collected = registry.collect();
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"success\"} 1\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"error\"} 0\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_request_duration_seconds_count{model=\"stub\"} 1\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_active_requests{model=\"stub\"} 0\n"));
}

TEST_F(InferenceDispatcherTest, ShapeMismatchDoesNotReachModel) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    auto status = dispatcher->dispatch(stubRequest("req-001", "[1,3]"), response);
    EXPECT_EQ(status, StatusCode::INVALID_VALUE_COUNT);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::ShapeMismatch);
    EXPECT_EQ(model.predictCalls, 0);
    EXPECT_TRUE(response.empty());

    auto collected = registry.collect();
    EXPECT_THAT(collected, HasSubstr("mserve_request_errors_total{kind=\"ShapeMismatch\",model=\"stub\"} 1\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"error\"} 1\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_request_duration_seconds_count{model=\"stub\"} 1\n"));
}

TEST_F(InferenceDispatcherTest, ValidationFailureDoesNotDegradeModel) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(dispatcher->dispatch(stubRequest("req", "[1,3]"), response), StatusCode::INVALID_VALUE_COUNT);
    }
    EXPECT_EQ(state->getState(), ModelState::READY);
}

TEST_F(InferenceDispatcherTest, MalformedPayload) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    auto status = dispatcher->dispatch("{\"inputs\": [", response);
    EXPECT_EQ(status, StatusCode::JSON_INVALID);
    EXPECT_THAT(registry.collect(), HasSubstr("mserve_request_errors_total{kind=\"MalformedPayload\",model=\"stub\"} 1\n"));
}

TEST_F(InferenceDispatcherTest, NotReadyBeforeLoad) {
    auto status = dispatcher->dispatch(stubRequest(), response);
    EXPECT_EQ(status, StatusCode::MODEL_NOT_READY);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::ServiceUnavailable);
    EXPECT_EQ(model.predictCalls, 0);
    EXPECT_THAT(registry.collect(), HasSubstr("mserve_request_errors_total{kind=\"ServiceUnavailable\",model=\"stub\"} 1\n"));
}

TEST_F(InferenceDispatcherTest, NotReadyAfterFailedLoad) {
    model.loadResult = StatusCode::MODEL_LOAD_FAILED;
    ASSERT_EQ(state->load(model), StatusCode::MODEL_LOAD_FAILED);
    EXPECT_EQ(dispatcher->dispatch(stubRequest(), response), StatusCode::MODEL_NOT_READY);
    EXPECT_EQ(model.predictCalls, 0);
}

TEST_F(InferenceDispatcherTest, PredictionFailureDegradesAndSuccessRecovers) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    model.predictResult = StatusCode::PREDICTION_NUMERICAL_ERROR;
    for (int i = 0; i < 3; ++i) {
        auto status = dispatcher->dispatch(stubRequest(), response);
        EXPECT_EQ(status, StatusCode::PREDICTION_NUMERICAL_ERROR);
        EXPECT_EQ(errorKind(status.getCode()), ErrorKind::PredictionError);
    }
    EXPECT_EQ(state->getState(), ModelState::DEGRADED);
    EXPECT_THAT(registry.collect(), HasSubstr("mserve_request_errors_total{kind=\"PredictionError\",model=\"stub\"} 3\n"));

    model.predictResult = StatusCode::OK;
    EXPECT_EQ(dispatcher->dispatch(stubRequest(), response), StatusCode::OK);
    EXPECT_EQ(state->getState(), ModelState::READY);
}

TEST_F(InferenceDispatcherTest, UnexpectedModelErrorReportedAsPredictionError) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    model.predictResult = StatusCode::INTERNAL_ERROR;
    auto status = dispatcher->dispatch(stubRequest(), response);
    EXPECT_EQ(status, StatusCode::PREDICTION_INTERNAL_ERROR);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::PredictionError);
}

TEST_F(InferenceDispatcherTest, ThrowingModelIsRecordedAsPredictionError) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    model.predictThrows = true;
    for (int i = 0; i < 3; ++i) {
        auto status = dispatcher->dispatch(stubRequest(), response);
        EXPECT_EQ(status, StatusCode::PREDICTION_INTERNAL_ERROR);
        EXPECT_THAT(status.string(), HasSubstr("stub prediction failure"));
    }
    EXPECT_EQ(state->getState(), ModelState::DEGRADED);
    auto collected = registry.collect();
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"error\"} 3\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_request_errors_total{kind=\"PredictionError\",model=\"stub\"} 3\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_active_requests{model=\"stub\"} 0\n"));

    model.predictThrows = false;
    EXPECT_EQ(dispatcher->dispatch(stubRequest(), response), StatusCode::OK);
    EXPECT_EQ(state->getState(), ModelState::READY);
}

TEST_F(InferenceDispatcherTest, GeneratesIdWhenAbsent) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    const std::string body = R"({"inputs":[{"name":"input","shape":[1,4],"datatype":"FP32","data":[1,2,3,4]}]})";
    ASSERT_EQ(dispatcher->dispatch(body, response), StatusCode::OK);
    rapidjson::Document first;
    first.Parse(response.c_str());
    ASSERT_TRUE(first.HasMember("id"));
    std::string firstId = first["id"].GetString();
    EXPECT_FALSE(firstId.empty());

    ASSERT_EQ(dispatcher->dispatch(body, response), StatusCode::OK);
    rapidjson::Document second;
    second.Parse(response.c_str());
    EXPECT_NE(firstId, second["id"].GetString());
}

TEST_F(InferenceDispatcherTest, RequestedOutputsFilterResponse) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    const std::string body = R"({"inputs":[{"name":"input","shape":[2,4],"datatype":"FP32","data":[1,2,3,4,5,6,7,8]}],"outputs":[{"name":"label"}]})";
    ASSERT_EQ(dispatcher->dispatch(body, response), StatusCode::OK);
    rapidjson::Document doc;
    doc.Parse(response.c_str());
    ASSERT_EQ(doc["outputs"].Size(), 1);
    EXPECT_STREQ(doc["outputs"][0]["name"].GetString(), "label");
    EXPECT_EQ(doc["outputs"][0]["shape"][0].GetInt(), 2);
    EXPECT_EQ(doc["outputs"][0]["data"].Size(), 2);
}

TEST_F(InferenceDispatcherTest, UnknownRequestedOutput) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    const std::string body = R"({"inputs":[{"name":"input","shape":[1,4],"datatype":"FP32","data":[1,2,3,4]}],"outputs":[{"name":"proba"}]})";
    auto status = dispatcher->dispatch(body, response);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::UnknownOutput);
    EXPECT_EQ(model.predictCalls, 0);
}

TEST_F(InferenceDispatcherTest, CancelledRequestIsNotRecorded) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    auto status = dispatcher->dispatch(stubRequest(), response, []() { return true; });
    EXPECT_EQ(status, StatusCode::REQUEST_CANCELLED);
    EXPECT_TRUE(response.empty());
    auto collected = registry.collect();
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"success\"} 0\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"error\"} 0\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_request_duration_seconds_count{model=\"stub\"} 0\n"));
}

TEST_F(InferenceDispatcherTest, ConnectedClientIsServed) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    EXPECT_EQ(dispatcher->dispatch(stubRequest(), response, []() { return false; }), StatusCode::OK);
    EXPECT_FALSE(response.empty());
}

TEST_F(InferenceDispatcherTest, ConcurrentRequestsAreAllCounted) {
    ASSERT_EQ(state->load(model), StatusCode::OK);
    const int callersCount = 1024;
    std::atomic<int> successes{0};
    std::atomic<int> waiting{0};
    std::promise<void> startPromise;
    std::shared_future<void> start = startPromise.get_future().share();
    std::vector<std::thread> callers;
    callers.reserve(callersCount);
    for (int t = 0; t < callersCount; ++t) {
        callers.emplace_back([this, t, start, &successes, &waiting]() {
            std::string id = "req-" + std::to_string(t);
            std::string body = stubRequest(id);
            ++waiting;
            start.wait();
            std::string output;
            if (dispatcher->dispatch(body, output).ok()) {
                rapidjson::Document doc;
                doc.Parse(output.c_str());
                if (!doc.HasParseError() && id == doc["id"].GetString()) {
                    ++successes;
                }
            }
        });
    }
    while (waiting.load() < callersCount) {
        std::this_thread::yield();
    }
    startPromise.set_value();
    for (auto& caller : callers) {
        caller.join();
    }
    EXPECT_EQ(successes, callersCount);
    EXPECT_EQ(model.predictCalls, callersCount);
    auto collected = registry.collect();
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"success\"} " + std::to_string(callersCount) + "\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_requests_total{model=\"stub\",status=\"error\"} 0\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_request_duration_seconds_count{model=\"stub\"} " + std::to_string(callersCount) + "\n"));
    EXPECT_THAT(collected, HasSubstr("mserve_active_requests{model=\"stub\"} 0\n"));
}
