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
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../iris_model.hpp"
#include "../status.hpp"

using namespace mserve;
using namespace testing;

class IrisClassifierTest : public Test {
protected:
    IrisClassifier model;
    std::vector<Tensor> outputs;

    std::vector<Tensor> makeInputs(std::vector<float> values) {
        std::vector<Tensor> inputs;
        signed_shape_t shape{static_cast<dimension_value_t>(values.size() / 4), 4};
        inputs.emplace_back("input", shape, std::move(values));
        return inputs;
    }
};

TEST_F(IrisClassifierTest, Describe) {
    const auto& description = model.describe();
    EXPECT_EQ(description.name, "iris-classifier");
    EXPECT_EQ(description.version, "v1.0.0");
    ASSERT_EQ(description.inputs.size(), 1);
    EXPECT_EQ(description.inputs[0].name, "input");
    EXPECT_EQ(description.inputs[0].datatype, Datatype::FP32);
    EXPECT_THAT(description.inputs[0].shape, ElementsAre(DYNAMIC_DIMENSION, 4));
    ASSERT_NE(description.findOutput("probabilities"), nullptr);
    ASSERT_NE(description.findOutput("predicted_class"), nullptr);
    ASSERT_NE(description.findOutput("confidence"), nullptr);
    EXPECT_EQ(description.findOutput("logits"), nullptr);
}

TEST_F(IrisClassifierTest, PredictBeforeLoad) {
    EXPECT_FALSE(model.isLoaded());
    EXPECT_EQ(model.predict(makeInputs({5.1f, 3.5f, 1.4f, 0.2f}), outputs), StatusCode::PREDICTION_INTERNAL_ERROR);
}

TEST_F(IrisClassifierTest, LoadTwice) {
    ASSERT_EQ(model.load(), StatusCode::OK);
    EXPECT_TRUE(model.isLoaded());
    EXPECT_EQ(model.load(), StatusCode::MODEL_ALREADY_LOADED);
}

TEST_F(IrisClassifierTest, WarmUp) {
    ASSERT_EQ(model.load(), StatusCode::OK);
    EXPECT_EQ(model.warmUp(), StatusCode::OK);
}

TEST_F(IrisClassifierTest, WarmUpBeforeLoadFails) {
    EXPECT_EQ(model.warmUp(), StatusCode::MODEL_WARMUP_FAILED);
}

TEST_F(IrisClassifierTest, ClassifiesSamples) {
    ASSERT_EQ(model.load(), StatusCode::OK);
    ASSERT_EQ(model.predict(makeInputs({5.1f, 3.5f, 1.4f, 0.2f, 6.7f, 3.0f, 5.2f, 2.3f}), outputs), StatusCode::OK);
    ASSERT_EQ(outputs.size(), 3);

    EXPECT_EQ(outputs[0].getName(), "probabilities");
    EXPECT_THAT(outputs[0].getShape(), ElementsAre(2, 3));
    const auto& probabilities = outputs[0].data<float>();
    ASSERT_EQ(probabilities.size(), 6);
    EXPECT_NEAR(std::accumulate(probabilities.begin(), probabilities.begin() + 3, 0.0f), 1.0f, 1e-5);
    EXPECT_NEAR(std::accumulate(probabilities.begin() + 3, probabilities.end(), 0.0f), 1.0f, 1e-5);

    EXPECT_EQ(outputs[1].getName(), "predicted_class");
    EXPECT_THAT(outputs[1].data<std::string>(), ElementsAre("setosa", "virginica"));

    EXPECT_EQ(outputs[2].getName(), "confidence");
    const auto& confidence = outputs[2].data<float>();
    ASSERT_EQ(confidence.size(), 2);
    EXPECT_FLOAT_EQ(confidence[0], probabilities[0]);
    EXPECT_FLOAT_EQ(confidence[1], probabilities[5]);
}

TEST_F(IrisClassifierTest, NonFiniteInput) {
    ASSERT_EQ(model.load(), StatusCode::OK);
    auto status = model.predict(makeInputs({5.1f, std::numeric_limits<float>::quiet_NaN(), 1.4f, 0.2f}), outputs);
    EXPECT_EQ(status, StatusCode::PREDICTION_NUMERICAL_ERROR);
    EXPECT_EQ(errorKind(status.getCode()), ErrorKind::PredictionError);
}

TEST_F(IrisClassifierTest, WrongDatatypeRejected) {
    ASSERT_EQ(model.load(), StatusCode::OK);
    std::vector<Tensor> inputs;
    inputs.emplace_back("input", signed_shape_t{1, 4}, std::vector<int32_t>{1, 2, 3, 4});
    EXPECT_EQ(model.predict(inputs, outputs), StatusCode::PREDICTION_INVALID_INPUT);
}
