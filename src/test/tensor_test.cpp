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
#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../tensor.hpp"

using namespace mserve;
using namespace testing;

TEST(DatatypeTest, FromString) {
    EXPECT_EQ(fromString("FP32"), Datatype::FP32);
    EXPECT_EQ(fromString("FP64"), Datatype::FP64);
    EXPECT_EQ(fromString("INT32"), Datatype::INT32);
    EXPECT_EQ(fromString("INT64"), Datatype::INT64);
    EXPECT_EQ(fromString("BOOL"), Datatype::BOOL);
    EXPECT_EQ(fromString("BYTES"), Datatype::BYTES);
    EXPECT_EQ(fromString("STRING"), Datatype::BYTES);
    EXPECT_EQ(fromString("fp32"), Datatype::UNDEFINED);
    EXPECT_EQ(fromString("UINT8"), Datatype::UNDEFINED);
}

TEST(DatatypeTest, ToString) {
    EXPECT_EQ(toString(Datatype::FP32), "FP32");
    EXPECT_EQ(toString(Datatype::BYTES), "BYTES");
}

TEST(TensorTest, DatatypeFollowsValues) {
    EXPECT_EQ(Tensor("a", {1}, std::vector<float>{1.0f}).getDatatype(), Datatype::FP32);
    EXPECT_EQ(Tensor("a", {1}, std::vector<double>{1.0}).getDatatype(), Datatype::FP64);
    EXPECT_EQ(Tensor("a", {1}, std::vector<int32_t>{1}).getDatatype(), Datatype::INT32);
    EXPECT_EQ(Tensor("a", {1}, std::vector<int64_t>{1}).getDatatype(), Datatype::INT64);
    EXPECT_EQ(Tensor("a", {1}, std::vector<bool>{true}).getDatatype(), Datatype::BOOL);
    EXPECT_EQ(Tensor("a", {1}, std::vector<std::string>{"x"}).getDatatype(), Datatype::BYTES);
}

TEST(TensorTest, ElementCounts) {
    Tensor tensor("a", {2, 3}, std::vector<float>(4, 0.0f));
    EXPECT_EQ(tensor.elementCount(), 4);
    EXPECT_EQ(tensor.shapeElementCount(), std::optional<size_t>(6));

    Tensor scalar("b", {}, std::vector<float>{1.0f});
    EXPECT_EQ(scalar.shapeElementCount(), std::optional<size_t>(1));

    Tensor empty("c", {0, 4}, std::vector<float>{});
    EXPECT_EQ(empty.shapeElementCount(), std::optional<size_t>(0));
}

TEST(TensorTest, ShapeElementCountOverflow) {
    Tensor huge("a", {1LL << 62, 4}, std::vector<float>{});
    EXPECT_FALSE(huge.shapeElementCount().has_value());

    Tensor zeroDim("b", {1LL << 62, 0}, std::vector<float>{});
    EXPECT_EQ(zeroDim.shapeElementCount(), std::optional<size_t>(0));
}

TEST(TensorTest, ShapeToString) {
    EXPECT_EQ(shapeToString(signed_shape_t{1, 4}), "(1,4)");
    EXPECT_EQ(shapeToString(signed_shape_t{}), "()");
}

TEST(InferenceRequestTest, FindInput) {
    InferenceRequest request;
    request.inputs.emplace_back("a", signed_shape_t{1}, std::vector<float>{1.0f});
    ASSERT_NE(request.findInput("a"), nullptr);
    EXPECT_EQ(request.findInput("b"), nullptr);
}
