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

#include <array>
#include <chrono>
#include <type_traits>

namespace mserve {

template <typename T>
struct is_chrono_duration_type : std::false_type {};

template <typename T, typename U>
struct is_chrono_duration_type<std::chrono::duration<T, U>> : std::true_type {};

typedef unsigned int SIZE_TYPE;
/**
 * @brief Set of N stopwatches indexed by stage enum
 */
template <SIZE_TYPE N>
class Timer {
    std::array<std::chrono::steady_clock::time_point, N> startTimestamps;
    std::array<std::chrono::steady_clock::time_point, N> stopTimestamps;

public:
    void start(SIZE_TYPE i) {
        startTimestamps[i] = std::chrono::steady_clock::now();
    }

    void stop(SIZE_TYPE i) {
        stopTimestamps[i] = std::chrono::steady_clock::now();
    }

    template <typename T>
    double elapsed(SIZE_TYPE i) const {
        static_assert(is_chrono_duration_type<T>::value, "Non supported type.");
        return std::chrono::duration_cast<T>(stopTimestamps[i] - startTimestamps[i]).count();
    }

    std::chrono::duration<double> elapsedDuration(SIZE_TYPE i) const {
        return stopTimestamps[i] - startTimestamps[i];
    }
};
}  // namespace mserve
