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

#include <optional>
#include <string>
#include <vector>
namespace mserve {

/**
 * @brief Trims the string on both sides
 *
 * @param str
 */
void trim(std::string& str);

/**
 * @brief Tokenizes a string into a vector of tokens
 * 
 * @param str 
 * @param delimiter 
 * @return std::vector<std::string> 
 */
std::vector<std::string> tokenize(const std::string& str, const char delimiter);

/**
 * @brief Converts whole string into finite double
 *
 * @return std::nullopt when string has trailing characters or value is not finite
 */
std::optional<double> stod(const std::string& str);

}  // namespace mserve
