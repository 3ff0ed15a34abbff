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

namespace mserve {

class Status;

enum class HTTPStatusCode : int {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    NONE_ACC = 405,
    PRECOND_FAILED = 412,
    ERROR = 500,
    SERVICE_UNAV = 503,
};

/**
 * @brief Maps status to HTTP response code. Unknown codes are internal errors.
 */
HTTPStatusCode http(const Status& status);

}  // namespace mserve
