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

#include "status.hpp"

namespace mserve {
class Config;

enum class ModuleState {
    NOT_INITIALIZED,
    STARTED_INITIALIZE,
    INITIALIZED,
    STARTED_SHUTDOWN,
    SHUTDOWN
};

class Module {
protected:
    ModuleState state = ModuleState::NOT_INITIALIZED;

public:
    virtual Status start(const mserve::Config& config) = 0;
    virtual void shutdown() = 0;
    virtual ~Module() = default;
    ModuleState getState() const { return state; }
};

}  // namespace mserve
