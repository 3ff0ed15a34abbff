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
#include "servable.hpp"

#include <utility>

namespace mserve {

Servable::Servable(std::unique_ptr<Model> model, const MetricConfig* metricConfig, MetricRegistry* registry, const ServableSettings& settings) :
    model(std::move(model)),
    reporter(metricConfig, registry, this->model->describe().name),
    state(this->model->describe().name, settings.degradedThreshold, settings.degradedWindow, settings.loadTimeout, &reporter),
    dispatcher(*this->model, state, reporter) {}

}  // namespace mserve
