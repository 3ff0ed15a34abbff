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

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace prometheus {
class Registry;
}

namespace mserve {

using MetricLabels = std::map<std::string, std::string>;
using BucketBoundaries = std::vector<double>;

class MetricFamilyBase {
public:
    virtual ~MetricFamilyBase() = default;
};

/**
 * @brief Group of metrics sharing name and description, distinguished by labels
 *
 * Created through MetricRegistry::createFamily. Metrics created by addMetric
 * stay registered for the lifetime of the registry.
 */
template <typename T>
class MetricFamily : public MetricFamilyBase {
    std::string name, description;

public:
    MetricFamily(const std::string& name, const std::string& description, prometheus::Registry& registryImplRef);

    const std::string& getName() const { return this->name; }
    const std::string& getDesc() const { return this->description; }

    std::unique_ptr<T> addMetric(const MetricLabels& labels = {}, const BucketBoundaries& bucketBoundaries = {});

private:
    // Prometheus internals
    prometheus::Registry& registryImplRef;
    void* familyImplRef;
};

}  // namespace mserve
