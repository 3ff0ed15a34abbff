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
#include "metric_family.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "metric.hpp"

namespace mserve {

MetricCounter::MetricCounter(prometheus::Counter& counterImpl) :
    counterImpl(counterImpl) {}

void MetricCounter::increment(double value) {
    this->counterImpl.Increment(value);
}

MetricGauge::MetricGauge(prometheus::Gauge& gaugeImpl) :
    gaugeImpl(gaugeImpl) {}

void MetricGauge::increment(double value) {
    this->gaugeImpl.Increment(value);
}

void MetricGauge::decrement(double value) {
    this->gaugeImpl.Decrement(value);
}

void MetricGauge::set(double value) {
    this->gaugeImpl.Set(value);
}

MetricHistogram::MetricHistogram(prometheus::Histogram& histogramImpl) :
    histogramImpl(histogramImpl) {}

void MetricHistogram::observe(double value) {
    this->histogramImpl.Observe(value);
}

// Builders throw std::invalid_argument on invalid metric name,
// which MetricRegistry::createFamily converts into nullptr.
template <>
MetricFamily<MetricCounter>::MetricFamily(const std::string& name, const std::string& description, prometheus::Registry& registryImplRef) :
    name(name),
    description(description),
    registryImplRef(registryImplRef),
    familyImplRef(&prometheus::BuildCounter()
                       .Name(name)
                       .Help(description)
                       .Register(registryImplRef)) {
}

template <>
MetricFamily<MetricGauge>::MetricFamily(const std::string& name, const std::string& description, prometheus::Registry& registryImplRef) :
    name(name),
    description(description),
    registryImplRef(registryImplRef),
    familyImplRef(&prometheus::BuildGauge()
                       .Name(name)
                       .Help(description)
                       .Register(registryImplRef)) {
}

template <>
MetricFamily<MetricHistogram>::MetricFamily(const std::string& name, const std::string& description, prometheus::Registry& registryImplRef) :
    name(name),
    description(description),
    registryImplRef(registryImplRef),
    familyImplRef(&prometheus::BuildHistogram()
                       .Name(name)
                       .Help(description)
                       .Register(registryImplRef)) {
}

template <>
std::unique_ptr<MetricCounter> MetricFamily<MetricCounter>::addMetric(const MetricLabels& labels, const BucketBoundaries& bucketBoundaries) {
    auto familyImpl = static_cast<prometheus::Family<prometheus::Counter>*>(this->familyImplRef);
    prometheus::Counter& counterImpl = familyImpl->Add(labels);
    return std::unique_ptr<MetricCounter>(new MetricCounter(counterImpl));
}

template <>
std::unique_ptr<MetricGauge> MetricFamily<MetricGauge>::addMetric(const MetricLabels& labels, const BucketBoundaries& bucketBoundaries) {
    auto familyImpl = static_cast<prometheus::Family<prometheus::Gauge>*>(this->familyImplRef);
    prometheus::Gauge& gaugeImpl = familyImpl->Add(labels);
    return std::unique_ptr<MetricGauge>(new MetricGauge(gaugeImpl));
}

template <>
std::unique_ptr<MetricHistogram> MetricFamily<MetricHistogram>::addMetric(const MetricLabels& labels, const BucketBoundaries& bucketBoundaries) {
    auto familyImpl = static_cast<prometheus::Family<prometheus::Histogram>*>(this->familyImplRef);
    prometheus::Histogram& histogramImpl = familyImpl->Add(labels, bucketBoundaries);
    return std::unique_ptr<MetricHistogram>(new MetricHistogram(histogramImpl));
}

}  // namespace mserve
