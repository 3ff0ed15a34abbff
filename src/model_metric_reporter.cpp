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
#include "model_metric_reporter.hpp"

#include <stdexcept>

#include "logging.hpp"
#include "metric_config.hpp"
#include "metric_family.hpp"
#include "metric_registry.hpp"

namespace mserve {

#define THROW_IF_NULL(VAR, MESSAGE)                    \
    if (VAR == nullptr) {                              \
        SPDLOG_LOGGER_ERROR(metrics_logger, MESSAGE); \
        throw std::logic_error(MESSAGE);               \
    }

static const ErrorKind recordedErrorKinds[] = {
    ErrorKind::MalformedPayload,
    ErrorKind::UnsupportedDatatype,
    ErrorKind::ShapeMismatch,
    ErrorKind::DatatypeMismatch,
    ErrorKind::UnknownInput,
    ErrorKind::MissingInput,
    ErrorKind::UnknownOutput,
    ErrorKind::ServiceUnavailable,
    ErrorKind::PredictionError,
    ErrorKind::Internal};

ModelMetricReporter::~ModelMetricReporter() = default;

ModelMetricReporter::ModelMetricReporter(const MetricConfig* metricConfig, MetricRegistry* registry, const std::string& modelName) :
    registry(registry),
    modelName(modelName) {
    if (!registry) {
        return;
    }

    if (!metricConfig || !metricConfig->metricsEnabled) {
        return;
    }

    this->buckets = metricConfig->bucketBoundaries;

    std::string familyName = METRIC_NAME_REQUESTS;
    if (metricConfig->isFamilyEnabled(familyName)) {
        auto family = registry->createFamily<MetricCounter>(familyName,
            "Number of completed inference requests to a model.");
        THROW_IF_NULL(family, "cannot create family");

        this->requestSuccess = family->addMetric({{"model", modelName},
            {"status", "success"}});
        THROW_IF_NULL(this->requestSuccess, "cannot create metric");

        this->requestFail = family->addMetric({{"model", modelName},
            {"status", "error"}});
        THROW_IF_NULL(this->requestFail, "cannot create metric");
    }

    familyName = METRIC_NAME_REQUEST_ERRORS;
    if (metricConfig->isFamilyEnabled(familyName)) {
        auto family = registry->createFamily<MetricCounter>(familyName,
            "Number of failed inference requests to a model by error kind.");
        THROW_IF_NULL(family, "cannot create family");

        for (auto kind : recordedErrorKinds) {
            auto metric = family->addMetric({{"model", modelName},
                {"kind", toString(kind)}});
            THROW_IF_NULL(metric, "cannot create metric");
            this->requestFailByKind.emplace(kind, std::move(metric));
        }
    }

    familyName = METRIC_NAME_REQUEST_DURATION;
    if (metricConfig->isFamilyEnabled(familyName)) {
        auto family = registry->createFamily<MetricHistogram>(familyName,
            "Inference request processing time in seconds.");
        THROW_IF_NULL(family, "cannot create family");

        this->requestDuration = family->addMetric({{"model", modelName}}, this->buckets);
        THROW_IF_NULL(this->requestDuration, "cannot create metric");
    }

    familyName = METRIC_NAME_ACTIVE_REQUESTS;
    if (metricConfig->isFamilyEnabled(familyName)) {
        auto family = registry->createFamily<MetricGauge>(familyName,
            "Number of inference requests being processed.");
        THROW_IF_NULL(family, "cannot create family");

        this->activeRequests = family->addMetric({{"model", modelName}});
        THROW_IF_NULL(this->activeRequests, "cannot create metric");
    }

    familyName = METRIC_NAME_MODEL_LOADED;
    if (metricConfig->isFamilyEnabled(familyName)) {
        auto family = registry->createFamily<MetricGauge>(familyName,
            "Whether the model is loaded (1) or not (0).");
        THROW_IF_NULL(family, "cannot create family");

        this->modelLoaded = family->addMetric({{"model", modelName}});
        THROW_IF_NULL(this->modelLoaded, "cannot create metric");
    }

    familyName = METRIC_NAME_MODEL_STATE;
    if (metricConfig->isFamilyEnabled(familyName)) {
        auto family = registry->createFamily<MetricGauge>(familyName,
            "Lifecycle state of the model: 0 unloaded, 1 loading, 2 ready, 3 degraded, 4 failed.");
        THROW_IF_NULL(family, "cannot create family");

        this->modelState = family->addMetric({{"model", modelName}});
        THROW_IF_NULL(this->modelState, "cannot create metric");
    }
}

void ModelMetricReporter::record(const Status& outcome, std::chrono::duration<double> duration) {
    OBSERVE_IF_ENABLED(this->requestDuration, duration.count());
    if (outcome.ok()) {
        INCREMENT_IF_ENABLED(this->requestSuccess);
        return;
    }
    INCREMENT_IF_ENABLED(this->requestFail);
    auto it = this->requestFailByKind.find(errorKind(outcome.getCode()));
    if (it == this->requestFailByKind.end()) {
        it = this->requestFailByKind.find(ErrorKind::Internal);
    }
    if (it != this->requestFailByKind.end()) {
        INCREMENT_IF_ENABLED(it->second);
    }
}

}  // namespace mserve
