/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include <stdexcept>

#include <prometheus/text_serializer.h>

namespace tessera::metrics {

  RegistryPtr createRegistry() {
    return std::make_shared<PrometheusRegistry>();
  }

  PrometheusRegistry::PrometheusRegistry()
      : PrometheusRegistry{std::make_shared<prometheus::Registry>()} {}

  PrometheusRegistry::PrometheusRegistry(
      std::shared_ptr<prometheus::Registry> registry)
      : registry_{std::move(registry)} {}

  prometheus::Counter *PrometheusRegistry::internalMetric(Counter *metric) {
    return &static_cast<PrometheusCounter *>(metric)->m_;
  }

  prometheus::Gauge *PrometheusRegistry::internalMetric(Gauge *metric) {
    return &static_cast<PrometheusGauge *>(metric)->m_;
  }

  prometheus::Histogram *PrometheusRegistry::internalMetric(
      Histogram *metric) {
    return &static_cast<PrometheusHistogram *>(metric)->m_;
  }

  std::string PrometheusRegistry::exposition() const {
    return prometheus::TextSerializer{}.Serialize(registry_->Collect());
  }

  template <typename Builder>
  void PrometheusRegistry::registerFamily(Builder &&builder,
                                          const std::string &name,
                                          const std::string &help,
                                          const Labels &labels) {
    std::lock_guard lock{mutex_};
    if (families_.contains(name)) {
      return;
    }
    auto &family =
        builder.Name(name).Help(help).Labels(labels).Register(*registry_);
    families_.emplace(name, &family);
  }

  template <typename T>
  prometheus::Family<T> &PrometheusRegistry::family(const std::string &name) {
    if (auto it = families_.find(name); it != families_.end()) {
      if (auto family = std::get_if<prometheus::Family<T> *>(&it->second)) {
        return **family;
      }
    }
    throw std::invalid_argument("No metric family " + name
                                + " of the requested type");
  }

  void PrometheusRegistry::registerCounterFamily(const std::string &name,
                                                 const std::string &help,
                                                 const Labels &labels) {
    registerFamily(prometheus::BuildCounter(), name, help, labels);
  }

  void PrometheusRegistry::registerGaugeFamily(const std::string &name,
                                               const std::string &help,
                                               const Labels &labels) {
    registerFamily(prometheus::BuildGauge(), name, help, labels);
  }

  void PrometheusRegistry::registerHistogramFamily(const std::string &name,
                                                   const std::string &help,
                                                   const Labels &labels) {
    registerFamily(prometheus::BuildHistogram(), name, help, labels);
  }

  Counter *PrometheusRegistry::registerCounterMetric(const std::string &name,
                                                     const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto &metric = family<prometheus::Counter>(name).Add(labels);
    return counters_.emplace_back(std::make_unique<PrometheusCounter>(metric))
        .get();
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(const std::string &name,
                                                 const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto &metric = family<prometheus::Gauge>(name).Add(labels);
    return gauges_.emplace_back(std::make_unique<PrometheusGauge>(metric))
        .get();
  }

  Histogram *PrometheusRegistry::registerHistogramMetric(
      const std::string &name,
      const std::vector<double> &bucket_boundaries,
      const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto &metric = family<prometheus::Histogram>(name).Add(
        labels, prometheus::Histogram::BucketBoundaries{bucket_boundaries});
    return histograms_
        .emplace_back(std::make_unique<PrometheusHistogram>(metric))
        .get();
  }

}  // namespace tessera::metrics
