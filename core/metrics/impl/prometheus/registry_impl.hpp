/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <variant>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"

namespace tessera::metrics {

  /**
   * Registry over a prometheus-cpp registry. Owns the created metric objects.
   */
  class PrometheusRegistry : public Registry {
   public:
    using Labels = std::map<std::string, std::string>;

    PrometheusRegistry();
    explicit PrometheusRegistry(std::shared_ptr<prometheus::Registry> registry);

    static prometheus::Counter *internalMetric(Counter *metric);
    static prometheus::Gauge *internalMetric(Gauge *metric);
    static prometheus::Histogram *internalMetric(Histogram *metric);

    /// Current values in the prometheus text exposition format
    std::string exposition() const;

    void registerCounterFamily(const std::string &name,
                               const std::string &help = "",
                               const Labels &labels = {}) override;

    void registerGaugeFamily(const std::string &name,
                             const std::string &help = "",
                             const Labels &labels = {}) override;

    void registerHistogramFamily(const std::string &name,
                                 const std::string &help = "",
                                 const Labels &labels = {}) override;

    Counter *registerCounterMetric(const std::string &name,
                                   const Labels &labels = {}) override;

    Gauge *registerGaugeMetric(const std::string &name,
                               const Labels &labels = {}) override;

    Histogram *registerHistogramMetric(
        const std::string &name,
        const std::vector<double> &bucket_boundaries,
        const Labels &labels = {}) override;

   private:
    using AnyFamily =
        std::variant<prometheus::Family<prometheus::Counter> *,
                     prometheus::Family<prometheus::Gauge> *,
                     prometheus::Family<prometheus::Histogram> *>;

    template <typename Builder>
    void registerFamily(Builder &&builder,
                        const std::string &name,
                        const std::string &help,
                        const Labels &labels);

    template <typename T>
    prometheus::Family<T> &family(const std::string &name);

    std::shared_ptr<prometheus::Registry> registry_;
    std::mutex mutex_;
    std::unordered_map<std::string, AnyFamily> families_;
    std::vector<std::unique_ptr<Counter>> counters_;
    std::vector<std::unique_ptr<Gauge>> gauges_;
    std::vector<std::unique_ptr<Histogram>> histograms_;
  };

}  // namespace tessera::metrics
