/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace tessera::metrics {

  class Counter;
  class Gauge;
  class Histogram;

  /**
   * @brief the class stores metrics, provides interface to create metrics and
   * families of metrics of types counter, gauge and histogram
   * @param name Set the metric name.
   * @param help Set an additional description.
   * @param labels Assign a set of key-value pairs (= labels) to the
   * metric. All these labels are propagated to each time series within the
   * metric.
   */
  class Registry {
   public:
    virtual ~Registry() = default;

    /// Registering an already registered family keeps the existing one
    virtual void registerCounterFamily(
        const std::string &name,
        const std::string &help = "",
        const std::map<std::string, std::string> &labels = {}) = 0;

    virtual void registerGaugeFamily(
        const std::string &name,
        const std::string &help = "",
        const std::map<std::string, std::string> &labels = {}) = 0;

    virtual void registerHistogramFamily(
        const std::string &name,
        const std::string &help = "",
        const std::map<std::string, std::string> &labels = {}) = 0;

    /**
     * @brief create counter metrics object
     * @param name the name given at call `registerCounterFamily`
     * @return pointer without ownership, metrics of equal labels share their
     * value
     * @throws std::invalid_argument if no counter family has the name
     */
    virtual Counter *registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels = {}) = 0;

    /**
     * @brief create gauge metrics object
     * @param name the name given at call `registerGaugeFamily`
     * @return pointer without ownership
     * @throws std::invalid_argument if no gauge family has the name
     */
    virtual Gauge *registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels = {}) = 0;

    /**
     * @brief create histogram metrics object
     * @param name the name given at call `registerHistogramFamily`
     * @param bucket_boundaries a list of monotonically increasing values
     * @return pointer without ownership
     * See https://prometheus.io/docs/practices/histograms/ for detailed
     * explanations of histogram usage.
     * @throws std::invalid_argument if no histogram family has the name
     */
    virtual Histogram *registerHistogramMetric(
        const std::string &name,
        const std::vector<double> &bucket_boundaries,
        const std::map<std::string, std::string> &labels = {}) = 0;
  };

}  // namespace tessera::metrics
