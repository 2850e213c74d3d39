/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"

namespace prometheus {
  class Counter;
  class Gauge;
  class Histogram;
}  // namespace prometheus

namespace tessera::metrics {

  class PrometheusCounter : public Counter {
    friend class PrometheusRegistry;
    prometheus::Counter &m_;

   public:
    explicit PrometheusCounter(prometheus::Counter &m);
    void inc() override;
    void inc(double val) override;
  };

  class PrometheusGauge : public Gauge {
    friend class PrometheusRegistry;
    prometheus::Gauge &m_;

   public:
    explicit PrometheusGauge(prometheus::Gauge &m);
    void inc() override;
    void inc(double val) override;
    void dec() override;
    void dec(double val) override;
    void set(double val) override;
  };

  class PrometheusHistogram : public Histogram {
    friend class PrometheusRegistry;
    prometheus::Histogram &m_;

   public:
    explicit PrometheusHistogram(prometheus::Histogram &m);
    void observe(const double value) override;
  };

}  // namespace tessera::metrics
