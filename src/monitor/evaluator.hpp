#pragma once
#include "../core/sample.hpp"
#include "config.hpp"

/**
 * @brief Classify a sample against the configured ranges
 *
 * Pure function. Each metric is judged independently against its own
 * inclusive range; a value equal to min or max is ok.
 */
inline Evaluation evaluate(const Sample& sample, const Config& config) {
  Evaluation ev;
  ev.sample = sample;
  ev.temp_status = config.temp_range.classify(sample.temperature_c);
  ev.humidity_status = config.humidity_range.classify(sample.humidity_pct);
  return ev;
}

/**
 * @brief Range that applies to a metric
 */
inline const Range& range_for(Metric m, const Config& config) {
  return m == Metric::Temperature ? config.temp_range : config.humidity_range;
}
