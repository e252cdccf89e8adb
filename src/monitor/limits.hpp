#pragma once
#include "../core/sample.hpp"

/**
 * @brief Inclusive acceptable range for one metric
 *
 * Invariant: min <= max (enforced when the configuration is loaded).
 * Values exactly on either bound are nominal.
 */
struct Range {
  double min{0.0};  ///< Lowest acceptable value
  double max{0.0};  ///< Highest acceptable value

  bool valid() const { return min <= max; }

  bool contains(double v) const { return v >= min && v <= max; }

  /**
   * @brief Classify a value against the range
   * @param v Measured value
   * @return Below if v < min, Above if v > max, otherwise Ok
   */
  Status classify(double v) const {
    if (v < min) return Status::Below;
    if (v > max) return Status::Above;
    return Status::Ok;
  }

  /**
   * @brief Bound that a value in the given state has crossed
   */
  double breached_bound(Status s) const {
    return s == Status::Below ? min : max;
  }
};
