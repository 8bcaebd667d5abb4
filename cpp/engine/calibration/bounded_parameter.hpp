#pragma once
/*
================================================================================
Calibration: Closed Interval + Bounded Parameter
FILE: cpp/engine/calibration/bounded_parameter.hpp

Purpose:
  - Every tunable number in a calibration carries its admissible interval.
  - Construction is the only validation point; objects are immutable afterwards.

Hardening:
  - Out-of-bounds values are rejected (OutOfBoundsError), never clamped.
  - NaN/Inf are rejected for both values and interval endpoints.
================================================================================
*/

#include <string>

#include "engine/core/json_reader.hpp"

namespace calfuse {

class ClosedInterval final {
 public:
  // Throws OutOfBoundsError if lower > upper or either end is non-finite.
  ClosedInterval(double lower, double upper);

  double lower() const noexcept { return lower_; }
  double upper() const noexcept { return upper_; }

  // lower <= x <= upper. NaN is never contained.
  bool contains(double x) const noexcept { return x >= lower_ && x <= upper_; }

  std::string to_string() const;

 private:
  double lower_;
  double upper_;
};

class BoundedParameter final {
 public:
  // Throws OutOfBoundsError if name is empty, value is non-finite,
  // or !bounds.contains(value).
  BoundedParameter(std::string name, double value, ClosedInterval bounds);

  const std::string& name() const noexcept { return name_; }
  double value() const noexcept { return value_; }
  const ClosedInterval& bounds() const noexcept { return bounds_; }

  // {"bounds":[lo,hi],"name":"...","value":v}
  JsonValue to_json() const;

 private:
  std::string name_;
  double value_;
  ClosedInterval bounds_;
};

}  // namespace calfuse
