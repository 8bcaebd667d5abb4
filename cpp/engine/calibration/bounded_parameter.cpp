#include "engine/calibration/bounded_parameter.hpp"

#include <cmath>
#include <sstream>
#include <utility>

#include "engine/core/errors.hpp"

namespace calfuse {

ClosedInterval::ClosedInterval(double lower, double upper) : lower_(lower), upper_(upper) {
  if (!std::isfinite(lower) || !std::isfinite(upper)) {
    std::ostringstream oss;
    oss << "interval endpoints must be finite, got [" << lower << ", " << upper << "]";
    throw OutOfBoundsError(oss.str(), CALFUSE_SITE);
  }
  if (lower > upper) {
    std::ostringstream oss;
    oss << "interval lower bound " << lower << " exceeds upper bound " << upper;
    throw OutOfBoundsError(oss.str(), CALFUSE_SITE);
  }
}

std::string ClosedInterval::to_string() const {
  std::ostringstream oss;
  oss << "[" << lower_ << ", " << upper_ << "]";
  return oss.str();
}

BoundedParameter::BoundedParameter(std::string name, double value, ClosedInterval bounds)
    : name_(std::move(name)), value_(value), bounds_(bounds) {
  if (name_.empty()) {
    throw OutOfBoundsError("parameter name must not be empty", CALFUSE_SITE);
  }
  if (!std::isfinite(value_) || !bounds_.contains(value_)) {
    std::ostringstream oss;
    oss << "parameter '" << name_ << "' value " << value_ << " outside " << bounds_.to_string();
    throw OutOfBoundsError(oss.str(), CALFUSE_SITE);
  }
}

JsonValue BoundedParameter::to_json() const {
  JsonValue b = JsonValue::make_array();
  b.push_back(JsonValue::make_number(bounds_.lower()));
  b.push_back(JsonValue::make_number(bounds_.upper()));

  JsonValue o = JsonValue::make_object();
  o.set("bounds", std::move(b));
  o.set("name", JsonValue::make_string(name_));
  o.set("value", JsonValue::make_number(value_));
  return o;
}

}  // namespace calfuse
