#pragma once
/*
================================================================================
Core: Typed Error Taxonomy
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Give every failure mode its own catchable type so callers can separate:
      * fatal calibration-load errors (the process must not become ready)
      * per-call input rejections (only that call fails)
      * audit / IO failures
  - All types derive from calfuse::Error, so code + site are always present.

Notes:
  - Veto outcomes and clamping events are NOT errors and have no type here.
================================================================================
*/

#include <string>
#include <utility>
#include <vector>

#include "engine/core/error.hpp"

namespace calfuse {

// ----------------------------- Fatal (load time) -----------------------------

// Base for everything that represents a malformed calibration.
class CalibrationLoadError : public Error {
 public:
  CalibrationLoadError(ErrorCode code, std::string msg, ErrorSite site = {})
      : Error(code, std::move(msg), site) {}
};

class OutOfBoundsError final : public CalibrationLoadError {
 public:
  explicit OutOfBoundsError(std::string msg, ErrorSite site = {})
      : CalibrationLoadError(ErrorCode::kOutOfBounds, std::move(msg), site) {}
};

class IncompleteProvenanceError : public CalibrationLoadError {
 public:
  explicit IncompleteProvenanceError(std::string msg, ErrorSite site = {})
      : CalibrationLoadError(ErrorCode::kIncompleteProvenance, std::move(msg), site) {}

 protected:
  IncompleteProvenanceError(ErrorCode code, std::string msg, ErrorSite site)
      : CalibrationLoadError(code, std::move(msg), site) {}
};

// Evidence locator/content id that fails the traceability rules.
class InvalidEvidenceError final : public IncompleteProvenanceError {
 public:
  explicit InvalidEvidenceError(std::string msg, ErrorSite site = {})
      : IncompleteProvenanceError(ErrorCode::kInvalidEvidence, std::move(msg), site) {}
};

class WeightNormalizationError final : public CalibrationLoadError {
 public:
  explicit WeightNormalizationError(std::string msg, ErrorSite site = {})
      : CalibrationLoadError(ErrorCode::kWeightNormalization, std::move(msg), site) {}
};

class CyclicDependencyError final : public CalibrationLoadError {
 public:
  // cycle: ordered node ids, first node repeated at the end (a -> b -> a).
  CyclicDependencyError(std::string msg, std::vector<std::string> cycle, ErrorSite site = {})
      : CalibrationLoadError(ErrorCode::kCyclicDependency, std::move(msg), site),
        cycle_(std::move(cycle)) {}

  const std::vector<std::string>& cycle() const noexcept { return cycle_; }

 private:
  std::vector<std::string> cycle_;
};

class LevelInversionError final : public CalibrationLoadError {
 public:
  using Edge = std::pair<std::string, std::string>;

  LevelInversionError(std::string msg, std::vector<Edge> edges, ErrorSite site = {})
      : CalibrationLoadError(ErrorCode::kLevelInversion, std::move(msg), site),
        edges_(std::move(edges)) {}

  const std::vector<Edge>& edges() const noexcept { return edges_; }

 private:
  std::vector<Edge> edges_;
};

// Structurally malformed configuration document (bad types, duplicates, unknown refs).
class ConfigError final : public CalibrationLoadError {
 public:
  explicit ConfigError(std::string msg, ErrorSite site = {})
      : CalibrationLoadError(ErrorCode::kConfig, std::move(msg), site) {}
};

// ----------------------------- Per-call rejection ----------------------------

// Rejects a single evaluation call. field() names the offending input,
// expected() says what would have been accepted.
class InputError : public Error {
 public:
  InputError(std::string field, std::string expected, std::string msg, ErrorSite site = {})
      : InputError(ErrorCode::kInvalidInput, std::move(field), std::move(expected), std::move(msg), site) {}

  const std::string& field() const noexcept { return field_; }
  const std::string& expected() const noexcept { return expected_; }

 protected:
  InputError(ErrorCode code, std::string field, std::string expected, std::string msg, ErrorSite site)
      : Error(code, std::move(msg), site), field_(std::move(field)), expected_(std::move(expected)) {}

 private:
  std::string field_;
  std::string expected_;
};

class MissingLayerError final : public InputError {
 public:
  MissingLayerError(std::string field, std::string expected, std::string msg, ErrorSite site = {})
      : InputError(ErrorCode::kMissingLayer, std::move(field), std::move(expected), std::move(msg), site) {}
};

class UnexpectedLayerError final : public InputError {
 public:
  UnexpectedLayerError(std::string field, std::string expected, std::string msg, ErrorSite site = {})
      : InputError(ErrorCode::kUnexpectedLayer, std::move(field), std::move(expected), std::move(msg), site) {}
};

class ScoreOutOfRangeError final : public InputError {
 public:
  ScoreOutOfRangeError(std::string field, std::string expected, std::string msg, ErrorSite site = {})
      : InputError(ErrorCode::kScoreOutOfRange, std::move(field), std::move(expected), std::move(msg), site) {}
};

class UnknownRoleError final : public InputError {
 public:
  UnknownRoleError(std::string field, std::string expected, std::string msg, ErrorSite site = {})
      : InputError(ErrorCode::kUnknownRole, std::move(field), std::move(expected), std::move(msg), site) {}
};

class InvalidVetoError final : public InputError {
 public:
  InvalidVetoError(std::string field, std::string expected, std::string msg, ErrorSite site = {})
      : InputError(ErrorCode::kInvalidVeto, std::move(field), std::move(expected), std::move(msg), site) {}
};

// ----------------------------- Audit / IO ------------------------------------

class SignatureError final : public Error {
 public:
  explicit SignatureError(std::string msg, ErrorSite site = {})
      : Error(ErrorCode::kSignature, std::move(msg), site) {}
};

class IoError final : public Error {
 public:
  explicit IoError(std::string msg, ErrorSite site = {})
      : Error(ErrorCode::kIo, std::move(msg), site) {}
};

}  // namespace calfuse
