#pragma once

#include <optional>

#include "inkvault/v1.hpp"

namespace inkvault::history {

/*
  Decides whether a freshly observed state differs from the last saved one.

  Equality is a full field-by-field comparison of the geometry and is
  order-sensitive: the same strokes in a different order are a change.
  With a non-zero tolerance, doubles (coordinates, thickness) compare
  equal when they differ by at most that absolute margin.
*/
class ChangeDetector {
 public:
  explicit ChangeDetector(double coordinate_tolerance = 0.0);

  bool ShouldSave(const inkvault::v1::AnnotationState& candidate, const inkvault::v1::AnnotationState& last_saved) const;

  // Nothing saved yet means any candidate is new.
  bool ShouldSave(const inkvault::v1::AnnotationState& candidate, const std::optional<inkvault::v1::AnnotationState>& last_saved) const;

  double Tolerance() const {
    return tolerance_;
  }

 private:
  double tolerance_;
};

} // namespace inkvault::history
