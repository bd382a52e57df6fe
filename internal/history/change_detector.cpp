#include "change_detector.hpp"

#include <google/protobuf/util/field_comparator.h>
#include <google/protobuf/util/message_differencer.h>

namespace inkvault::history {

using google::protobuf::util::DefaultFieldComparator;
using google::protobuf::util::MessageDifferencer;
using inkvault::v1::AnnotationState;

ChangeDetector::ChangeDetector(double coordinate_tolerance) : tolerance_(coordinate_tolerance) {
}

bool ChangeDetector::ShouldSave(const AnnotationState& candidate, const AnnotationState& last_saved) const {
  if (tolerance_ <= 0.0) {
    return !MessageDifferencer::Equals(candidate, last_saved);
  }

  DefaultFieldComparator comparator;
  comparator.set_float_comparison(DefaultFieldComparator::APPROXIMATE);
  comparator.SetDefaultFractionAndMargin(0.0, tolerance_);

  MessageDifferencer differencer;
  differencer.set_field_comparator(&comparator);
  differencer.set_repeated_field_comparison(MessageDifferencer::AS_LIST);
  return !differencer.Compare(candidate, last_saved);
}

bool ChangeDetector::ShouldSave(const AnnotationState& candidate, const std::optional<AnnotationState>& last_saved) const {
  if (!last_saved) return true;
  return ShouldSave(candidate, *last_saved);
}

} // namespace inkvault::history
