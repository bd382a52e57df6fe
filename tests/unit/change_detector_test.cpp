#include "internal/history/change_detector.hpp"

#include <cassert>
#include <iostream>
#include <optional>

#include "support/session_fixtures.hpp"

namespace {

using inkvault::history::ChangeDetector;
using inkvault::testing::MakeState;
using inkvault::v1::AnnotationState;

void TestIdenticalStatesAreNotSaved() {
  ChangeDetector detector;
  assert(!detector.ShouldSave(MakeState({{1, 2}, {3, 4}}), MakeState({{1, 2}, {3, 4}})));
  assert(!detector.ShouldSave(AnnotationState{}, AnnotationState{}));
}

void TestAnyGeometryChangeIsSaved() {
  ChangeDetector detector;
  const auto     base = MakeState({{1, 2}, {3, 4}});

  assert(detector.ShouldSave(MakeState({{1, 2}, {3, 4.5}}), base));
  assert(detector.ShouldSave(MakeState({{1, 2}}), base));
  assert(detector.ShouldSave(MakeState({{1, 2}, {3, 4}}, "#00ff00"), base));

  auto thicker = base;
  thicker.mutable_strokes(0)->set_thickness(5.0);
  assert(detector.ShouldSave(thicker, base));
}

void TestStrokeOrderMatters() {
  ChangeDetector detector;
  assert(detector.ShouldSave(MakeState({{3, 4}, {1, 2}}), MakeState({{1, 2}, {3, 4}})));
}

void TestFirstStateIsAlwaysSaved() {
  ChangeDetector detector;
  assert(detector.ShouldSave(AnnotationState{}, std::optional<AnnotationState>{}));
}

void TestToleranceAbsorbsJitter() {
  ChangeDetector detector(0.001);
  const auto     base = MakeState({{100.0, 200.0}});

  assert(!detector.ShouldSave(MakeState({{100.0005, 199.9995}}), base));
  assert(detector.ShouldSave(MakeState({{100.01, 200.0}}), base));
  // tolerance never hides a structural change
  assert(detector.ShouldSave(MakeState({{100.0, 200.0}, {1, 1}}), base));
}

} // namespace

int main() {
  TestIdenticalStatesAreNotSaved();
  TestAnyGeometryChangeIsSaved();
  TestStrokeOrderMatters();
  TestFirstStateIsAlwaysSaved();
  TestToleranceAbsorbsJitter();

  std::cout << "inkvault_unit_change_detector: pass\n";
  return 0;
}
