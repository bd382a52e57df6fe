#include "internal/observability/logging.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "config/config.pb.h"

namespace {

using inkvault::observability::BoolField;
using inkvault::observability::ElapsedField;
using inkvault::observability::ErrorField;
using inkvault::observability::FormatFields;
using inkvault::observability::ImageField;
using inkvault::observability::IndexField;
using inkvault::observability::IntField;

void TestFieldsAreSpaceSeparatedPairs() {
  assert(FormatFields({ImageField("slide_07"), IndexField("index", 47), BoolField("manual", true)}) == "image=slide_07 index=47 manual=true");
  assert(FormatFields({}).empty());
}

void TestIndexFieldKeepsFullUnsignedRange() {
  assert(FormatFields({IndexField("index", 18446744073709551615ull)}) == "index=18446744073709551615");
  assert(FormatFields({IntField("delta", -3)}) == "delta=-3");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatFields({ErrorField("snapshot 00047.pb missing")}) == "error=\"snapshot 00047.pb missing\"");
  assert(FormatFields({ErrorField("bad \"state\"")}) == "error=\"bad \\\"state\\\"\"");
  assert(FormatFields({ErrorField("")}) == "error=\"\"");
}

void TestElapsedFieldIsMilliseconds() {
  assert(FormatFields({ElapsedField("waited_ms", std::chrono::seconds(31))}) == "waited_ms=31000");
}

void TestLoggingInitializesFromConfig() {
  inkvault::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  inkvault::observability::InitializeLogging(config);
  INKVAULT_LOG_DEBUG("logging test", {ImageField("slide_07")});
  inkvault::observability::ShutdownLogging();
}

} // namespace

int main() {
  TestFieldsAreSpaceSeparatedPairs();
  TestIndexFieldKeepsFullUnsignedRange();
  TestValuesWithSpacesAreQuoted();
  TestElapsedFieldIsMilliseconds();
  TestLoggingInitializesFromConfig();

  std::cout << "inkvault_unit_logging: pass\n";
  return 0;
}
