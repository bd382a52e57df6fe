#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "inkvault_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::filesystem::path& yaml_path) {
  try {
    (void)inkvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
storage:
  root: /srv/annotations
  fsync: false
autosave:
  tick_interval: 0.5s
  grace_window: 2.5s
  load_timeout: 10s
change_detection:
  coordinate_tolerance: 0.001
catalog:
  sqlite_path: /srv/annotations/status.db
)");

  auto config = inkvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.storage().root() == "/srv/annotations");
  assert(!config.storage().fsync());
  assert(config.autosave().tick_interval().nanos() == 500000000);
  assert(config.autosave().grace_window().seconds() == 2);
  assert(config.autosave().grace_window().nanos() == 500000000);
  assert(config.autosave().load_timeout().seconds() == 10);
  assert(config.change_detection().coordinate_tolerance() == 0.001);
  assert(config.catalog().sqlite_path() == "/srv/annotations/status.db");
}

void TestDefaultsFillMissingSections() {
  const auto yaml_path = WriteYaml("minimal", R"(logging:
  level: info
)");

  auto config = inkvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().root() == "./annotations");
  assert(config.storage().fsync());
  assert(config.autosave().tick_interval().seconds() == 1);
  assert(config.autosave().grace_window().seconds() == 2);
  assert(config.autosave().load_timeout().seconds() == 30);
  assert(config.change_detection().coordinate_tolerance() == 0.0);
  assert(config.catalog().sqlite_path().empty());
}

void TestEmptyFileMeansDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = inkvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().root() == "./annotations");
  assert(config.autosave().grace_window().seconds() == 2);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted", R"(storage:
  root: "00047"
catalog:
  sqlite_path: "C:\\inkvault\\\"quoted\"\\status.db"
)");

  auto config = inkvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().root() == "00047");
  assert(config.catalog().sqlite_path() == "C:\\inkvault\\\"quoted\"\\status.db");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(storage:
  root: /tmp/a
  retention_days: 7
)");

  assert(Rejects(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMalformedDurationIsRejected() {
  const auto yaml_path = WriteYaml("bad_duration", R"(autosave:
  grace_window: soon
)");

  assert(Rejects(yaml_path));
}

void TestNegativeToleranceIsRejected() {
  const auto yaml_path = WriteYaml("negative_tolerance", R"(change_detection:
  coordinate_tolerance: -0.5
)");

  assert(Rejects(yaml_path));
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsFillMissingSections();
  TestEmptyFileMeansDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMalformedDurationIsRejected();
  TestNegativeToleranceIsRejected();

  std::cout << "inkvault_unit_config_loader: pass\n";
  return 0;
}
