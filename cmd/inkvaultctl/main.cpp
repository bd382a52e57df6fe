#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "inkvault/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/history/bookmark_index.hpp"
#include "internal/history/snapshot_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_snapshot_backend.hpp"
#include "internal/util/errors.hpp"

using inkvault::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage:\n"
            << "  inkvaultctl [--config <config.yaml>] images\n"
            << "  inkvaultctl [--config <config.yaml>] history <image>\n"
            << "  inkvaultctl [--config <config.yaml>] show <image> [index]\n"
            << "  inkvaultctl [--config <config.yaml>] bookmarks <image>\n"
            << "  inkvaultctl [--config <config.yaml>] mark <image> <index>\n"
            << "  inkvaultctl [--config <config.yaml>] status [image]\n";
}

static std::optional<uint64_t> ParseIndex(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  try {
    return static_cast<uint64_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

static inkvault::storage::SnapshotBackendPtr OpenExisting(const RuntimeConfig& config, const std::string& image_name) {
  auto session_root = inkvault::storage::common::SessionRoot(config.storage().root(), image_name);
  if (!std::filesystem::is_directory(session_root / inkvault::storage::common::kLiveDirectory)) {
    throw inkvault::util::NotFound("no history for image " + image_name);
  }
  return std::make_shared<inkvault::storage::DiskSnapshotBackend>(session_root);
}

/*
  Offline view of one image. Must not be used while a session has the same
  image open: the live process keeps its own in-memory index.
*/
struct ImageHistory {
  ImageHistory(const RuntimeConfig& config, const std::string& image_name)
      : backend(OpenExisting(config, image_name)),
        store(backend, inkvault::history::SnapshotStoreOptions{0, config.storage().fsync(), {}}),
        bookmarks(backend, store, config.storage().fsync()) {}

  inkvault::storage::SnapshotBackendPtr backend;
  inkvault::history::SnapshotStore      store;
  inkvault::history::BookmarkIndex      bookmarks;
};

static int Images(const RuntimeConfig& config) {
  const std::filesystem::path root = config.storage().root();

  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    std::cerr << "storage root not found: " << root << "\n";
    return 2;
  }

  auto status = inkvault::factory::BuildStatusRepository(config);
  for (const auto& entry : std::filesystem::directory_iterator(root)) {
    if (!entry.is_directory()) continue;
    if (!std::filesystem::is_directory(entry.path() / inkvault::storage::common::kLiveDirectory)) continue;

    const auto   name = entry.path().filename().string();
    ImageHistory history(config, name);

    auto record = status->Get(name);
    std::cout << name << " snapshots=" << history.store.Size() << " bookmarks=" << history.bookmarks.Size()
              << " done=" << (record && record->done) << " ink_found=" << (record && record->ink_found) << "\n";
  }
  return 0;
}

static int History(const RuntimeConfig& config, const std::string& image_name) {
  ImageHistory history(config, image_name);
  for (auto index : history.store.ListIndices()) {
    std::cout << inkvault::storage::common::RecordFileName(index) << (history.bookmarks.IsMarked(index) ? " *" : "") << "\n";
  }
  return 0;
}

static int Show(const RuntimeConfig& config, const std::string& image_name, std::optional<uint64_t> index) {
  ImageHistory history(config, image_name);

  if (!index) index = history.store.Latest();
  if (!index) {
    std::cerr << "no snapshots for " << image_name << "\n";
    return 2;
  }

  auto record = history.store.ReadRecord(*index);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render record: " << status.message() << "\n";
    return 2;
  }

  std::cout << json << "\n";
  return 0;
}

static int Bookmarks(const RuntimeConfig& config, const std::string& image_name) {
  ImageHistory history(config, image_name);
  for (auto index : history.bookmarks.List()) std::cout << index << "\n";
  return 0;
}

static int Mark(const RuntimeConfig& config, const std::string& image_name, uint64_t index) {
  ImageHistory history(config, image_name);
  const bool   added = history.bookmarks.Mark(index);
  std::cout << (added ? "marked " : "already marked ") << index << "\n";
  return 0;
}

static int Status(const RuntimeConfig& config, const std::optional<std::string>& image_name) {
  auto status = inkvault::factory::BuildStatusRepository(config);

  if (image_name) {
    auto record = status->Get(*image_name);
    if (!record) {
      std::cout << *image_name << " done=0 ink_found=0 (never reviewed)\n";
      return 0;
    }
    std::cout << record->image_name << " done=" << record->done << " ink_found=" << record->ink_found
              << " last_updated_ms=" << record->last_updated_ms << "\n";
    return 0;
  }

  auto counts = status->Count();
  std::cout << "total=" << counts.total << "\n";
  std::cout << "done=" << counts.done << "\n";
  std::cout << "ink_found=" << counts.ink_found << "\n";
  return 0;
}

int main(int argc, char** argv) {
  int arg = 1;

  RuntimeConfig config;
  try {
    if (argc > 2 && std::string(argv[1]) == "--config") {
      config = inkvault::config::ConfigLoader::LoadFromYaml(argv[2]);
      arg    = 3;
    } else {
      inkvault::config::ConfigLoader::ApplyDefaults(&config);
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  if (arg >= argc) {
    Usage();
    return 1;
  }

  // keep stdout clean for scripting unless asked otherwise
  if (config.logging().level().empty()) config.mutable_logging()->set_level("warn");
  inkvault::observability::InitializeLogging(config);

  const std::string cmd  = argv[arg];
  const int         rest = argc - arg - 1;

  int rc = 1;
  try {
    if (cmd == "images") {
      rc = Images(config);
    } else if (cmd == "history" && rest >= 1) {
      rc = History(config, argv[arg + 1]);
    } else if (cmd == "show" && rest >= 1) {
      std::optional<uint64_t> index;
      if (rest >= 2) {
        index = ParseIndex(argv[arg + 2]);
        if (!index) {
          std::cerr << "invalid index: " << argv[arg + 2] << "\n";
          return 1;
        }
      }
      rc = Show(config, argv[arg + 1], index);
    } else if (cmd == "bookmarks" && rest >= 1) {
      rc = Bookmarks(config, argv[arg + 1]);
    } else if (cmd == "mark" && rest >= 2) {
      auto index = ParseIndex(argv[arg + 2]);
      if (!index) {
        std::cerr << "invalid index: " << argv[arg + 2] << "\n";
        return 1;
      }
      rc = Mark(config, argv[arg + 1], *index);
    } else if (cmd == "status") {
      rc = Status(config, rest >= 1 ? std::optional<std::string>(argv[arg + 1]) : std::nullopt);
    } else {
      Usage();
    }
  } catch (const inkvault::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    rc = 2;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    rc = 2;
  }

  inkvault::observability::ShutdownLogging();
  return rc;
}
