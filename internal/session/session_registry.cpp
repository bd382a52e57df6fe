#include "session_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_snapshot_backend.hpp"
#include "internal/util/errors.hpp"

namespace inkvault::session {

using inkvault::observability::ImageField;

SessionRegistry::SessionRegistry(SessionRegistryOptions options, std::shared_ptr<db::StatusRepository> status,
                                 std::shared_ptr<const util::MonotonicClock> clock)
    : options_(std::move(options)), status_(std::move(status)), clock_(std::move(clock)) {}

SessionRegistry::~SessionRegistry() {
  CloseAll();
}

std::shared_ptr<EditingSession> SessionRegistry::Open(const std::string& image_name, const inkvault::v1::ImageDimensions& dimensions,
                                                      RenderingSurface& surface) {
  auto session_root = storage::common::SessionRoot(options_.storage_root, image_name);

  std::lock_guard lock(mutex_);
  if (entries_.count(image_name)) {
    throw util::AlreadyExists("session already open: " + image_name);
  }

  Entry entry;
  entry.session_executor = std::make_shared<runtime::SerialExecutor>("session:" + image_name);
  entry.io_executor      = std::make_shared<runtime::SerialExecutor>("append:" + image_name);

  EditingSessionOptions session_options;
  session_options.image_name           = image_name;
  session_options.image_dimensions     = dimensions;
  session_options.fsync                = options_.fsync;
  session_options.coordinate_tolerance = options_.coordinate_tolerance;
  session_options.tick_interval        = options_.tick_interval;
  session_options.timings              = options_.timings;

  auto backend = std::make_shared<storage::DiskSnapshotBackend>(session_root);

  entry.session = std::make_shared<EditingSession>(std::move(session_options), std::move(backend), status_, surface, clock_,
                                                   SessionExecutors{entry.session_executor, entry.io_executor});

  entry.session_executor->Start();
  entry.io_executor->Start();
  entry.session->Start();

  auto session = entry.session;
  entries_.emplace(image_name, std::move(entry));
  return session;
}

void SessionRegistry::Shutdown(Entry& entry) {
  entry.session->Stop();
  // io first: its completions still land on the session executor.
  entry.io_executor->Stop();
  entry.session_executor->Stop();
}

bool SessionRegistry::Close(const std::string& image_name) {
  Entry entry;
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(image_name);
    if (it == entries_.end()) return false;
    entry = std::move(it->second);
    entries_.erase(it);
  }

  Shutdown(entry);
  INKVAULT_LOG_INFO("session closed", {ImageField(image_name)});
  return true;
}

void SessionRegistry::CloseAll() {
  std::map<std::string, Entry> entries;
  {
    std::lock_guard lock(mutex_);
    entries.swap(entries_);
  }

  for (auto& [image_name, entry] : entries) {
    Shutdown(entry);
    INKVAULT_LOG_INFO("session closed", {ImageField(image_name)});
  }
}

std::shared_ptr<EditingSession> SessionRegistry::Find(const std::string& image_name) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(image_name);
  return it == entries_.end() ? nullptr : it->second.session;
}

std::vector<std::string> SessionRegistry::OpenImages() const {
  std::lock_guard lock(mutex_);

  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [image_name, _] : entries_) out.push_back(image_name);
  return out;
}

} // namespace inkvault::session
