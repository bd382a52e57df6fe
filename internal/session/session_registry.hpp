#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "inkvault/v1.hpp"
#include "internal/db/api/status_repository.hpp"
#include "internal/runtime/serial_executor.hpp"
#include "internal/session/editing_session.hpp"
#include "internal/util/time.hpp"

namespace inkvault::session {

struct SessionRegistryOptions {
  std::filesystem::path storage_root;

  bool              fsync                = true;
  double            coordinate_tolerance = 0.0;
  util::Duration    tick_interval        = std::chrono::seconds(1);
  NavigationTimings timings;
};

/*
  Open sessions of one storage root, at most one per image.

  Each session gets its own pair of serial executors and its own timer;
  sessions share only the storage root and the status catalog.
*/
class SessionRegistry {
 public:
  SessionRegistry(SessionRegistryOptions options, std::shared_ptr<db::StatusRepository> status,
                  std::shared_ptr<const util::MonotonicClock> clock = std::make_shared<util::SystemMonotonicClock>());
  ~SessionRegistry();

  SessionRegistry(const SessionRegistry&)            = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  /*
    Opens (creating on first use) the session for `image_name` and starts
    its auto-save timer. `surface` must outlive the session.

    Throws util::AlreadyExists if the image is already open,
    std::invalid_argument for an unusable image name, util::IOError if
    the session directory cannot be prepared.
  */
  std::shared_ptr<EditingSession> Open(const std::string& image_name, const inkvault::v1::ImageDimensions& dimensions, RenderingSurface& surface);

  // Stops the timer, drains pending appends and releases the session.
  bool Close(const std::string& image_name);
  void CloseAll();

  std::shared_ptr<EditingSession> Find(const std::string& image_name) const;
  std::vector<std::string>        OpenImages() const;

  const std::shared_ptr<db::StatusRepository>& Status() const {
    return status_;
  }

 private:
  struct Entry {
    std::shared_ptr<runtime::SerialExecutor> session_executor;
    std::shared_ptr<runtime::SerialExecutor> io_executor;
    std::shared_ptr<EditingSession>          session;
  };

  static void Shutdown(Entry& entry);

  SessionRegistryOptions                      options_;
  std::shared_ptr<db::StatusRepository>       status_;
  std::shared_ptr<const util::MonotonicClock> clock_;

  mutable std::mutex           mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace inkvault::session
