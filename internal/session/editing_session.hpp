#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "inkvault/v1.hpp"
#include "internal/db/api/status_repository.hpp"
#include "internal/history/bookmark_index.hpp"
#include "internal/history/change_detector.hpp"
#include "internal/history/snapshot_store.hpp"
#include "internal/runtime/executor.hpp"
#include "internal/runtime/periodic_timer.hpp"
#include "internal/session/append_worker.hpp"
#include "internal/session/autosave_scheduler.hpp"
#include "internal/session/navigation_controller.hpp"
#include "internal/session/rendering_surface.hpp"
#include "internal/storage/snapshot_backend.hpp"
#include "internal/util/time.hpp"

namespace inkvault::session {

struct EditingSessionOptions {
  std::string                   image_name;
  inkvault::v1::ImageDimensions image_dimensions;

  bool              fsync                = true;
  double            coordinate_tolerance = 0.0;
  util::Duration    tick_interval        = std::chrono::seconds(1);
  NavigationTimings timings;
};

struct SessionExecutors {
  // Runs every mutation of the session, in order.
  std::shared_ptr<runtime::Executor> session;
  // Runs durable appends; must be serial.
  std::shared_ptr<runtime::Executor> io;
};

/*
  One open image: its live sequence, bookmarks, navigation, auto-save and
  review status, bound to one rendering surface.

  Every public entry point only posts to the session executor, so it may
  be called from any thread (UI callbacks, timer, surface responses).
  Failures never escape: they are logged and shown through
  RenderingSurface::ShowStatus.

  The owner must drain both executors (io first) before destroying the
  session; SessionRegistry does this on Close.
*/
class EditingSession {
 public:
  EditingSession(EditingSessionOptions options, storage::SnapshotBackendPtr backend, std::shared_ptr<db::StatusRepository> status,
                 RenderingSurface& surface, std::shared_ptr<const util::MonotonicClock> clock, SessionExecutors executors);
  ~EditingSession();

  EditingSession(const EditingSession&)            = delete;
  EditingSession& operator=(const EditingSession&) = delete;

  // Starts the auto-save timer. Tests drive Tick() by hand instead.
  void Start();
  void Stop();

  void Undo();
  void Redo();
  void JumpToPrevBookmark();
  void JumpToNextBookmark();

  // Bookmark what the user sees and set done = ink_found = true.
  void SaveCurrentView();

  // done flips; ink_found is cleared either way.
  void ToggleDone();
  // ink_found flips; done is left alone.
  void ToggleInkFound();

  void Tick();

  // Surface responses.
  void OnCurrentState(uint64_t request_id, inkvault::v1::AnnotationState state);
  void OnLoadConfirmed(uint64_t target);

  // Snapshot of the session as the surface would be shown it. The future
  // is broken if the session executor has already been stopped.
  std::future<SessionView> Describe();

  const std::string& ImageName() const {
    return options_.image_name;
  }

 private:
  void DoNavigate(NavigationKind kind);
  void DoSaveCurrentView();
  void DoTick();
  void DoToggleDone();
  void DoToggleInkFound();

  void        LoadStatus();
  void        WriteStatus(bool done, bool ink_found);
  SessionView BuildView() const;
  void        Publish(bool force);

  EditingSessionOptions                       options_;
  RenderingSurface&                           surface_;
  std::shared_ptr<const util::MonotonicClock> clock_;
  SessionExecutors                            executors_;
  std::shared_ptr<db::StatusRepository>       status_repo_;

  history::SnapshotStore   store_;
  history::BookmarkIndex   bookmarks_;
  history::ChangeDetector  detector_;
  NavigationController     navigation_;
  AppendWorker             worker_;
  AutoSaveScheduler        scheduler_;

  std::unique_ptr<runtime::PeriodicTimer> timer_;

  db::model::StatusRecord status_;
  std::string             last_error_;

  std::optional<SessionView> last_published_;
};

} // namespace inkvault::session
