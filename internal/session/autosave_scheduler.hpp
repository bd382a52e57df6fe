#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "inkvault/v1.hpp"
#include "internal/session/append_worker.hpp"
#include "internal/util/time.hpp"

namespace inkvault::history {
class BookmarkIndex;
class ChangeDetector;
} // namespace inkvault::history

namespace inkvault::session {

class NavigationController;
class RenderingSurface;

enum class TickOutcome {
  kProtected,
  kAppendInFlight,
  kManualSaveOutstanding,
  kRequested,
};

enum class ObserveOutcome {
  // Not the latest outstanding request.
  kStale,
  // A navigation started after the request went out.
  kProtected,
  kUnchanged,
  kAppending,
  kBookmarked,
};

enum class ManualSaveOutcome {
  kRequested,
  kQueued,
  kBookmarked,
};

const char* ToString(TickOutcome outcome);
const char* ToString(ObserveOutcome outcome);
const char* ToString(ManualSaveOutcome outcome);

/*
  Periodic change detector and writer.

  Each tick:
    1. protected by navigation   -> return, no I/O
    2. an append still in flight -> return (single writer)
    3. ask the surface for its current state, tagged with a fresh id

  The answer is matched to the latest id only. A changed state is appended
  through the AppendWorker; success moves the cursor to the new index,
  failure sets "save pending" and the next tick simply tries again.

  Also carries the manual "save view" path, which bookmarks what the user
  sees, appending it first if it is not the last saved state. A manual
  request blocks ticks only until `response_timeout`; after that the next
  tick supersedes it and the lost save is reported as the last error.

  Not thread safe: every call comes from the session executor.
*/
class AutoSaveScheduler {
 public:
  AutoSaveScheduler(NavigationController& navigation, history::BookmarkIndex& bookmarks, const history::ChangeDetector& detector,
                    RenderingSurface& surface, AppendWorker& worker, const util::MonotonicClock& clock, util::Duration response_timeout,
                    std::function<void()> on_changed = {});

  TickOutcome Tick();

  // Throws util::InvalidState while a navigation load is unconfirmed.
  ManualSaveOutcome RequestManualSave();

  ObserveOutcome OnCurrentState(uint64_t request_id, const inkvault::v1::AnnotationState& candidate);

  bool SavePending() const {
    return save_pending_;
  }
  bool AppendInFlight() const {
    return append_in_flight_;
  }
  const std::string& LastError() const {
    return last_error_;
  }

 private:
  struct Request {
    uint64_t        id     = 0;
    bool            manual = false;
    util::TimePoint issued_at{};
  };

  uint64_t IssueRequest(bool manual);
  void     OnAppendComplete(AppendResult result, bool manual);
  bool     Bookmark(uint64_t index);
  void     NotifyChanged();

  NavigationController&           navigation_;
  history::BookmarkIndex&         bookmarks_;
  const history::ChangeDetector&  detector_;
  RenderingSurface&               surface_;
  AppendWorker&                   worker_;
  const util::MonotonicClock&     clock_;
  util::Duration                  response_timeout_;
  std::function<void()>           on_changed_;

  uint64_t               next_request_id_ = 1;
  std::optional<Request> outstanding_;

  bool append_in_flight_ = false;
  bool manual_queued_    = false;
  bool save_pending_     = false;

  std::string last_error_;
};

} // namespace inkvault::session
