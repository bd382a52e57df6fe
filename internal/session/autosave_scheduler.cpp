#include "autosave_scheduler.hpp"

#include "internal/history/bookmark_index.hpp"
#include "internal/history/change_detector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/navigation_controller.hpp"
#include "internal/session/rendering_surface.hpp"
#include "internal/util/errors.hpp"

namespace inkvault::session {

using inkvault::observability::BoolField;
using inkvault::observability::ElapsedField;
using inkvault::observability::ErrorField;
using inkvault::observability::IndexField;

const char* ToString(TickOutcome outcome) {
  switch (outcome) {
    case TickOutcome::kProtected:
      return "protected";
    case TickOutcome::kAppendInFlight:
      return "append_in_flight";
    case TickOutcome::kManualSaveOutstanding:
      return "manual_save_outstanding";
    case TickOutcome::kRequested:
      return "requested";
  }
  return "unknown";
}

const char* ToString(ObserveOutcome outcome) {
  switch (outcome) {
    case ObserveOutcome::kStale:
      return "stale";
    case ObserveOutcome::kProtected:
      return "protected";
    case ObserveOutcome::kUnchanged:
      return "unchanged";
    case ObserveOutcome::kAppending:
      return "appending";
    case ObserveOutcome::kBookmarked:
      return "bookmarked";
  }
  return "unknown";
}

const char* ToString(ManualSaveOutcome outcome) {
  switch (outcome) {
    case ManualSaveOutcome::kRequested:
      return "requested";
    case ManualSaveOutcome::kQueued:
      return "queued";
    case ManualSaveOutcome::kBookmarked:
      return "bookmarked";
  }
  return "unknown";
}

AutoSaveScheduler::AutoSaveScheduler(NavigationController& navigation, history::BookmarkIndex& bookmarks, const history::ChangeDetector& detector,
                                     RenderingSurface& surface, AppendWorker& worker, const util::MonotonicClock& clock,
                                     util::Duration response_timeout, std::function<void()> on_changed)
    : navigation_(navigation),
      bookmarks_(bookmarks),
      detector_(detector),
      surface_(surface),
      worker_(worker),
      clock_(clock),
      response_timeout_(response_timeout),
      on_changed_(std::move(on_changed)) {}

// ------------------------------------------------------------
// Tick
// ------------------------------------------------------------

TickOutcome AutoSaveScheduler::Tick() {
  navigation_.Refresh();

  if (navigation_.IsProtected()) return TickOutcome::kProtected;
  if (append_in_flight_) return TickOutcome::kAppendInFlight;

  // An unanswered auto request is superseded; a manual one only once it has timed out.
  if (outstanding_ && outstanding_->manual) {
    const auto waited = clock_.Now() - outstanding_->issued_at;
    if (waited < response_timeout_) return TickOutcome::kManualSaveOutstanding;

    INKVAULT_LOG_WARN("save view request never answered, resuming auto-save",
                      {IndexField("request_id", outstanding_->id), ElapsedField("waited_ms", waited)});
    last_error_ = "save view request timed out";
    NotifyChanged();
  }

  IssueRequest(false);
  return TickOutcome::kRequested;
}

uint64_t AutoSaveScheduler::IssueRequest(bool manual) {
  const auto id = next_request_id_++;
  outstanding_  = Request{id, manual, clock_.Now()};
  surface_.RequestCurrentState(id);
  return id;
}

// ------------------------------------------------------------
// Manual save
// ------------------------------------------------------------

ManualSaveOutcome AutoSaveScheduler::RequestManualSave() {
  navigation_.Refresh();

  if (navigation_.IsProtected()) {
    const auto* pending = model::PendingLoad(navigation_.Protection());
    if (pending && !pending->confirmed) {
      throw util::InvalidState("cannot save while a historical state is loading");
    }
    // Confirmed and settling: the surface shows exactly the cursor state.
    if (auto cursor = navigation_.Cursor()) {
      Bookmark(*cursor);
      NotifyChanged();
      return ManualSaveOutcome::kBookmarked;
    }
  }

  if (append_in_flight_) {
    manual_queued_ = true;
    return ManualSaveOutcome::kQueued;
  }

  IssueRequest(true);
  return ManualSaveOutcome::kRequested;
}

// ------------------------------------------------------------
// Surface response
// ------------------------------------------------------------

ObserveOutcome AutoSaveScheduler::OnCurrentState(uint64_t request_id, const inkvault::v1::AnnotationState& candidate) {
  if (!outstanding_ || outstanding_->id != request_id) {
    INKVAULT_LOG_DEBUG("stale state response ignored", {IndexField("request_id", request_id)});
    return ObserveOutcome::kStale;
  }
  const bool manual = outstanding_->manual;
  outstanding_.reset();

  // Captured before a navigation began; the surface now shows something else.
  if (navigation_.IsProtected()) {
    if (manual) {
      last_error_ = "save interrupted by navigation";
      NotifyChanged();
    }
    return ObserveOutcome::kProtected;
  }

  if (!detector_.ShouldSave(candidate, navigation_.LastSavedState())) {
    if (!manual) return ObserveOutcome::kUnchanged;

    if (auto cursor = navigation_.Cursor()) Bookmark(*cursor);
    NotifyChanged();
    return ObserveOutcome::kBookmarked;
  }

  append_in_flight_ = true;
  worker_.Submit(candidate, [this, manual](AppendResult result) { OnAppendComplete(std::move(result), manual); });
  return ObserveOutcome::kAppending;
}

// ------------------------------------------------------------
// Append completion
// ------------------------------------------------------------

void AutoSaveScheduler::OnAppendComplete(AppendResult result, bool manual) {
  append_in_flight_ = false;

  if (!result.ok()) {
    save_pending_ = true;
    last_error_   = result.error;
    INKVAULT_LOG_WARN("auto-save append failed, will retry", {ErrorField(result.error), BoolField("manual", manual)});
    manual_queued_ = manual_queued_ || manual;
  } else {
    save_pending_ = false;
    last_error_.clear();

    if (navigation_.IsProtected()) {
      // The user navigated while the write was in flight; the cursor belongs to that request.
      navigation_.RecordSavedDuringLoad(*result.index, result.state);
      INKVAULT_LOG_INFO("snapshot saved during navigation, cursor unchanged", {IndexField("index", *result.index)});
    } else {
      navigation_.RecordSaved(*result.index, result.state);
      INKVAULT_LOG_INFO("snapshot saved", {IndexField("index", *result.index)});
    }

    if (manual) Bookmark(*result.index);
  }

  if (manual_queued_ && !save_pending_) {
    manual_queued_ = false;
    try {
      RequestManualSave();
    } catch (const util::InvalidState& e) {
      last_error_ = e.what();
    }
  }

  NotifyChanged();
}

bool AutoSaveScheduler::Bookmark(uint64_t index) {
  try {
    bookmarks_.Mark(index);
    return true;
  } catch (const util::IOError& e) {
    last_error_ = e.what();
    INKVAULT_LOG_WARN("bookmark could not be persisted", {IndexField("index", index), ErrorField(e.what())});
  } catch (const util::NotFound& e) {
    last_error_ = e.what();
    INKVAULT_LOG_WARN("bookmark target missing", {IndexField("index", index), ErrorField(e.what())});
  }
  return false;
}

void AutoSaveScheduler::NotifyChanged() {
  if (on_changed_) on_changed_();
}

} // namespace inkvault::session
