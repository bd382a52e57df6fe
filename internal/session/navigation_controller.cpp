#include "navigation_controller.hpp"

#include <string>

#include "internal/history/bookmark_index.hpp"
#include "internal/history/snapshot_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/rendering_surface.hpp"
#include "internal/util/errors.hpp"

namespace inkvault::session {

using inkvault::observability::ElapsedField;
using inkvault::observability::ErrorField;
using inkvault::observability::IndexField;
using inkvault::observability::StringField;
using model::Idle;
using model::Loading;

const char* ToString(NavigationKind kind) {
  switch (kind) {
    case NavigationKind::kUndo:
      return "undo";
    case NavigationKind::kRedo:
      return "redo";
    case NavigationKind::kPrevBookmark:
      return "prev_bookmark";
    case NavigationKind::kNextBookmark:
      return "next_bookmark";
  }
  return "unknown";
}

NavigationController::NavigationController(const history::SnapshotStore& store, const history::BookmarkIndex& bookmarks,
                                           RenderingSurface& surface, const util::MonotonicClock& clock, NavigationTimings timings)
    : store_(store), bookmarks_(bookmarks), surface_(surface), clock_(clock), timings_(timings) {
  // A session starts Idle at its most recent snapshot.
  cursor_ = store_.Latest();
  if (!cursor_) return;

  try {
    last_saved_ = store_.Read(*cursor_);
  } catch (const util::SerializationError& e) {
    INKVAULT_LOG_ERROR("latest snapshot unreadable, next edit starts fresh", {IndexField("index", *cursor_), ErrorField(e.what())});
  } catch (const util::NotFound& e) {
    INKVAULT_LOG_WARN("latest snapshot missing", {IndexField("index", *cursor_), ErrorField(e.what())});
  }
}

// ------------------------------------------------------------
// Navigation
// ------------------------------------------------------------

uint64_t NavigationController::Undo() {
  return Navigate(NavigationKind::kUndo);
}

uint64_t NavigationController::Redo() {
  return Navigate(NavigationKind::kRedo);
}

uint64_t NavigationController::JumpToPrevBookmark() {
  return Navigate(NavigationKind::kPrevBookmark);
}

uint64_t NavigationController::JumpToNextBookmark() {
  return Navigate(NavigationKind::kNextBookmark);
}

std::optional<uint64_t> NavigationController::Origin() const {
  if (const auto* pending = model::PendingLoad(protection_)) return pending->target;
  return cursor_;
}

std::optional<uint64_t> NavigationController::FindTarget(NavigationKind kind, uint64_t origin) const {
  switch (kind) {
    case NavigationKind::kUndo:
      return store_.PredecessorOf(origin);
    case NavigationKind::kRedo:
      return store_.SuccessorOf(origin);
    case NavigationKind::kPrevBookmark:
      if (!bookmarks_.HasPredecessor(origin)) return std::nullopt;
      return bookmarks_.PredecessorOf(origin);
    case NavigationKind::kNextBookmark:
      if (!bookmarks_.HasSuccessor(origin)) return std::nullopt;
      return bookmarks_.SuccessorOf(origin);
  }
  return std::nullopt;
}

bool NavigationController::CanNavigate(NavigationKind kind) const {
  auto origin = Origin();
  return origin && FindTarget(kind, *origin).has_value();
}

uint64_t NavigationController::Navigate(NavigationKind kind) {
  auto origin = Origin();
  if (!origin) {
    throw util::NoSuchTransition(std::string(ToString(kind)) + ": history is empty");
  }

  auto target = FindTarget(kind, *origin);
  if (!target) {
    throw util::NoSuchTransition(std::string(ToString(kind)) + ": nothing beyond " + std::to_string(*origin));
  }

  // Supersedes any earlier pending request.
  protection_ = Loading{*target, clock_.Now(), false};

  inkvault::v1::AnnotationState state;
  try {
    state = store_.Read(*target);
  } catch (const util::SerializationError& e) {
    AbandonPending();
    INKVAULT_LOG_ERROR("navigation target corrupt", {StringField("op", ToString(kind)), IndexField("target", *target), ErrorField(e.what())});
    throw;
  } catch (const util::NotFound& e) {
    AbandonPending();
    INKVAULT_LOG_WARN("navigation target missing", {StringField("op", ToString(kind)), IndexField("target", *target), ErrorField(e.what())});
    throw;
  }

  pending_state_ = state;
  surface_.LoadState(*target, *pending_state_);

  INKVAULT_LOG_INFO("navigation requested", {StringField("op", ToString(kind)), IndexField("from", *origin), IndexField("target", *target)});
  return *target;
}

// ------------------------------------------------------------
// Confirmation
// ------------------------------------------------------------

ConfirmOutcome NavigationController::OnLoadConfirmed(uint64_t confirmed_target) {
  const auto* pending = model::PendingLoad(protection_);
  if (!pending || pending->target != confirmed_target) {
    INKVAULT_LOG_DEBUG("stale load confirmation ignored", {IndexField("confirmed", confirmed_target)});
    return ConfirmOutcome::kStale;
  }

  if (pending_state_) last_saved_ = *pending_state_;
  cursor_ = confirmed_target;
  deferred_save_.reset();

  // Grace window runs from arrival, not from the request.
  protection_ = Loading{confirmed_target, clock_.Now(), true};

  INKVAULT_LOG_INFO("historical state loaded", {IndexField("cursor", confirmed_target)});
  return ConfirmOutcome::kApplied;
}

// ------------------------------------------------------------
// Protection
// ------------------------------------------------------------

bool NavigationController::IsProtected() const {
  const auto* pending = model::PendingLoad(protection_);
  if (!pending) return false;
  if (!pending->confirmed) return true;
  return clock_.Now() - pending->issued_at < timings_.grace_window;
}

void NavigationController::Refresh() {
  const auto* pending = model::PendingLoad(protection_);
  if (!pending) return;

  const auto elapsed = clock_.Now() - pending->issued_at;

  if (pending->confirmed) {
    if (elapsed >= timings_.grace_window) ClearPending();
    return;
  }

  if (elapsed >= timings_.load_timeout) {
    INKVAULT_LOG_WARN("navigation load never confirmed, resuming auto-save",
                      {IndexField("target", pending->target), ElapsedField("waited_ms", elapsed)});
    AbandonPending();
  }
}

void NavigationController::ClearPending() {
  protection_ = Idle{};
  pending_state_.reset();
}

void NavigationController::AbandonPending() {
  ClearPending();
  if (!deferred_save_) return;

  INKVAULT_LOG_INFO("load abandoned, cursor moves to snapshot saved meanwhile", {IndexField("cursor", deferred_save_->index)});
  RecordSaved(deferred_save_->index, deferred_save_->state);
}

void NavigationController::RecordSavedDuringLoad(uint64_t index, const inkvault::v1::AnnotationState& state) {
  const auto* pending = model::PendingLoad(protection_);
  // Inside a confirmed grace window the loaded state already owns the cursor.
  if (!pending || pending->confirmed) return;
  deferred_save_ = DeferredSave{index, state};
}

void NavigationController::RecordSaved(uint64_t index, const inkvault::v1::AnnotationState& state) {
  cursor_     = index;
  last_saved_ = state;
  deferred_save_.reset();
}

} // namespace inkvault::session
