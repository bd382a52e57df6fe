#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "inkvault/v1.hpp"
#include "internal/model/protection_state.hpp"
#include "internal/util/time.hpp"

namespace inkvault::history {
class SnapshotStore;
class BookmarkIndex;
} // namespace inkvault::history

namespace inkvault::session {

class RenderingSurface;

enum class NavigationKind {
  kUndo,
  kRedo,
  kPrevBookmark,
  kNextBookmark,
};

const char* ToString(NavigationKind kind);

enum class ConfirmOutcome {
  kApplied,
  // Confirmation for a target that is no longer the pending one.
  kStale,
};

struct NavigationTimings {
  util::Duration grace_window = std::chrono::seconds(2);
  util::Duration load_timeout = std::chrono::seconds(30);
};

/*
  Undo/redo/bookmark-jump state machine of one session.

  Owns the cursor, the last saved state and the protection state that
  keeps auto-save from mistaking a loaded historical state for a new edit:

      Idle --navigate--> Loading{target, t, unconfirmed}
      Loading --navigate--> Loading{new target, t', unconfirmed}
      Loading --confirm(target)--> Loading{target, now, confirmed}
      Loading{confirmed} --grace elapsed--> Idle
      Loading{unconfirmed} --load_timeout elapsed--> Idle (warning)
      Loading --read failure--> Idle

  Confirmations that do not match the pending target are stale and ignored,
  so the most recent request always wins.

  Not thread safe: every call comes from the session executor.
*/
class NavigationController {
 public:
  NavigationController(const history::SnapshotStore& store, const history::BookmarkIndex& bookmarks, RenderingSurface& surface,
                       const util::MonotonicClock& clock, NavigationTimings timings);

  /*
    Each returns the requested target.

    Throws util::NoSuchTransition at a boundary (nothing changes), or
    util::NotFound / util::SerializationError when the target cannot be
    read (protection is cleared, cursor unchanged).
  */
  uint64_t Undo();
  uint64_t Redo();
  uint64_t JumpToPrevBookmark();
  uint64_t JumpToNextBookmark();
  uint64_t Navigate(NavigationKind kind);

  bool CanNavigate(NavigationKind kind) const;

  ConfirmOutcome OnLoadConfirmed(uint64_t confirmed_target);

  // True while a load is unconfirmed or inside its grace window.
  bool IsProtected() const;

  // Settles elapsed grace windows and force-clears stalled loads.
  void Refresh();

  // A new snapshot was appended from the current drawing.
  void RecordSaved(uint64_t index, const inkvault::v1::AnnotationState& state);

  /*
    An append captured before the current navigation landed while it was
    protected. A confirmation supersedes it; if the load is abandoned
    (timeout or read failure) it becomes the cursor and last saved state,
    since the surface still shows that drawing.
  */
  void RecordSavedDuringLoad(uint64_t index, const inkvault::v1::AnnotationState& state);

  std::optional<uint64_t> Cursor() const {
    return cursor_;
  }
  const std::optional<inkvault::v1::AnnotationState>& LastSavedState() const {
    return last_saved_;
  }
  const model::ProtectionState& Protection() const {
    return protection_;
  }

 private:
  // Where the next navigation starts: the pending target if any, else the cursor.
  std::optional<uint64_t> Origin() const;
  std::optional<uint64_t> FindTarget(NavigationKind kind, uint64_t origin) const;
  void                    ClearPending();
  // Drops protection and applies a save that landed while the load was unconfirmed.
  void                    AbandonPending();

  const history::SnapshotStore& store_;
  const history::BookmarkIndex& bookmarks_;
  RenderingSurface&             surface_;
  const util::MonotonicClock&   clock_;
  NavigationTimings             timings_;

  std::optional<uint64_t>                      cursor_;
  std::optional<inkvault::v1::AnnotationState> last_saved_;
  model::ProtectionState                       protection_{model::Idle{}};

  // State sent with the pending load; becomes last_saved_ on confirmation.
  std::optional<inkvault::v1::AnnotationState> pending_state_;

  struct DeferredSave {
    uint64_t                      index = 0;
    inkvault::v1::AnnotationState state;
  };
  std::optional<DeferredSave> deferred_save_;
};

} // namespace inkvault::session
