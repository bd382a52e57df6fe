#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "inkvault/v1.hpp"

namespace inkvault::session {

/*
  What the rendering surface is shown about the session after every
  state-changing operation. Drives enabled/disabled controls and the
  transient "save pending" indicator.
*/
struct SessionView {
  std::optional<uint64_t> cursor;
  std::size_t             snapshots = 0;
  std::size_t             bookmarks = 0;

  bool can_undo              = false;
  bool can_redo              = false;
  bool can_jump_to_prev_mark = false;
  bool can_jump_to_next_mark = false;

  bool cursor_bookmarked = false;
  bool is_protected      = false;
  bool save_pending      = false;

  bool done      = false;
  bool ink_found = false;

  // Last user-visible failure, cleared by the next successful operation.
  std::string last_error;
};

inline bool operator==(const SessionView& a, const SessionView& b) {
  return a.cursor == b.cursor && a.snapshots == b.snapshots && a.bookmarks == b.bookmarks && a.can_undo == b.can_undo &&
         a.can_redo == b.can_redo && a.can_jump_to_prev_mark == b.can_jump_to_prev_mark &&
         a.can_jump_to_next_mark == b.can_jump_to_next_mark && a.cursor_bookmarked == b.cursor_bookmarked &&
         a.is_protected == b.is_protected && a.save_pending == b.save_pending && a.done == b.done && a.ink_found == b.ink_found &&
         a.last_error == b.last_error;
}

inline bool operator!=(const SessionView& a, const SessionView& b) {
  return !(a == b);
}

/*
  The component that draws the annotations and reports edits.

  All calls are made from the session executor. Both requests are
  asynchronous: the surface answers later through
      EditingSession::OnCurrentState(request_id, state)
      EditingSession::OnLoadConfirmed(target)
  from any thread.
*/
class RenderingSurface {
 public:
  virtual ~RenderingSurface() = default;

  // Report the full current drawing, tagged with `request_id`.
  virtual void RequestCurrentState(uint64_t request_id) = 0;

  // Replace the drawing with a historical state, then confirm `target`.
  virtual void LoadState(uint64_t target, const inkvault::v1::AnnotationState& state) = 0;

  virtual void ShowStatus(const SessionView& /*view*/) {}
};

} // namespace inkvault::session
