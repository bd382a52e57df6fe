#include "editing_session.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace inkvault::session {

using inkvault::observability::BoolField;
using inkvault::observability::ErrorField;
using inkvault::observability::ImageField;
using inkvault::observability::IntField;
using inkvault::observability::StringField;

namespace {

history::SnapshotStoreOptions StoreOptions(const EditingSessionOptions& options) {
  history::SnapshotStoreOptions out;
  out.fsync            = options.fsync;
  out.image_dimensions = options.image_dimensions;
  return out;
}

} // namespace

EditingSession::EditingSession(EditingSessionOptions options, storage::SnapshotBackendPtr backend, std::shared_ptr<db::StatusRepository> status,
                               RenderingSurface& surface, std::shared_ptr<const util::MonotonicClock> clock, SessionExecutors executors)
    : options_(std::move(options)),
      surface_(surface),
      clock_(std::move(clock)),
      executors_(std::move(executors)),
      status_repo_(std::move(status)),
      store_(backend, StoreOptions(options_)),
      bookmarks_(backend, store_, options_.fsync),
      detector_(options_.coordinate_tolerance),
      navigation_(store_, bookmarks_, surface_, *clock_, options_.timings),
      worker_(store_, executors_.io, executors_.session),
      scheduler_(navigation_, bookmarks_, detector_, surface_, worker_, *clock_, options_.timings.load_timeout, [this] { Publish(false); }) {
  LoadStatus();

  INKVAULT_LOG_INFO("session opened", {ImageField(options_.image_name), IntField("snapshots", static_cast<int64_t>(store_.Size())),
                                       IntField("bookmarks", static_cast<int64_t>(bookmarks_.Size()))});
}

EditingSession::~EditingSession() {
  Stop();
}

void EditingSession::Start() {
  if (timer_) return;
  timer_ = std::make_unique<runtime::PeriodicTimer>(executors_.session, options_.tick_interval, [this] { DoTick(); });
  timer_->Start();
  executors_.session->Post([this] { Publish(true); });
}

void EditingSession::Stop() {
  if (!timer_) return;
  timer_->Stop();
  timer_.reset();
}

// ------------------------------------------------------------
// Entry points (any thread)
// ------------------------------------------------------------

void EditingSession::Undo() {
  executors_.session->Post([this] { DoNavigate(NavigationKind::kUndo); });
}

void EditingSession::Redo() {
  executors_.session->Post([this] { DoNavigate(NavigationKind::kRedo); });
}

void EditingSession::JumpToPrevBookmark() {
  executors_.session->Post([this] { DoNavigate(NavigationKind::kPrevBookmark); });
}

void EditingSession::JumpToNextBookmark() {
  executors_.session->Post([this] { DoNavigate(NavigationKind::kNextBookmark); });
}

void EditingSession::SaveCurrentView() {
  executors_.session->Post([this] { DoSaveCurrentView(); });
}

void EditingSession::ToggleDone() {
  executors_.session->Post([this] { DoToggleDone(); });
}

void EditingSession::ToggleInkFound() {
  executors_.session->Post([this] { DoToggleInkFound(); });
}

void EditingSession::Tick() {
  executors_.session->Post([this] { DoTick(); });
}

void EditingSession::OnCurrentState(uint64_t request_id, inkvault::v1::AnnotationState state) {
  executors_.session->Post([this, request_id, state = std::move(state)] {
    scheduler_.OnCurrentState(request_id, state);
    Publish(false);
  });
}

void EditingSession::OnLoadConfirmed(uint64_t target) {
  executors_.session->Post([this, target] {
    if (navigation_.OnLoadConfirmed(target) == ConfirmOutcome::kApplied) last_error_.clear();
    Publish(false);
  });
}

std::future<SessionView> EditingSession::Describe() {
  auto promise = std::make_shared<std::promise<SessionView>>();
  auto future  = promise->get_future();
  executors_.session->Post([this, promise] { promise->set_value(BuildView()); });
  return future;
}

// ------------------------------------------------------------
// Session executor
// ------------------------------------------------------------

void EditingSession::DoNavigate(NavigationKind kind) {
  try {
    navigation_.Navigate(kind);
    last_error_.clear();
  } catch (const util::NoSuchTransition& e) {
    // Boundary: the control should already be disabled.
    INKVAULT_LOG_DEBUG("navigation ignored", {ImageField(options_.image_name), StringField("reason", e.what())});
  } catch (const util::NotFound& e) {
    last_error_ = e.what();
  } catch (const util::SerializationError& e) {
    last_error_ = e.what();
  }
  Publish(true);
}

void EditingSession::DoSaveCurrentView() {
  try {
    const auto outcome = scheduler_.RequestManualSave();
    INKVAULT_LOG_DEBUG("manual save", {ImageField(options_.image_name), StringField("outcome", ToString(outcome))});
    last_error_.clear();
    WriteStatus(true, true);
  } catch (const util::InvalidState& e) {
    INKVAULT_LOG_WARN("manual save refused", {ImageField(options_.image_name), StringField("reason", e.what())});
    last_error_ = e.what();
  }
  Publish(true);
}

void EditingSession::DoToggleDone() {
  WriteStatus(!status_.done, false);
  Publish(true);
}

void EditingSession::DoToggleInkFound() {
  WriteStatus(status_.done, !status_.ink_found);
  Publish(true);
}

void EditingSession::DoTick() {
  const auto outcome = scheduler_.Tick();
  if (outcome == TickOutcome::kProtected) {
    INKVAULT_LOG_DEBUG("auto-save skipped", {ImageField(options_.image_name), StringField("reason", ToString(outcome))});
  }
  Publish(false);
}

// ------------------------------------------------------------
// Status
// ------------------------------------------------------------

void EditingSession::LoadStatus() {
  status_.image_name = options_.image_name;
  if (auto existing = status_repo_->Get(options_.image_name)) status_ = *existing;
}

void EditingSession::WriteStatus(bool done, bool ink_found) {
  db::model::StatusRecord next = status_;
  next.done            = done;
  next.ink_found       = ink_found;
  next.last_updated_ms = static_cast<int64_t>(util::ToUnixMillis(util::WallNow()));

  auto r = status_repo_->Upsert(next);
  if (!r) {
    INKVAULT_LOG_WARN("status update failed",
                      {ImageField(options_.image_name), StringField("code", db::ToString(r.code)), ErrorField(r.message)});
    last_error_ = "status update failed: " + r.message;
    return;
  }

  status_ = next;
  INKVAULT_LOG_INFO("status updated", {ImageField(options_.image_name), BoolField("done", done), BoolField("ink_found", ink_found)});
}

// ------------------------------------------------------------
// View
// ------------------------------------------------------------

SessionView EditingSession::BuildView() const {
  SessionView view;
  view.cursor    = navigation_.Cursor();
  view.snapshots = store_.Size();
  view.bookmarks = bookmarks_.Size();

  view.can_undo              = navigation_.CanNavigate(NavigationKind::kUndo);
  view.can_redo              = navigation_.CanNavigate(NavigationKind::kRedo);
  view.can_jump_to_prev_mark = navigation_.CanNavigate(NavigationKind::kPrevBookmark);
  view.can_jump_to_next_mark = navigation_.CanNavigate(NavigationKind::kNextBookmark);

  view.cursor_bookmarked = view.cursor && bookmarks_.IsMarked(*view.cursor);
  view.is_protected      = navigation_.IsProtected();
  view.save_pending      = scheduler_.SavePending();

  view.done      = status_.done;
  view.ink_found = status_.ink_found;

  view.last_error = last_error_.empty() ? scheduler_.LastError() : last_error_;
  return view;
}

void EditingSession::Publish(bool force) {
  auto view = BuildView();
  if (!force && last_published_ && *last_published_ == view) return;

  surface_.ShowStatus(view);
  last_published_ = std::move(view);
}

} // namespace inkvault::session
