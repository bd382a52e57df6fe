#include "internal/session/autosave_scheduler.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/history/bookmark_index.hpp"
#include "internal/history/change_detector.hpp"
#include "internal/history/snapshot_store.hpp"
#include "internal/session/navigation_controller.hpp"
#include "support/session_fixtures.hpp"

namespace {

using google::protobuf::util::MessageDifferencer;
using inkvault::history::BookmarkIndex;
using inkvault::history::ChangeDetector;
using inkvault::history::SnapshotStore;
using inkvault::history::SnapshotStoreOptions;
using inkvault::runtime::InlineExecutor;
using inkvault::session::AppendWorker;
using inkvault::session::AutoSaveScheduler;
using inkvault::session::ManualSaveOutcome;
using inkvault::session::NavigationController;
using inkvault::session::NavigationTimings;
using inkvault::session::ObserveOutcome;
using inkvault::session::TickOutcome;
using inkvault::testing::FlakyRamBackend;
using inkvault::testing::MakeState;
using inkvault::testing::QueueExecutor;
using inkvault::testing::RecordingSurface;
using inkvault::util::ManualClock;

using std::chrono::milliseconds;
using std::chrono::seconds;

SnapshotStoreOptions StartingAt(uint64_t first_index) {
  SnapshotStoreOptions options;
  options.first_index = first_index;
  return options;
}

/*
  Session wiring without threads. Appends run inline unless the test asks
  for a deferred io executor.
*/
struct Harness {
  explicit Harness(uint64_t first_index = 0, int prefill = 0, bool deferred_io = false)
      : backend(std::make_shared<FlakyRamBackend>()), store(backend, StartingAt(first_index)) {
    for (int i = 0; i < prefill; ++i) {
      const auto v = static_cast<double>(first_index + i);
      store.Append(MakeState({{v, v}}));
    }

    bookmarks = std::make_unique<BookmarkIndex>(backend, store, false);
    nav       = std::make_unique<NavigationController>(store, *bookmarks, surface, clock, NavigationTimings{});

    std::shared_ptr<inkvault::runtime::Executor> io_executor = std::make_shared<InlineExecutor>();
    if (deferred_io) {
      io          = std::make_shared<QueueExecutor>();
      io_executor = io;
    }
    worker    = std::make_unique<AppendWorker>(store, io_executor, std::make_shared<InlineExecutor>());
    scheduler = std::make_unique<AutoSaveScheduler>(*nav, *bookmarks, detector, surface, *worker, clock, NavigationTimings{}.load_timeout);
  }

  // Tick, then answer the request it produced.
  ObserveOutcome TickAndAnswer(const inkvault::v1::AnnotationState& state) {
    const auto tick = scheduler->Tick();
    assert(tick == TickOutcome::kRequested);
    (void)tick;
    return scheduler->OnCurrentState(surface.LastRequest(), state);
  }

  std::shared_ptr<FlakyRamBackend>       backend;
  SnapshotStore                          store;
  ChangeDetector                         detector;
  RecordingSurface                       surface;
  ManualClock                            clock;
  std::shared_ptr<QueueExecutor>         io;
  std::unique_ptr<BookmarkIndex>         bookmarks;
  std::unique_ptr<NavigationController> nav;
  std::unique_ptr<AppendWorker>          worker;
  std::unique_ptr<AutoSaveScheduler>     scheduler;
};

void TestFirstStateIsSavedAtIndexZero() {
  Harness h;

  assert(h.TickAndAnswer(MakeState({})) == ObserveOutcome::kAppending);
  assert(h.store.Size() == 1);
  assert(h.nav->Cursor() == 0u);

  // Same drawing again: nothing new.
  assert(h.TickAndAnswer(MakeState({})) == ObserveOutcome::kUnchanged);
  assert(h.store.Size() == 1);
}

void TestChangeTriggersExactlyOneAppend() {
  Harness h(0, 3);

  const auto edited = MakeState({{2, 2}, {7, 7}});
  assert(h.TickAndAnswer(edited) == ObserveOutcome::kAppending);

  assert(h.store.Size() == 4);
  assert(h.store.Latest() == 3u);
  assert(h.nav->Cursor() == 3u);
  assert(MessageDifferencer::Equals(*h.nav->LastSavedState(), edited));
  assert(!h.scheduler->SavePending());
}

void TestUndoThenEditScenario() {
  Harness h(45, 5);
  auto&   nav = *h.nav;
  assert(nav.Cursor() == 49u);

  assert(nav.Undo() == 48);
  nav.OnLoadConfirmed(48);
  const auto loaded = h.surface.loads.back().second;

  h.clock.Advance(milliseconds(500));
  assert(h.scheduler->Tick() == TickOutcome::kProtected);
  assert(h.surface.requests.empty());

  h.clock.Advance(milliseconds(2000));
  assert(h.TickAndAnswer(loaded) == ObserveOutcome::kUnchanged);
  assert(h.store.Size() == 5);

  h.clock.Advance(milliseconds(1000));
  auto edited = loaded;
  *edited.add_strokes() = MakeState({{1, 1}}).strokes(0);
  assert(h.TickAndAnswer(edited) == ObserveOutcome::kAppending);

  assert(h.store.Latest() == 50u);
  assert(nav.Cursor() == 50u);
}

void TestOnlyLatestRequestIsAnswered() {
  Harness h(0, 1);

  assert(h.scheduler->Tick() == TickOutcome::kRequested);
  const auto first = h.surface.LastRequest();
  assert(h.scheduler->Tick() == TickOutcome::kRequested);
  const auto second = h.surface.LastRequest();
  assert(first != second);

  assert(h.scheduler->OnCurrentState(first, MakeState({{5, 5}})) == ObserveOutcome::kStale);
  assert(h.store.Size() == 1);
  assert(h.scheduler->OnCurrentState(second, MakeState({{5, 5}})) == ObserveOutcome::kAppending);
  assert(h.store.Size() == 2);
}

void TestResponseFromBeforeNavigationIsDiscarded() {
  Harness h(0, 3);

  assert(h.scheduler->Tick() == TickOutcome::kRequested);
  const auto id = h.surface.LastRequest();

  h.nav->Undo();
  assert(h.scheduler->OnCurrentState(id, MakeState({{9, 9}})) == ObserveOutcome::kProtected);
  assert(h.store.Size() == 3);
}

void TestFailedAppendRetriesOnNextTick() {
  Harness h(0, 2);
  const auto edited = MakeState({{4, 4}});

  h.backend->fail_records = true;
  assert(h.TickAndAnswer(edited) == ObserveOutcome::kAppending);
  assert(h.scheduler->SavePending());
  assert(!h.scheduler->LastError().empty());
  assert(h.store.Size() == 2);
  assert(h.nav->Cursor() == 1u);

  h.backend->fail_records = false;
  assert(h.TickAndAnswer(edited) == ObserveOutcome::kAppending);
  assert(!h.scheduler->SavePending());
  assert(h.store.Latest() == 2u);
  assert(h.nav->Cursor() == 2u);
}

void TestSingleAppendInFlight() {
  Harness h(0, 1, true);

  assert(h.TickAndAnswer(MakeState({{3, 3}})) == ObserveOutcome::kAppending);
  assert(h.scheduler->AppendInFlight());
  assert(h.scheduler->Tick() == TickOutcome::kAppendInFlight);

  assert(h.io->RunAll() == 1);
  assert(!h.scheduler->AppendInFlight());
  assert(h.nav->Cursor() == 1u);
}

void TestAppendFinishingDuringNavigationLeavesCursor() {
  Harness h(0, 3, true);

  assert(h.TickAndAnswer(MakeState({{8, 8}})) == ObserveOutcome::kAppending);
  assert(h.nav->Undo() == 1);

  h.io->RunAll();
  assert(h.store.Latest() == 3u);
  // Cursor belongs to the pending navigation.
  assert(h.nav->Cursor() == 2u);

  h.nav->OnLoadConfirmed(1);
  assert(h.nav->Cursor() == 1u);

  // The confirmed load keeps the cursor after the grace window too.
  h.clock.Advance(seconds(3));
  assert(h.TickAndAnswer(MakeState({{1, 1}})) == ObserveOutcome::kUnchanged);
  assert(h.nav->Cursor() == 1u);
  assert(h.store.Size() == 4);
}

void TestAbandonedLoadAdoptsSnapshotSavedMeanwhile() {
  Harness h(0, 3, true);

  assert(h.TickAndAnswer(MakeState({{9, 9}})) == ObserveOutcome::kAppending);
  assert(h.nav->Undo() == 1);
  h.io->RunAll();
  assert(h.store.Latest() == 3u);
  assert(h.nav->Cursor() == 2u);

  // The surface never confirms; the load times out and the drawing on
  // screen is the one just saved at index 3.
  h.clock.Advance(seconds(31));
  assert(h.TickAndAnswer(MakeState({{9, 9}})) == ObserveOutcome::kUnchanged);
  assert(h.nav->Cursor() == 3u);
  assert(h.store.Size() == 4);
}

void TestUnansweredManualSaveStopsBlockingTicks() {
  Harness h(0, 3);

  assert(h.scheduler->RequestManualSave() == ManualSaveOutcome::kRequested);
  const auto manual_id = h.surface.LastRequest();

  for (int i = 0; i < 29; ++i) {
    h.clock.Advance(seconds(1));
    assert(h.scheduler->Tick() == TickOutcome::kManualSaveOutstanding);
  }

  h.clock.Advance(seconds(1));
  assert(h.scheduler->Tick() == TickOutcome::kRequested);
  assert(h.scheduler->LastError() == "save view request timed out");

  // A late answer to the lost request is ignored; the new tick's answer saves.
  assert(h.scheduler->OnCurrentState(manual_id, MakeState({{9, 9}})) == ObserveOutcome::kStale);
  assert(h.scheduler->OnCurrentState(h.surface.LastRequest(), MakeState({{9, 9}})) == ObserveOutcome::kAppending);
  assert(h.store.Size() == 4);
  assert(h.nav->Cursor() == 3u);
  assert(!h.bookmarks->IsMarked(3));
  assert(h.scheduler->LastError().empty());
}

void TestManualSaveAppendsAndBookmarksChangedView() {
  Harness h(0, 2);

  assert(h.scheduler->RequestManualSave() == ManualSaveOutcome::kRequested);
  assert(h.scheduler->OnCurrentState(h.surface.LastRequest(), MakeState({{6, 6}})) == ObserveOutcome::kAppending);

  assert(h.store.Latest() == 2u);
  assert(h.bookmarks->IsMarked(2));
}

void TestManualSaveOfUnchangedViewBookmarksCursor() {
  Harness h(0, 2);

  h.scheduler->RequestManualSave();
  assert(h.scheduler->OnCurrentState(h.surface.LastRequest(), MakeState({{1, 1}})) == ObserveOutcome::kBookmarked);
  assert(h.store.Size() == 2);
  assert(h.bookmarks->IsMarked(1));
}

void TestManualSaveDuringGraceWindowBookmarksCursor() {
  Harness h(0, 3);

  h.nav->Undo();
  h.nav->OnLoadConfirmed(1);

  assert(h.scheduler->RequestManualSave() == ManualSaveOutcome::kBookmarked);
  assert(h.bookmarks->IsMarked(1));
  assert(h.surface.requests.empty());
}

void TestManualSaveRefusedWhileLoadUnconfirmed() {
  Harness h(0, 3);
  h.nav->Undo();

  bool threw = false;
  try {
    h.scheduler->RequestManualSave();
  } catch (const inkvault::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(h.bookmarks->Size() == 0);
}

void TestManualSaveQueuedBehindAppend() {
  Harness h(0, 1, true);

  assert(h.TickAndAnswer(MakeState({{2, 2}})) == ObserveOutcome::kAppending);
  assert(h.scheduler->RequestManualSave() == ManualSaveOutcome::kQueued);

  // Completion re-issues the manual request.
  const auto before = h.surface.requests.size();
  h.io->RunAll();
  assert(h.surface.requests.size() == before + 1);
  assert(h.scheduler->Tick() == TickOutcome::kManualSaveOutstanding);

  assert(h.scheduler->OnCurrentState(h.surface.LastRequest(), MakeState({{2, 2}})) == ObserveOutcome::kBookmarked);
  assert(h.bookmarks->IsMarked(1));
}

} // namespace

int main() {
  TestFirstStateIsSavedAtIndexZero();
  TestChangeTriggersExactlyOneAppend();
  TestUndoThenEditScenario();
  TestOnlyLatestRequestIsAnswered();
  TestResponseFromBeforeNavigationIsDiscarded();
  TestFailedAppendRetriesOnNextTick();
  TestSingleAppendInFlight();
  TestAppendFinishingDuringNavigationLeavesCursor();
  TestAbandonedLoadAdoptsSnapshotSavedMeanwhile();
  TestUnansweredManualSaveStopsBlockingTicks();
  TestManualSaveAppendsAndBookmarksChangedView();
  TestManualSaveOfUnchangedViewBookmarksCursor();
  TestManualSaveDuringGraceWindowBookmarksCursor();
  TestManualSaveRefusedWhileLoadUnconfirmed();
  TestManualSaveQueuedBehindAppend();

  std::cout << "inkvault_unit_autosave_scheduler: pass\n";
  return 0;
}
