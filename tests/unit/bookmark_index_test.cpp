#include "internal/history/bookmark_index.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/history/snapshot_store.hpp"
#include "support/session_fixtures.hpp"

namespace {

using inkvault::history::BookmarkIndex;
using inkvault::history::SnapshotStore;
using inkvault::history::SnapshotStoreOptions;
using inkvault::testing::FlakyRamBackend;
using inkvault::testing::MakeState;

// Live sequence 0..count-1.
std::unique_ptr<SnapshotStore> MakeStore(const std::shared_ptr<FlakyRamBackend>& backend, int count) {
  auto store = std::make_unique<SnapshotStore>(backend, SnapshotStoreOptions{});
  for (int i = 0; i < count; ++i) store->Append(MakeState({{static_cast<double>(i), 0}}));
  return store;
}

void TestMarkRequiresLiveSnapshot() {
  auto          backend = std::make_shared<FlakyRamBackend>();
  auto          store   = MakeStore(backend, 2);
  BookmarkIndex marks(backend, *store, false);

  bool threw = false;
  try {
    marks.Mark(5);
  } catch (const inkvault::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(marks.Size() == 0);
}

void TestMarkIsIdempotent() {
  auto          backend = std::make_shared<FlakyRamBackend>();
  auto          store   = MakeStore(backend, 3);
  BookmarkIndex marks(backend, *store, false);

  assert(marks.Mark(1));
  assert(!marks.Mark(1));
  assert(marks.IsMarked(1));
  assert((marks.List() == std::vector<uint64_t>{1}));
}

void TestNeighboursAreStrict() {
  auto          backend = std::make_shared<FlakyRamBackend>();
  auto          store   = MakeStore(backend, 10);
  BookmarkIndex marks(backend, *store, false);
  marks.Mark(2);
  marks.Mark(5);
  marks.Mark(8);

  assert(marks.PredecessorOf(5) == 2);
  assert(marks.SuccessorOf(5) == 8);
  // from an unmarked index
  assert(marks.PredecessorOf(7) == 5);
  assert(marks.SuccessorOf(3) == 5);

  assert(!marks.HasPredecessor(2));
  assert(!marks.HasSuccessor(8));

  bool threw = false;
  try {
    marks.SuccessorOf(8);
  } catch (const inkvault::util::NoSuchTransition&) {
    threw = true;
  }
  assert(threw);
}

void TestMarksSurviveReopen() {
  auto backend = std::make_shared<FlakyRamBackend>();
  auto store   = MakeStore(backend, 4);
  {
    BookmarkIndex marks(backend, *store, false);
    marks.Mark(0);
    marks.Mark(3);
  }

  BookmarkIndex reopened(backend, *store, false);
  assert((reopened.List() == std::vector<uint64_t>{0, 3}));
}

void TestFailedPersistKeepsNoMark() {
  auto          backend = std::make_shared<FlakyRamBackend>();
  auto          store   = MakeStore(backend, 2);
  BookmarkIndex marks(backend, *store, false);

  backend->fail_bookmarks = true;
  bool threw              = false;
  try {
    marks.Mark(1);
  } catch (const inkvault::util::IOError&) {
    threw = true;
  }
  assert(threw);
  assert(!marks.IsMarked(1));

  backend->fail_bookmarks = false;
  assert(marks.Mark(1));
}

void TestBookmarksOutsideLiveSequenceAreDropped() {
  auto backend = std::make_shared<FlakyRamBackend>();
  auto store   = MakeStore(backend, 2);

  inkvault::v1::BookmarkList list;
  list.add_indices(1);
  list.add_indices(9);
  std::string bytes;
  assert(list.SerializeToString(&bytes));
  backend->WriteBookmarks(arrow::Buffer::FromString(std::move(bytes)), false);

  BookmarkIndex marks(backend, *store, false);
  assert((marks.List() == std::vector<uint64_t>{1}));
}

} // namespace

int main() {
  TestMarkRequiresLiveSnapshot();
  TestMarkIsIdempotent();
  TestNeighboursAreStrict();
  TestMarksSurviveReopen();
  TestFailedPersistKeepsNoMark();
  TestBookmarksOutsideLiveSequenceAreDropped();

  std::cout << "inkvault_unit_bookmark_index: pass\n";
  return 0;
}
