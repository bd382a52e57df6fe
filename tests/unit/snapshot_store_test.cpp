#include "internal/history/snapshot_store.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <iostream>
#include <memory>

#include <google/protobuf/util/message_differencer.h>

#include "support/session_fixtures.hpp"

namespace {

using google::protobuf::util::MessageDifferencer;
using inkvault::history::SnapshotStore;
using inkvault::history::SnapshotStoreOptions;
using inkvault::testing::FlakyRamBackend;
using inkvault::testing::MakeState;

void TestFirstIndexIsZeroAndIndicesIncrease() {
  auto          backend = std::make_shared<FlakyRamBackend>();
  SnapshotStore store(backend, SnapshotStoreOptions{});

  assert(!store.Latest().has_value());
  assert(store.Append(MakeState({{1, 1}})) == 0);
  assert(store.Append(MakeState({{2, 2}})) == 1);
  assert(store.Append(MakeState({{3, 3}})) == 2);

  assert((store.ListIndices() == std::vector<uint64_t>{0, 1, 2}));
  assert(store.Latest() == 2u);
  assert(MessageDifferencer::Equals(store.Read(1), MakeState({{2, 2}})));
}

void TestReopenResumesAfterHighestIndex() {
  auto backend = std::make_shared<FlakyRamBackend>();
  {
    SnapshotStore store(backend, SnapshotStoreOptions{});
    store.Append(MakeState({{1, 1}}));
    store.Append(MakeState({{2, 2}}));
  }

  SnapshotStore reopened(backend, SnapshotStoreOptions{});
  assert(reopened.Size() == 2);
  assert(reopened.Latest() == 1u);
  assert(reopened.Append(MakeState({{3, 3}})) == 2);
}

void TestFailedAppendDoesNotConsumeIndex() {
  auto          backend = std::make_shared<FlakyRamBackend>();
  SnapshotStore store(backend, SnapshotStoreOptions{});
  store.Append(MakeState({{1, 1}}));

  backend->fail_records = true;
  bool threw            = false;
  try {
    store.Append(MakeState({{2, 2}}));
  } catch (const inkvault::util::IOError&) {
    threw = true;
  }
  assert(threw);
  assert(store.Size() == 1);

  backend->fail_records = false;
  assert(store.Append(MakeState({{2, 2}})) == 1);
}

void TestReadOfMissingIndexIsNotFound() {
  SnapshotStore store(std::make_shared<FlakyRamBackend>(), SnapshotStoreOptions{});
  store.Append(MakeState({{1, 1}}));

  bool threw = false;
  try {
    store.Read(7);
  } catch (const inkvault::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUndecodableRecordIsSerializationError() {
  auto backend = std::make_shared<FlakyRamBackend>();
  backend->WriteRecord(0, arrow::Buffer::FromString("garbage"), false);

  SnapshotStore store(backend, SnapshotStoreOptions{});
  assert(store.Contains(0));

  bool threw = false;
  try {
    store.Read(0);
  } catch (const inkvault::util::SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRecordUnderWrongKeyIsSerializationError() {
  auto backend = std::make_shared<FlakyRamBackend>();

  inkvault::v1::SnapshotRecord record;
  record.set_index(3);
  *record.mutable_state() = MakeState({{1, 1}});
  std::string bytes;
  assert(record.SerializeToString(&bytes));
  backend->WriteRecord(4, arrow::Buffer::FromString(std::move(bytes)), false);

  SnapshotStore store(backend, SnapshotStoreOptions{});
  bool          threw = false;
  try {
    store.Read(4);
  } catch (const inkvault::util::SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestNeighboursAreStrict() {
  auto backend = std::make_shared<FlakyRamBackend>();
  SnapshotStoreOptions options;
  options.first_index = 45;
  SnapshotStore store(backend, options);

  store.Append(MakeState({{1, 1}}));
  store.Append(MakeState({{2, 2}}));
  store.Append(MakeState({{3, 3}}));

  assert(!store.PredecessorOf(45).has_value());
  assert(store.PredecessorOf(46) == 45u);
  assert(store.SuccessorOf(46) == 47u);
  assert(!store.SuccessorOf(47).has_value());
}

void TestRecordCarriesMetadata() {
  SnapshotStoreOptions options;
  options.image_dimensions.set_width(800);
  options.image_dimensions.set_height(600);
  SnapshotStore store(std::make_shared<FlakyRamBackend>(), options);

  auto index  = store.Append(MakeState({{1, 1}}));
  auto record = store.ReadRecord(index);
  assert(record.index() == index);
  assert(record.image_dimensions().width() == 800);
  assert(record.image_dimensions().height() == 600);
  assert(record.created_at().seconds() > 0);
}

} // namespace

int main() {
  TestFirstIndexIsZeroAndIndicesIncrease();
  TestReopenResumesAfterHighestIndex();
  TestFailedAppendDoesNotConsumeIndex();
  TestReadOfMissingIndexIsNotFound();
  TestUndecodableRecordIsSerializationError();
  TestRecordUnderWrongKeyIsSerializationError();
  TestNeighboursAreStrict();
  TestRecordCarriesMetadata();

  std::cout << "inkvault_unit_snapshot_store: pass\n";
  return 0;
}
