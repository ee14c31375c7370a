#include "internal/sequence/sequence_allocator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_record_store.hpp"
#include "internal/db/schema/collections.hpp"
#include "internal/util/errors.hpp"

namespace {

using backoffice::db::memory::MemoryRecordStore;
using backoffice::lock::MutationLock;
using backoffice::sequence::EntityType;
using backoffice::sequence::SequenceAllocator;
namespace schema = backoffice::db::schema;
using namespace std::chrono_literals;

void TestFirstIdAndPadding() {
  MemoryRecordStore store;
  MutationLock      lock(100ms);
  SequenceAllocator allocator(store, lock);

  auto guard = lock.Acquire("test");
  assert(allocator.NextId(guard, EntityType::kSale) == "SALE0001");
  assert(allocator.NextId(guard, EntityType::kCustomer) == "CUST0001");

  SequenceAllocator wide(store, lock, 6);
  assert(wide.NextId(guard, EntityType::kQuotation) == "QUOT000001");
}

void TestResumesAfterHighestSuffixAndToleratesGaps() {
  MemoryRecordStore store;
  assert(store.AppendRows(schema::kSales, {{{"transaction_id", "SALE0002"}}, {{"transaction_id", "SALE0041"}}, {{"transaction_id", "SALE0007"}},
                                           {{"transaction_id", "legacy-7"}}}));
  MutationLock      lock(100ms);
  SequenceAllocator allocator(store, lock);

  auto guard = lock.Acquire("test");
  assert(allocator.NextId(guard, EntityType::kSale) == "SALE0042");
}

void TestLineRowsHoldTheirTransactionId() {
  MemoryRecordStore store;
  assert(store.AppendRows(schema::kSales, {{{"transaction_id", "SALE0001"}}}));
  // lines of a sale whose header write failed
  assert(store.AppendRows(schema::kSaleItems, {{{"line_id", "LINE0001"}, {"transaction_id", "SALE0002"}}}));
  assert(store.AppendRows(schema::kQuotationItems, {{{"line_id", "QLN0001"}, {"transaction_id", "QUOT0005"}}}));
  MutationLock      lock(100ms);
  SequenceAllocator allocator(store, lock);

  auto guard = lock.Acquire("test");
  assert(allocator.NextId(guard, EntityType::kSale) == "SALE0003");
  assert(allocator.NextId(guard, EntityType::kQuotation) == "QUOT0006");
  assert(allocator.NextId(guard, EntityType::kSaleLine) == "LINE0002");
}

void TestIdsIssuedInOneCriticalSectionDoNotRepeat() {
  MemoryRecordStore store;
  MutationLock      lock(100ms);
  SequenceAllocator allocator(store, lock);

  {
    auto guard = lock.Acquire("batch");
    assert(allocator.NextId(guard, EntityType::kBatch) == "BATCH0001");
    assert(allocator.NextId(guard, EntityType::kBatch) == "BATCH0002");
  }

  // nothing was persisted, so the next critical section starts over
  auto guard = lock.Acquire("again");
  assert(allocator.NextId(guard, EntityType::kBatch) == "BATCH0001");
}

void TestSuffixBeyondPadWidthKeepsGrowing() {
  MemoryRecordStore store;
  assert(store.AppendRows(schema::kItems, {{{"item_id", "ITEM9999"}}}));
  MutationLock      lock(100ms);
  SequenceAllocator allocator(store, lock);

  auto guard = lock.Acquire("test");
  assert(allocator.NextId(guard, EntityType::kItem) == "ITEM10000");
  assert(SequenceAllocator::ParseSuffix("ITEM10000", "ITEM") == 10000);
  assert(!SequenceAllocator::ParseSuffix("ITEM", "ITEM"));
  assert(!SequenceAllocator::ParseSuffix("ITEMX1", "ITEM"));
}

void TestAllocationRequiresHeldLock() {
  MemoryRecordStore store;
  MutationLock      lock(100ms);
  MutationLock      other(100ms);
  SequenceAllocator allocator(store, lock);

  auto foreign = other.Acquire("other");
  bool threw   = false;
  try {
    (void)allocator.NextId(foreign, EntityType::kSale);
  } catch (const backoffice::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  auto guard = lock.Acquire("mine");
  guard.Release();
  threw = false;
  try {
    (void)allocator.NextId(guard, EntityType::kSale);
  } catch (const backoffice::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentAllocationNeverDuplicates() {
  MemoryRecordStore store;
  MutationLock      lock(5s);
  SequenceAllocator allocator(store, lock);

  std::mutex               seen_mutex;
  std::set<std::string>    seen;
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 25; ++i) {
        auto guard = lock.Acquire("allocate");
        auto id    = allocator.NextId(guard, EntityType::kSale);
        assert(store.AppendRows(schema::kSales, {{{"transaction_id", id}}}));
        guard.Release();

        std::lock_guard lk(seen_mutex);
        assert(seen.insert(id).second);
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(seen.size() == 200);
  assert(*seen.rbegin() == "SALE0200");
}

} // namespace

int main() {
  TestFirstIdAndPadding();
  TestResumesAfterHighestSuffixAndToleratesGaps();
  TestLineRowsHoldTheirTransactionId();
  TestIdsIssuedInOneCriticalSectionDoNotRepeat();
  TestSuffixBeyondPadWidthKeepsGrowing();
  TestAllocationRequiresHeldLock();
  TestConcurrentAllocationNeverDuplicates();

  std::cout << "backoffice_unit_sequence_allocator: pass\n";
  return 0;
}
