/**
 * @file test_per_thread.cpp
 * @brief Tests for PerThread
 */

#include "sync_fixture.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace cosync;
using namespace cosync::test;

class PerThreadTest : public SyncTest {};

TEST_F(PerThreadTest, OneValuePerOsThread)
{
   std::atomic<int> calls{0};
   PerThread<std::uint32_t> owner([&calls] {
      ++calls;
      return this_thread::id();
   });

   std::uint32_t const mine = owner();
   EXPECT_EQ(mine, this_thread::id());
   EXPECT_EQ(&owner(), &owner());

   std::uint32_t theirs = mine;
   std::thread t([&] { theirs = owner(); });
   t.join();

   EXPECT_NE(theirs, mine);
   EXPECT_EQ(calls.load(), 2);
   EXPECT_EQ(owner(), mine);
}

TEST_F(PerThreadTest, UnitsOnOneWorkerShareItsValue)
{
   Runtime single{1};
   std::atomic<int> calls{0};
   PerThread<int> per_worker([&calls] { return ++calls; });

   std::atomic<int*> first{nullptr};
   std::atomic<int*> second{nullptr};
   {
      Unit a(single, [&] { first = &per_worker(); });
      a.join();
      Unit b(single, [&] { second = &per_worker(); });
      b.join();
   }

   EXPECT_EQ(first.load(), second.load());
   EXPECT_EQ(calls.load(), 1);
}

TEST_F(PerThreadTest, ExplicitIndexAndCapacity)
{
   PerThread<int> fives([] { return 5; });
   EXPECT_EQ(fives.capacity(), 0u);

   std::uint32_t const tid = this_thread::id();
   EXPECT_EQ(fives[tid], 5);
   EXPECT_GT(fives.capacity(), tid);
   EXPECT_EQ(&fives[tid], &fives());
}

TEST_F(PerThreadTest, IdOutOfRangeIsRejected)
{
   PerThread<int> values([] { return 1; });
   try {
      (void)values[this_thread::max_id() + 100];
      FAIL() << "unassigned thread id must throw";
   } catch (InvalidArgument const& e) {
      EXPECT_STREQ(e.what(), "thread id outside of allocated range");
   }
}

TEST_F(PerThreadTest, FailureIsPermanentPerThreadId)
{
   std::atomic<int> calls{0};
   std::uint32_t const failing = this_thread::id();
   PerThread<int> picky([&calls, failing]() -> int {
      ++calls;
      if (this_thread::id() == failing) throw std::runtime_error("not on this thread");
      return 3;
   });

   EXPECT_THROW((void)picky(), std::runtime_error);
   try {
      (void)picky();
      FAIL() << "must stay failed";
   } catch (PermanentInitializationFailure const& e) {
      EXPECT_STREQ(e.what(), "not on this thread");
   }
   EXPECT_EQ(calls.load(), 1);

   // Other ids are unaffected
   int other = 0;
   std::thread t([&] { other = picky(); });
   t.join();
   EXPECT_EQ(other, 3);
   EXPECT_EQ(calls.load(), 2);
}

TEST_F(PerThreadTest, ConcurrentCallersForOneIdInitializeOnce)
{
   std::atomic<int> calls{0};
   std::atomic<bool> go{false};
   std::atomic<int> done{0};
   PerThread<int> slow([&calls] {
      ++calls;
      this_unit::sleep_for(std::chrono::milliseconds(2));
      return 9;
   });

   std::uint32_t const tid = this_thread::id();
   int* results[6] = {};
   for (int i = 0; i < 6; ++i) {
      spawn([&, i] {
         await_flag(go);
         results[i] = &slow[tid];
         done++;
      });
   }
   go = true;
   join_all();

   EXPECT_EQ(done.load(), 6);
   EXPECT_EQ(calls.load(), 1);
   for (int* r : results) {
      EXPECT_EQ(r, &slow[tid]);
   }
}

TEST_F(PerThreadTest, GrowthKeepsExistingValues)
{
   std::atomic<int> calls{0};
   PerThread<std::string> labels([&calls] {
      ++calls;
      return "thread " + std::to_string(this_thread::id());
   });

   std::string const& mine = labels();
   std::string const* const before = &mine;
   std::size_t const cap_before = labels.capacity();

   // Keep creating threads until one lands past the current snapshot
   std::atomic<bool> grew{false};
   for (int round = 0; round < 64 && !grew; ++round) {
      std::thread t([&] {
         (void)labels();
         if (labels.capacity() > cap_before) grew = true;
      });
      t.join();
   }

   EXPECT_TRUE(grew);
   EXPECT_EQ(&labels(), before);
   EXPECT_EQ(labels(), "thread " + std::to_string(this_thread::id()));
   EXPECT_GE(calls.load(), 2);
}

TEST_F(PerThreadTest, ReadsDuringGrowthSeeTheSameValue)
{
   std::atomic<int> calls{0};
   PerThread<int> values([&calls] { return ++calls; });

   int const* const mine = &values();
   int const initial_calls = calls.load();
   std::atomic<bool> stop{false};
   std::atomic<bool> mismatch{false};

   std::thread reader([&] {
      // Readers of an existing id never re-run the initializer
      std::uint32_t const tid = this_thread::id();
      int const* const own = &values[tid];
      while (!stop) {
         if (&values[tid] != own) mismatch = true;
      }
   });

   std::vector<std::thread> growers;
   for (int i = 0; i < 16; ++i) {
      growers.emplace_back([&] { (void)values(); });
   }
   for (auto& g : growers) g.join();
   stop = true;
   reader.join();

   EXPECT_FALSE(mismatch);
   EXPECT_EQ(&values(), mine);
   // One call per distinct thread that asked
   EXPECT_EQ(calls.load(), initial_calls + 1 + 16);
}
