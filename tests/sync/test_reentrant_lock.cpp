/**
 * @file test_reentrant_lock.cpp
 * @brief Tests for ReentrantLock and the scoped lock helpers
 */

#include "sync_fixture.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

using namespace cosync;
using namespace cosync::test;

class ReentrantLockTest : public SyncTest
{
protected:
   ReentrantLock lock;
};

/* ============================================================================
 * Basic Locking
 * ========================================================================= */

TEST_F(ReentrantLockTest, FreshLockIsUnlocked)
{
   EXPECT_FALSE(lock.is_locked());
   EXPECT_FALSE(lock.is_held_by_current());
}

TEST_F(ReentrantLockTest, TryLockRaceHasExactlyOneWinner)
{
   std::atomic<bool> go{false};
   std::atomic<int> tried{0};
   std::atomic<int> winners{0};

   for (int i = 0; i < 2; ++i) {
      spawn([&] {
         await_flag(go);
         bool const won = lock.try_lock();
         if (won) winners++;
         tried++;
         // Hold on until both have tried
         await_count(tried, 2);
         if (won) lock.unlock();
      });
   }

   go = true;
   join_all();

   EXPECT_EQ(winners, 1);
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(ReentrantLockTest, LockThreeTimesUnlockThreeTimes)
{
   std::atomic<bool> released{false};
   std::atomic<bool> other_acquired{false};

   spawn([&] {
      lock.lock();
      lock.lock();
      lock.lock();
      lock.unlock();
      lock.unlock();
      lock.unlock();
      released = true;
   });
   join_all();
   ASSERT_TRUE(released);
   EXPECT_FALSE(lock.is_locked());

   spawn([&] {
      other_acquired = lock.try_lock();
      if (other_acquired) lock.unlock();
   });
   join_all();
   EXPECT_TRUE(other_acquired);
}

TEST_F(ReentrantLockTest, PartialReleaseKeepsOthersOut)
{
   std::atomic<int> step{0};
   std::atomic<bool> got_while_held{true};
   std::atomic<bool> got_after_release{false};

   spawn([&] {
      lock.lock();
      lock.lock();
      lock.lock();
      lock.unlock();
      lock.unlock();   // still held once
      step = 1;
      await_count(step, 2);
      lock.unlock();
      step = 3;
   });

   spawn([&] {
      await_count(step, 1);
      got_while_held = lock.try_lock();
      step = 2;
      await_count(step, 3);
      got_after_release = lock.try_lock();
      if (got_after_release) lock.unlock();
   });

   join_all();
   EXPECT_FALSE(got_while_held);
   EXPECT_TRUE(got_after_release);
}

TEST_F(ReentrantLockTest, TryLockIsReentrant)
{
   EXPECT_TRUE(lock.try_lock());
   EXPECT_TRUE(lock.try_lock());
   EXPECT_TRUE(lock.is_held_by_current());
   lock.unlock();
   EXPECT_TRUE(lock.is_locked());
   lock.unlock();
   EXPECT_FALSE(lock.is_locked());
}

/* ============================================================================
 * Misuse
 * ========================================================================= */

TEST_F(ReentrantLockTest, UnlockWithoutLockThrows)
{
   try {
      lock.unlock();
      FAIL() << "unlock of a free lock must throw";
   } catch (InvalidOperation const& e) {
      EXPECT_STREQ(e.what(), "unlock count must match lock count");
   }
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(ReentrantLockTest, UnlockByNonOwnerThrows)
{
   lock.lock();
   std::string message;

   spawn([&] {
      try {
         lock.unlock();
      } catch (InvalidOperation const& e) {
         message = e.what();
      }
   });
   join_all();

   EXPECT_EQ(message, "unlock from wrong thread");
   EXPECT_TRUE(lock.is_locked());
   EXPECT_TRUE(lock.is_held_by_current());
   lock.unlock();
}

/* ============================================================================
 * Contention
 * ========================================================================= */

TEST_F(ReentrantLockTest, MutualExclusion)
{
   constexpr int UNITS = 8;
   constexpr int ITERATIONS = 2000;

   long counter = 0;   // deliberately not atomic
   std::atomic<int> inside{0};
   std::atomic<bool> overlap{false};

   for (int u = 0; u < UNITS; ++u) {
      spawn([&] {
         for (int i = 0; i < ITERATIONS; ++i) {
            lock.lock();
            if (inside.fetch_add(1) != 0) overlap = true;
            ++counter;
            if (i % 64 == 0) this_unit::yield();   // park others on the lock
            inside.fetch_sub(1);
            lock.unlock();
         }
      });
   }
   join_all();

   EXPECT_FALSE(overlap);
   EXPECT_EQ(counter, static_cast<long>(UNITS) * ITERATIONS);
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(ReentrantLockTest, MutualExclusionWithOsThreads)
{
   long counter = 0;
   std::atomic<int> inside{0};
   std::atomic<bool> overlap{false};

   auto body = [&] {
      for (int i = 0; i < 2000; ++i) {
         std::scoped_lock guard(lock);
         if (inside.fetch_add(1) != 0) overlap = true;
         ++counter;
         inside.fetch_sub(1);
      }
   };

   spawn(body);
   spawn(body);
   std::thread t1(body);
   std::thread t2(body);
   t1.join();
   t2.join();
   join_all();

   EXPECT_FALSE(overlap);
   EXPECT_EQ(counter, 8000);
}

TEST_F(ReentrantLockTest, BlockedLockProceedsAfterUnlock)
{
   std::atomic<bool> waiting{false};
   std::atomic<bool> acquired{false};

   lock.lock();
   spawn([&] {
      waiting = true;
      lock.lock();
      acquired = true;
      lock.unlock();
   });

   while (!waiting) std::this_thread::yield();
   settle();
   EXPECT_FALSE(acquired);

   lock.unlock();
   join_all();
   EXPECT_TRUE(acquired);
}

TEST_F(ReentrantLockTest, TimeoutPatternWithIsLockedAndTryLock)
{
   lock.lock();
   std::atomic<bool> gave_up{false};

   spawn([&] {
      auto const deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(3);
      while (lock.is_locked() || !lock.try_lock()) {
         if (std::chrono::steady_clock::now() > deadline) {
            gave_up = true;
            return;
         }
         this_unit::yield();
      }
      lock.unlock();
   });
   join_all();

   EXPECT_TRUE(gave_up);
   lock.unlock();
}

/* ============================================================================
 * unlock_all / relock_all
 * ========================================================================= */

TEST_F(ReentrantLockTest, UnlockAllAndRelockAllRestoreDepth)
{
   lock.lock();
   lock.lock();
   lock.lock();

   std::uint32_t const depth = lock.unlock_all();
   EXPECT_EQ(depth, 3u);
   EXPECT_FALSE(lock.is_locked());

   std::atomic<bool> other_acquired{false};
   spawn([&] {
      lock.lock();
      other_acquired = true;
      lock.unlock();
   });
   join_all();
   EXPECT_TRUE(other_acquired);

   lock.relock_all(depth);
   lock.unlock();
   lock.unlock();
   EXPECT_TRUE(lock.is_locked());
   lock.unlock();
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(ReentrantLockTest, UnlockAllRequiresOwnership)
{
   try {
      (void)lock.unlock_all();
      FAIL() << "unlock_all of a free lock must throw";
   } catch (InvalidOperation const& e) {
      EXPECT_STREQ(e.what(), "unlock count must match lock count");
   }

   lock.lock();
   std::string message;
   spawn([&] {
      try {
         (void)lock.unlock_all();
      } catch (InvalidOperation const& e) {
         message = e.what();
      }
   });
   join_all();

   EXPECT_EQ(message, "unlock from wrong thread");
   EXPECT_TRUE(lock.is_held_by_current());
   lock.unlock();
}

TEST_F(ReentrantLockTest, RelockAllAtWrongDepthIsFatal)
{
   EXPECT_DEATH({
      ReentrantLock l;
      l.lock();
      l.relock_all(2);   // already held: reacquired at depth 2, not 1
   }, "concurrency violation");
}

/* ============================================================================
 * Finalizers
 * ========================================================================= */

TEST_F(ReentrantLockTest, FinalizersDeferredWhileHeld)
{
   int ran = 0;

   lock.lock();
   lock.lock();
   EXPECT_FALSE(finalizers::enabled());
   finalizers::defer([&] { ran++; });
   EXPECT_EQ(ran, 0);

   lock.unlock();
   EXPECT_EQ(ran, 0);

   lock.unlock();
   EXPECT_EQ(ran, 1);
   EXPECT_TRUE(finalizers::enabled());
}

TEST_F(ReentrantLockTest, ThrowingFinalizerDoesNotBreakUnlock)
{
   int ran = 0;

   lock.lock();
   finalizers::defer([] { throw 42; });
   finalizers::defer([&] { ran++; });

   testing::internal::CaptureStderr();
   EXPECT_NO_THROW(lock.unlock());
   std::string const err = testing::internal::GetCapturedStderr();

   EXPECT_FALSE(lock.is_locked());
   EXPECT_EQ(ran, 1);
   EXPECT_NE(err.find("error in running finalizer"), std::string::npos);
}

TEST_F(ReentrantLockTest, FailedTryLockLeavesFinalizersEnabled)
{
   std::atomic<bool> held{false};
   std::atomic<bool> release{false};
   std::atomic<bool> enabled_after_fail{false};

   spawn([&] {
      lock.lock();
      held = true;
      await_flag(release);
      lock.unlock();
   });
   spawn([&] {
      await_flag(held);
      EXPECT_FALSE(lock.try_lock());
      enabled_after_fail = finalizers::enabled();
      release = true;
   });
   join_all();

   EXPECT_TRUE(enabled_after_fail);
}

/* ============================================================================
 * Scoped Helpers
 * ========================================================================= */

TEST_F(ReentrantLockTest, WithLockReturnsResultAndReleases)
{
   int const result = with_lock(lock, [&] {
      EXPECT_TRUE(lock.is_held_by_current());
      return 42;
   });

   EXPECT_EQ(result, 42);
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(ReentrantLockTest, WithLockReleasesOnException)
{
   EXPECT_THROW(with_lock(lock, [] { throw std::runtime_error("body failed"); }), std::runtime_error);
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(ReentrantLockTest, TryWithLock)
{
   int ran = 0;
   EXPECT_TRUE(try_with_lock(lock, [&] { ran++; }));
   EXPECT_EQ(try_with_lock(lock, [] { return 7; }), std::optional<int>{7});
   EXPECT_EQ(ran, 1);

   std::atomic<bool> held{false};
   std::atomic<bool> release{false};
   spawn([&] {
      with_lock(lock, [&] {
         held = true;
         await_flag(release);
      });
   });
   while (!held) std::this_thread::yield();

   EXPECT_FALSE(try_with_lock(lock, [&] { ran++; }));
   EXPECT_EQ(try_with_lock(lock, [] { return 7; }), std::nullopt);
   EXPECT_EQ(ran, 1);

   release = true;
   join_all();
}

TEST_F(ReentrantLockTest, WorksWithStandardGuards)
{
   {
      std::unique_lock guard(lock);
      EXPECT_TRUE(lock.is_held_by_current());
      guard.unlock();
      EXPECT_FALSE(lock.is_locked());
      EXPECT_TRUE(guard.try_lock());
   }
   EXPECT_FALSE(lock.is_locked());
}
