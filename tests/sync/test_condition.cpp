/**
 * @file test_condition.cpp
 * @brief Tests for Condition
 */

#include "sync_fixture.hpp"

#include <vector>

using namespace cosync;
using namespace cosync::test;

class ConditionTest : public SyncTest
{
protected:
   Condition cond;
};

TEST_F(ConditionTest, NotifyWithoutWaiters)
{
   LockGuard guard(cond);
   EXPECT_FALSE(cond.notify_one());
   EXPECT_EQ(cond.notify_all(), 0u);
}

TEST_F(ConditionTest, PredicateLoop)
{
   bool ready = false;   // Guarded by cond
   std::atomic<bool> saw_ready{false};

   spawn([&] {
      LockGuard guard(cond);
      while (!ready) {
         cond.wait();
      }
      saw_ready = true;
   });

   spawn([&] {
      this_unit::sleep_for(std::chrono::milliseconds(1));
      LockGuard guard(cond);
      ready = true;
      cond.notify_all();
   });

   join_all();
   EXPECT_TRUE(saw_ready);
}

TEST_F(ConditionTest, WaitRestoresDepthAndReleasesFully)
{
   std::atomic<bool> waiting{false};
   std::atomic<bool> other_got_lock{false};
   std::atomic<bool> held_after_unlock{true};
   std::atomic<bool> free_at_end{false};

   spawn([&] {
      cond.lock();
      cond.lock();
      cond.lock();
      waiting = true;
      cond.wait();
      // Depth 3 again: two unlocks leave it held
      cond.unlock();
      cond.unlock();
      held_after_unlock = cond.is_held_by_current();
      cond.unlock();
      free_at_end = !cond.is_held_by_current();
   });

   spawn([&] {
      await_flag(waiting);
      // Only possible if the waiter dropped every level
      cond.lock();
      other_got_lock = true;
      cond.notify_one();
      cond.unlock();
   });

   join_all();
   EXPECT_TRUE(other_got_lock);
   EXPECT_TRUE(held_after_unlock);
   EXPECT_TRUE(free_at_end);
   EXPECT_FALSE(cond.is_locked());
}

TEST_F(ConditionTest, NotifyOneWakesInArrivalOrder)
{
   std::atomic<int> arrived{0};
   std::atomic<int> woken{0};
   std::vector<int> order;   // Guarded by cond

   for (int i = 0; i < 3; ++i) {
      spawn([&, i] {
         LockGuard guard(cond);
         arrived++;
         cond.wait();
         order.push_back(i);
         woken++;
      });
      // The waiter is on the list before it lets go of the lock
      wait_for_count(arrived, i + 1);
   }

   for (int i = 0; i < 3; ++i) {
      {
         LockGuard guard(cond);
         EXPECT_TRUE(cond.notify_one());
      }
      wait_for_count(woken, i + 1);
   }
   join_all();

   EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST_F(ConditionTest, OsThreadWaitsOnUnit)
{
   int stage = 0;   // Guarded by cond

   spawn([&] {
      this_unit::sleep_for(std::chrono::milliseconds(1));
      LockGuard guard(cond);
      stage = 1;
      cond.notify_all();
   });

   {
      LockGuard guard(cond);
      while (stage == 0) {
         cond.wait();
      }
      EXPECT_EQ(stage, 1);
   }
   join_all();
}

TEST_F(ConditionTest, WaitWithoutLockIsFatal)
{
   EXPECT_DEATH({
      Condition c;
      c.wait();
   }, "Condition used without holding its lock");
}

TEST_F(ConditionTest, NotifyWithoutLockIsFatal)
{
   EXPECT_DEATH({
      Condition c;
      c.notify_all();
   }, "concurrency violation");
}
