/**
 * @file test_lockable.cpp
 * @brief Tests for Lockable
 */

#include "sync_fixture.hpp"

#include <string>
#include <vector>

using namespace cosync;
using namespace cosync::test;

class LockableTest : public SyncTest {};

TEST_F(LockableTest, GuardGivesAccessAndUnlocks)
{
   Lockable<std::vector<int>> items;
   {
      auto guard = items.lock();
      guard->push_back(1);
      (*guard).push_back(2);
      EXPECT_TRUE(items.underlying_lock().is_held_by_current());
   }
   EXPECT_FALSE(items.underlying_lock().is_locked());

   auto guard = items.lock();
   EXPECT_EQ(*guard, (std::vector<int>{1, 2}));
}

TEST_F(LockableTest, InPlaceAndInitialValue)
{
   Lockable<std::string> a(std::in_place, 3, 'x');
   Lockable<std::string> b(std::string("abc"));

   EXPECT_EQ(a.with([](std::string& s) { return s; }), "xxx");
   EXPECT_EQ(b.with([](std::string& s) { return s.size(); }), 3u);
}

TEST_F(LockableTest, GuardEarlyUnlockAndMove)
{
   Lockable<int> value(5);

   auto first = value.lock();
   auto second = std::move(first);
   EXPECT_EQ(*second, 5);
   EXPECT_TRUE(value.underlying_lock().is_locked());

   second.unlock();
   EXPECT_FALSE(value.underlying_lock().is_locked());
}

TEST_F(LockableTest, TryLockFailsWhileHeldElsewhere)
{
   Lockable<int> value(0);
   std::atomic<bool> held{false};
   std::atomic<bool> release{false};

   spawn([&] {
      auto guard = value.lock();
      *guard = 1;
      held = true;
      await_flag(release);
   });
   while (!held) std::this_thread::yield();

   EXPECT_FALSE(value.try_lock().has_value());

   release = true;
   join_all();

   auto guard = value.try_lock();
   ASSERT_TRUE(guard.has_value());
   EXPECT_EQ(**guard, 1);
}

TEST_F(LockableTest, GetWhileHolding)
{
   Lockable<int> value(9);
   auto guard = value.lock();
   EXPECT_EQ(value.get(), 9);
   value.get() = 10;
   EXPECT_EQ(*guard, 10);
}

TEST_F(LockableTest, GetWithoutLockIsFatal)
{
   EXPECT_DEATH({
      Lockable<int> value(1);
      (void)value.get();
   }, "Lockable value accessed without holding its lock");
}

TEST_F(LockableTest, WithSerializesUpdates)
{
   Lockable<long> total(0);

   for (int u = 0; u < 8; ++u) {
      spawn([&] {
         for (int i = 0; i < 1000; ++i) {
            total.with([](long& t) {
               long const seen = t;
               if (seen % 100 == 0) this_unit::yield();
               t = seen + 1;
            });
         }
      });
   }
   join_all();

   EXPECT_EQ(total.with([](long& t) { return t; }), 8000);
}

TEST_F(LockableTest, WorksOverSpinlock)
{
   Lockable<int, Spinlock> value(3);
   value.with([](int& v) { v *= 2; });

   auto guard = value.lock();
   EXPECT_EQ(*guard, 6);
   EXPECT_EQ(value.get(), 6);
}
