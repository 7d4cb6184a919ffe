#include "cosync/per_thread.hpp"

namespace cosync::detail
{

Condition& per_thread_lock() noexcept
{
   static Condition lock;
   return lock;
}

} // namespace cosync::detail
