#include "cosync/errors.hpp"
#include "cosync/port.h"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>

namespace cosync
{

static std::string describe(std::exception_ptr const& cause)
{
   if (!cause) return "initializer failed previously";
   try {
      std::rethrow_exception(cause);
   } catch (std::exception const& e) {
      return e.what();
   } catch (...) {
      return "initializer failed previously with a non-standard exception";
   }
}

PermanentInitializationFailure::PermanentInitializationFailure(std::exception_ptr cause) :
   std::runtime_error(describe(cause)), original(std::move(cause))
{
}

void PermanentInitializationFailure::rethrow_cause() const
{
   if (original) std::rethrow_exception(original);
   throw *this;
}

void concurrency_violation(char const* what) noexcept
{
   std::fprintf(stderr, "cosync: concurrency violation detected (worker %u): %s\n",
                cosync_port_get_worker_id(), what);
   std::fflush(stderr);
   std::abort();
}

} // namespace cosync
