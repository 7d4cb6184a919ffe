/**
 * @file errors.hpp
 * @brief Error types raised by the cosync synchronization primitives
 *
 * Misuse of a primitive (unlocking a lock you don't own, releasing a
 * semaphore slot you never acquired) is reported by throwing, and leaves the
 * primitive in a well-defined state. Broken internal invariants are not
 * recoverable and end the process through concurrency_violation().
 */

#ifndef COSYNC_ERRORS_HPP
#define COSYNC_ERRORS_HPP

#include <exception>
#include <stdexcept>

namespace cosync
{

class InvalidOperation : public std::logic_error
{
public:
   using std::logic_error::logic_error;
};

class InvalidArgument : public std::invalid_argument
{
public:
   using std::invalid_argument::invalid_argument;
};

/**
 * @brief A once-initializer failed earlier; the failure is permanent
 *
 * Thrown to every caller after the one that saw the initializer fail. what()
 * repeats the original error's message and the original exception is
 * available through cause().
 */
class PermanentInitializationFailure : public std::runtime_error
{
public:
   explicit PermanentInitializationFailure(std::exception_ptr cause);

   [[nodiscard]] std::exception_ptr cause() const noexcept { return original; }

   [[noreturn]] void rethrow_cause() const;

private:
   std::exception_ptr original;
};

/**
 * @brief Report a broken internal invariant and abort the process
 */
[[noreturn]] void concurrency_violation(char const* what) noexcept;

} // namespace cosync

#endif // COSYNC_ERRORS_HPP
