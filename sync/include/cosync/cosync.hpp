/**
 * @file cosync.hpp
 * @brief Everything in one include
 */

#ifndef COSYNC_HPP
#define COSYNC_HPP

#include "cosync/runtime.hpp"
#include "cosync/errors.hpp"
#include "cosync/lock.hpp"
#include "cosync/reentrant_lock.hpp"
#include "cosync/lockable.hpp"
#include "cosync/condition.hpp"
#include "cosync/semaphore.hpp"
#include "cosync/event.hpp"
#include "cosync/per_process.hpp"
#include "cosync/per_thread.hpp"
#include "cosync/per_task.hpp"

#endif // COSYNC_HPP
