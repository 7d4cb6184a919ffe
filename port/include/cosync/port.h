/**
 * @file port.h
 * @brief cosync Port Layer API (C ABI)
 *
 * This is the platform abstraction between the cosync runtime and the code
 * that actually switches stacks. All functions use C linkage so a port can be
 * written in C or assembly.
 *
 * A port must provide every function declared here.
 */

#ifndef COSYNC_PORT_H
#define COSYNC_PORT_H

#include "cosync/port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Opaque context structure (platform-specific size/alignment)
 *
 * Each port defines the actual structure. The runtime treats this as opaque
 * and reserves COSYNC_PORT_CONTEXT_SIZE bytes for it.
 */
typedef struct cosync_port_context cosync_port_context_t;

/**
 * @brief Unit entry point signature
 */
typedef void (*cosync_port_entry_t)(void* arg);

/* ============================================================================
 * Worker Identification
 * ========================================================================= */

/**
 * @brief Get the id recorded for the calling OS thread
 * @return Worker id, or COSYNC_PORT_NO_WORKER if none was recorded
 */
uint32_t cosync_port_get_worker_id(void);

/**
 * @brief Record the id of the calling OS thread
 */
void cosync_port_set_worker_id(uint32_t worker_id);

/* ============================================================================
 * Context Switching
 * ========================================================================= */

/**
 * @brief Initialise a unit context
 * @param context Pointer to context storage (pre-allocated by the runtime)
 * @param stack_base Pointer to the base (lowest address) of the stack
 * @param stack_size Size of the stack in bytes
 * @param entry Unit entry point function
 * @param arg Argument to pass to entry function
 *
 * When cosync_port_switch() is first called with this context, the unit
 * starts executing at entry(arg).
 */
void cosync_port_context_init(cosync_port_context_t* context,
                              void* stack_base,
                              size_t stack_size,
                              cosync_port_entry_t entry,
                              void* arg);

/**
 * @brief Destroy a unit context
 *
 * The context must have finished (see cosync_port_context_finished()).
 */
void cosync_port_context_destroy(cosync_port_context_t* context);

/**
 * @brief Resume a unit on the calling OS thread
 * @param from Unused by fiber ports, kept for stack-switching ports
 * @param to Context to resume
 *
 * Returns when the unit yields back or its entry function returns.
 */
void cosync_port_switch(cosync_port_context_t* from, cosync_port_context_t* to);

/**
 * @brief Yield from the running unit back to the worker that resumed it
 *
 * A no-op when called outside a unit.
 */
void cosync_port_yield(void);

/**
 * @brief Check whether a context's entry function has returned
 */
bool cosync_port_context_finished(cosync_port_context_t const* context);

/* ============================================================================
 * Thread-Local Storage (TLS)
 * ========================================================================= */

/**
 * @brief Set the TLS pointer for the calling OS thread
 *
 * The runtime points this at the control block of the unit it is about to
 * resume. These accessors are deliberately out of line: code running in a
 * unit may resume on a different OS thread, so a thread-local address must
 * never be cached across a switch.
 */
void cosync_port_set_tls_pointer(void* tls_base);

/**
 * @brief Get the TLS pointer of the calling OS thread
 */
void* cosync_port_get_tls_pointer(void);

/* ============================================================================
 * CPU Hints / Idle Hook
 * ========================================================================= */

void cosync_port_cpu_relax(void);

/**
 * @brief Platform-specific idle behaviour for a worker with nothing to run
 * @param nanoseconds Upper bound for how long the worker may sleep
 */
void cosync_port_idle(long nanoseconds);

/* ============================================================================
 * Debug / Diagnostics
 * ========================================================================= */

/**
 * @brief Get the current stack pointer value
 */
void* cosync_port_get_stack_pointer(void);

#ifdef __cplusplus
}
#endif

#endif /* COSYNC_PORT_H */
