/**
 * @file port_traits.h
 * @brief Port-specific compile-time constants
 *
 * Each port must provide this header defining:
 * - COSYNC_PORT_CONTEXT_SIZE: Size of cosync_port_context_t in bytes
 * - COSYNC_PORT_CONTEXT_ALIGN: Alignment requirement for cosync_port_context_t
 * - COSYNC_STACK_ALIGN: Stack alignment requirement
 *
 * The runtime uses these to reserve context storage inside each unit control
 * block. The port implementation static_asserts that the actual sizes match.
 */

#ifndef COSYNC_PORT_TRAITS_H
#define COSYNC_PORT_TRAITS_H

/* ============================================================================
 * Boost.Context Port (Linux, one pthread per worker)
 * ========================================================================= */

/**
 * @brief Size of cosync_port_context_t structure in bytes
 */
#define COSYNC_PORT_CONTEXT_SIZE  48

/**
 * @brief Alignment requirement for cosync_port_context_t
 */
#define COSYNC_PORT_CONTEXT_ALIGN 8

/**
 * @brief Stack alignment requirement in bytes
 *
 * All unit stacks must be aligned to this boundary.
 * Must be a power of two.
 */
#define COSYNC_STACK_ALIGN 16

#define COSYNC_PORT_CACHE_LINE 64

/**
 * @brief Worker id reported for OS threads that never recorded one
 */
#define COSYNC_PORT_NO_WORKER 0xFFFFFFFFu

#endif // COSYNC_PORT_TRAITS_H
