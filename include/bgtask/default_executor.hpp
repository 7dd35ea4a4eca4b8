#pragma once

#include "any_executor.hpp"
#include "serial_executor.hpp"

namespace bgtask {

inline namespace v1 {

/**
 * @brief      Returns the process-wide serial executor
 *
 * This is the executor used by default by the @ref async_task objects. It is created the first time
 * it is needed, in a thread-safe manner, and it executes the tasks on the global thread pool.
 */
serial_executor default_serial_executor();

/**
 * @brief      Returns the currently configured default executor
 *
 * The @ref async_task objects that are created without an explicit executor use the executor
 * returned by this function at the moment @ref async_task::execute() is called.
 *
 * Unless changed, this returns @ref default_serial_executor().
 *
 * @see set_default_executor(), use_serial_executor(), use_pool_executor()
 */
any_executor default_executor();

/**
 * @brief      Changes the default executor
 *
 * @param      executor  The new default executor; if empty, the default serial executor is used
 *
 * The change is visible to all the @ref async_task::execute() calls that start after this
 * function returns; the tasks that were already submitted are not affected. Safe to call
 * concurrently with task submissions.
 */
void set_default_executor(any_executor executor);

//! Makes the default serial executor the default executor (this is the initial setting)
void use_serial_executor();

//! Makes a @ref pool_executor on the global pool the default executor; tasks are executed in
//! parallel, as much as the pool allows.
void use_pool_executor();

} // namespace v1
} // namespace bgtask
