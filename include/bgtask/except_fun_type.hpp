#pragma once

#include <functional>
#include <exception>

namespace bgtask {

inline namespace v1 {

/**
 * @brief      Type of function to be called for handling exceptions
 *
 * This defines the type of exception handler function used across bgtask. A handler of this type
 * will be called whenever an exception is thrown by a task and there is no other place to report it
 * to. Handlers are typically called on worker threads.
 */
using except_fun_t = std::function<void(std::exception_ptr)>;

} // namespace v1
} // namespace bgtask
