#pragma once

namespace bgtask {

inline namespace v1 {
struct init_data;
class thread_pool;
} // namespace v1

namespace detail {

/**
 * @brief      Getter for the global thread pool that also ensures that the library is initialized.
 *
 * @param      config  The configuration to be used for the library; can be null.
 *
 * @return     The thread pool object to be used for the global tasks.
 *
 * This is used so that we can automatically initialize the library before its first use.
 */
thread_pool& get_global_pool(const init_data* config = nullptr);

} // namespace detail
} // namespace bgtask
