#include "bgtask/default_executor.hpp"
#include "bgtask/pool_executor.hpp"
#include "bgtask/log.hpp"

#include <memory>

namespace bgtask {
namespace detail {

//! The currently configured executor. The pointed object is never changed; to change the default
//! executor we replace the pointer. Null means the default serial executor.
static std::shared_ptr<const any_executor> g_default_executor;

} // namespace detail

inline namespace v1 {

serial_executor default_serial_executor() {
    static const serial_executor instance{};
    return instance;
}

any_executor default_executor() {
    auto p = std::atomic_load(&detail::g_default_executor);
    if (p)
        return *p;
    return default_serial_executor();
}

void set_default_executor(any_executor executor) {
    std::shared_ptr<const any_executor> p;
    if (executor)
        p = std::make_shared<const any_executor>(std::move(executor));
    BGTASK_LOG(log_level::debug, "changing default executor to {}",
            p ? p->target_type().name() : "the default serial executor");
    std::atomic_store(&detail::g_default_executor, std::move(p));
}

void use_serial_executor() { set_default_executor({}); }

void use_pool_executor() { set_default_executor(pool_executor{}); }

} // namespace v1
} // namespace bgtask
