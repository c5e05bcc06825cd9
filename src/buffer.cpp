/**
 * @file buffer.cpp
 * @brief Buffer release path
 */

#include <blockio/buffer.hpp>

#include "buffer_registry.h"
#include "log.h"

namespace blockio {

void Buffer::release_internal() noexcept {
    if (registry_ && ptr_) {
        if (!registry_->free_allocation(handle_, ptr_)) {
            // Still referenced by a worker: the memory must not be freed
            detail::log_printf(LogLevel::Error,
                               "buffer %llu destroyed with operations outstanding; %zu bytes leaked",
                               static_cast<unsigned long long>(handle_.id()), size_);
        }
    }
    registry_.reset();
    ptr_ = nullptr;
    size_ = 0;
    handle_ = BufferHandle();
    pinned_ = false;
}

} // namespace blockio
