/// @file catalog_handle.cpp
/// @brief Atomic catalog swapping

#include "catalog/catalog_handle.h"

#include <stdexcept>

#include "common/error.h"
#include "common/logging.h"

namespace guardian::catalog {

CatalogHandle::CatalogHandle(std::shared_ptr<const Catalog> initial)
    : current_(std::move(initial)) {
    if (!current_) {
        throw std::invalid_argument("CatalogHandle requires a catalog");
    }
}

std::shared_ptr<const Catalog> CatalogHandle::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

absl::Status CatalogHandle::Swap(std::shared_ptr<const Catalog> next) {
    if (!next) {
        return InvalidArgumentError("Cannot swap in a null catalog");
    }

    std::shared_ptr<const Catalog> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(current_);
        current_ = std::move(next);
        ++generation_;
        GUARDIAN_LOG_INFO("Catalog swapped: {} -> {} (generation {})",
                          previous->Version(), current_->Version(), generation_);
    }
    // previous is released outside the lock
    return OkStatus();
}

uint64_t CatalogHandle::Generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace guardian::catalog
