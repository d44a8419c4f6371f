#pragma once

/// @file catalog_handle.h
/// @brief Process-wide reference to the active catalog

#include <cstdint>
#include <memory>
#include <mutex>

#include <absl/status/status.h>

#include "catalog/catalog.h"

namespace guardian::catalog {

/// @brief Holds the active catalog and swaps it atomically on reload
///
/// Readers take a shared_ptr snapshot through Current() and keep using it for
/// as long as they need; a concurrent Swap() never affects a snapshot already
/// handed out.
class CatalogHandle {
public:
    explicit CatalogHandle(std::shared_ptr<const Catalog> initial);

    // Disable copy
    CatalogHandle(const CatalogHandle&) = delete;
    CatalogHandle& operator=(const CatalogHandle&) = delete;

    /// @brief Snapshot of the active catalog
    std::shared_ptr<const Catalog> Current() const;

    /// @brief Replace the active catalog
    /// @return InvalidArgument if @p next is null; the active catalog is kept
    absl::Status Swap(std::shared_ptr<const Catalog> next);

    /// @brief Number of successful swaps since construction
    uint64_t Generation() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Catalog> current_;
    uint64_t generation_ = 0;
};

}  // namespace guardian::catalog
