// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Value.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

namespace Quarry
{

class Resource;

/// @brief Maps keys to the single live resource of one repository and base model.
///
/// The map does not own its resources. An entry whose resource has been released reads as absent.
/// Each operation is atomic.
class QUARRY_API IdentityMap
{
  public:
    /// Retrieves the live resource with the given key, or nullptr.
    [[nodiscard]] std::shared_ptr<Resource> Get(Key const& key) const;

    void Set(Key const& key, std::shared_ptr<Resource> const& resource);

    /// Removes the entry with the given key. Returns true if there was one.
    bool Erase(Key const& key);

    /// Removes the entry with the given key only if it refers to the given resource.
    bool EraseIfSame(Key const& key, Resource const& resource);

    [[nodiscard]] bool Contains(Key const& key) const;

    /// Number of entries whose resources are still alive.
    [[nodiscard]] std::size_t Size() const;

  private:
    mutable std::mutex _mutex;
    std::unordered_map<Key, std::weak_ptr<Resource>, KeyHash> _entries;
};

} // namespace Quarry
