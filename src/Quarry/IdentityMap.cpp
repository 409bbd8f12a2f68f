// SPDX-License-Identifier: Apache-2.0

#include "IdentityMap.hpp"

#include <algorithm>

namespace Quarry
{

std::shared_ptr<Resource> IdentityMap::Get(Key const& key) const
{
    auto const _ = std::lock_guard { _mutex };
    if (auto const i = _entries.find(key); i != _entries.end())
        return i->second.lock();
    return nullptr;
}

void IdentityMap::Set(Key const& key, std::shared_ptr<Resource> const& resource)
{
    auto const _ = std::lock_guard { _mutex };
    _entries.insert_or_assign(key, resource);
}

bool IdentityMap::Erase(Key const& key)
{
    auto const _ = std::lock_guard { _mutex };
    return _entries.erase(key) != 0;
}

bool IdentityMap::EraseIfSame(Key const& key, Resource const& resource)
{
    auto const _ = std::lock_guard { _mutex };
    auto const i = _entries.find(key);
    if (i == _entries.end())
        return false;

    auto const current = i->second.lock();
    if (current && current.get() != &resource)
        return false;

    _entries.erase(i);
    return true;
}

bool IdentityMap::Contains(Key const& key) const
{
    return Get(key) != nullptr;
}

std::size_t IdentityMap::Size() const
{
    auto const _ = std::lock_guard { _mutex };
    return static_cast<std::size_t>(
        std::ranges::count_if(_entries, [](auto const& entry) { return !entry.second.expired(); }));
}

} // namespace Quarry
