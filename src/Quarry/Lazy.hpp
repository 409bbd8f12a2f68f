// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <utility>

namespace Quarry
{

/// A cache cell that distinguishes "never computed" from "computed as nothing".
///
/// The cell is in exactly one of three states: Unloaded, Loaded (holding a value) or LoadedNil.
template <typename T>
class Lazy
{
  public:
    enum class State : std::uint8_t
    {
        Unloaded,
        Loaded,
        LoadedNil,
    };

    Lazy() = default;

    [[nodiscard]] State GetState() const noexcept
    {
        return _state;
    }

    [[nodiscard]] bool IsLoaded() const noexcept
    {
        return _state != State::Unloaded;
    }

    [[nodiscard]] bool IsNil() const noexcept
    {
        return _state == State::LoadedNil;
    }

    /// Retrieves the cached value, or nullptr if the cell is unloaded or nil.
    [[nodiscard]] T const* Get() const noexcept
    {
        return _state == State::Loaded ? &*_value : nullptr;
    }

    [[nodiscard]] T* Get() noexcept
    {
        return _state == State::Loaded ? &*_value : nullptr;
    }

    T& Emplace(T value)
    {
        _value.emplace(std::move(value));
        _state = State::Loaded;
        return *_value;
    }

    void EmplaceNil() noexcept
    {
        _value.reset();
        _state = State::LoadedNil;
    }

    void Reset() noexcept
    {
        _value.reset();
        _state = State::Unloaded;
    }

    /// Runs the loader if the cell is unloaded and caches its outcome.
    ///
    /// The loader returns std::optional<T>; std::nullopt is cached as nil.
    template <typename Loader>
    T const* Ensure(Loader&& loader)
    {
        if (_state == State::Unloaded)
        {
            if (auto result = std::forward<Loader>(loader)(); result.has_value())
                Emplace(std::move(*result));
            else
                EmplaceNil();
        }
        return Get();
    }

  private:
    State _state = State::Unloaded;
    std::optional<T> _value;
};

} // namespace Quarry
