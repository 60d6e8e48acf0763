/// @file HashMapError.hpp
/// @brief Error codes and expected type for hash map operations.
#pragma once

#include <expected>
#include <limits>
#include <string_view>

#include <ORE/Primitives.hpp>

namespace ORE::Containers
{
    /// @brief Slot value meaning "no slot".
    inline constexpr SlotIndex kNoSlot = std::numeric_limits<SlotIndex>::max();

    /// @brief Hash map error codes.
    enum class MapErrc : UInt8
    {
        Ok,
        /// Fixed-size table rejected an insert past its load limit.
        CapacityExceeded,
        /// Non-overwriting insert found the key; `MapError::slot` holds the existing entry.
        KeyAlreadyMapped,
        /// A cursor observed a table mutation it did not perform.
        ConcurrentModification,
        /// A sizing policy failed `Check()` and defaults were used instead.
        InvalidConfiguration,
        /// Cursor used after close, or without a current entry.
        InvalidState,
    };

    /// @brief Structured error with the slot it refers to, when there is one.
    struct MapError final
    {
        MapErrc   code {MapErrc::Ok};
        SlotIndex slot {kNoSlot};

        [[nodiscard]] constexpr bool IsOk() const noexcept { return code == MapErrc::Ok; }
    };

    [[nodiscard]] constexpr std::string_view ToString(MapErrc code) noexcept
    {
        switch (code)
        {
            case MapErrc::Ok: return "Ok";
            case MapErrc::CapacityExceeded: return "CapacityExceeded";
            case MapErrc::KeyAlreadyMapped: return "KeyAlreadyMapped";
            case MapErrc::ConcurrentModification: return "ConcurrentModification";
            case MapErrc::InvalidConfiguration: return "InvalidConfiguration";
            case MapErrc::InvalidState: return "InvalidState";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr MapError MakeMapError(MapErrc code, SlotIndex slot = kNoSlot) noexcept
    {
        return MapError {code, slot};
    }

    template<typename T>
    using MapExpected = std::expected<T, MapError>;
}// namespace ORE::Containers
