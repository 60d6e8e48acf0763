// This file belongs to the core module: fundamental type definitions.
#pragma once
#include <cstddef>
#include <cstdint>

namespace ORE
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents a 16-bit unsigned integer.
    using UInt16 = std::uint16_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a 32-bit signed integer.
    using Int32 = std::int32_t;

    /// @brief Represents a 32-bit floating point number.
    using F32 = float;
    /// @brief Represents a 64-bit floating point number.
    using F64 = double;

    using UIntSize = std::size_t;

    /// @brief Index of a bucket inside a table's bucket array.
    using SlotIndex = UInt32;
}// namespace ORE
