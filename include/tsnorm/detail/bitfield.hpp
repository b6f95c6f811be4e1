// include/tsnorm/detail/bitfield.hpp
#pragma once

#include <concepts>

#include <cstddef>
#include <cstdint>

namespace tsnorm::detail {

// Concepts for type constraints
template <typename T>
concept UnsignedIntegral =
    std::unsigned_integral<T> && (std::same_as<T, uint8_t> || std::same_as<T, uint16_t> ||
                                  std::same_as<T, uint32_t> || std::same_as<T, uint64_t>);

// Helper to calculate mask safely without UB shift
template <typename StorageType, std::size_t Width>
constexpr StorageType calculate_mask() noexcept {
    if constexpr (Width == sizeof(StorageType) * 8) {
        // Full-width field - all bits set
        return ~StorageType{0};
    } else {
        // Partial field - shift is safe because Width < bit_width
        return (StorageType{1} << Width) - 1;
    }
}

/**
 * Compile-time description of a bit range inside a packed date or time word.
 *
 * @tparam StorageType Unsigned word holding the field
 * @tparam Offset Bit position of the least significant bit
 * @tparam Width Number of bits
 */
template <typename StorageType, std::size_t Offset, std::size_t Width>
struct BitField {
    static_assert(UnsignedIntegral<StorageType>,
                  "BitField storage type must be an unsigned integral type");
    static_assert(Width > 0 && Width <= sizeof(StorageType) * 8,
                  "BitField width must be between 1 and storage type bit width");
    static_assert(Offset + Width <= sizeof(StorageType) * 8,
                  "BitField extends beyond storage type boundary");

    using storage_type = StorageType;

    static constexpr std::size_t offset = Offset;
    static constexpr std::size_t width = Width;
    static constexpr StorageType mask = calculate_mask<StorageType, Width>();

    // Extract field value from storage word
    static constexpr StorageType extract(StorageType word) noexcept {
        return static_cast<StorageType>((word >> offset) & mask);
    }

    // Insert field value into storage word; bits above the width are dropped
    static constexpr StorageType insert(StorageType word, StorageType value) noexcept {
        const StorageType cleared = word & static_cast<StorageType>(~(mask << offset));
        const StorageType shifted = static_cast<StorageType>((value & mask) << offset);
        return cleared | shifted;
    }
};

} // namespace tsnorm::detail
