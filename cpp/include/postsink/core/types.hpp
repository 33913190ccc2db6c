#pragma once

#include <cstddef>
#include <cstdint>

namespace postsink::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    // Width the sequence number is zero-padded to inside a destination name.
    inline constexpr u32 kSequenceDigits = 6;

} // namespace postsink::core
