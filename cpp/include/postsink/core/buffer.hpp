#pragma once

#include <string_view>
#include <type_traits>
#include <vector>

#include "postsink/core/types.hpp"

namespace postsink::core {

    // Non-owning byte ranges handed to the wire codecs. Neither type keeps
    // its storage alive; the caller does.
    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] inline BufferView view_of(std::string_view s) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u32>(s.size())};
    }

    [[nodiscard]] inline BufferView view_of(const std::vector<u8>& v) noexcept {
        return BufferView{v.data(), static_cast<u32>(v.size())};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
} // namespace postsink::core
