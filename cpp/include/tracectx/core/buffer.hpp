#pragma once

#include <type_traits>

#include "tracectx/core/types.hpp"

namespace tracectx::core {
    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    struct TextView {
        const char* data{nullptr};
        u32 len{0};
    };

    // len counts the terminating NUL slot.
    struct TextMut {
        char* data{nullptr};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
    static_assert(std::is_trivially_copyable_v<TextView>);
    static_assert(std::is_trivially_copyable_v<TextMut>);
} // namespace tracectx::core
