#pragma once

#include "tracectx/core/buffer.hpp"
#include "tracectx/core/errors.hpp"
#include "tracectx/core/types.hpp"

namespace tracectx::net {
    using u8 = tracectx::core::u8;
    using u32 = tracectx::core::u32;

    [[nodiscard]] constexpr u32 base16_encoded_len(u32 n) noexcept {
        return n * 2;
    }

    // Upper case, NUL terminated. out.len must hold 2 * in.len + 1.
    [[nodiscard]] tracectx::core::Status base16_encode(tracectx::core::BufferView in,
        tracectx::core::TextMut out,
        u32* written) noexcept;

    // Accepts only 0-9 and A-F. Malformed carries the offset of the first bad
    // character in aux (in.len for an odd length).
    [[nodiscard]] tracectx::core::Status base16_decode(tracectx::core::TextView in,
        tracectx::core::BufferMut out,
        u32* written) noexcept;
} // namespace tracectx::net
