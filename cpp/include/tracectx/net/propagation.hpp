#pragma once

#include "tracectx/core/buffer.hpp"
#include "tracectx/core/errors.hpp"
#include "tracectx/core/span_context.hpp"
#include "tracectx/core/types.hpp"
#include "tracectx/net/base16.hpp"
#include "tracectx/net/binary_format.hpp"

namespace tracectx::net {
    using TextView = tracectx::core::TextView;
    using TextMut = tracectx::core::TextMut;

    // HTTP header carrying base16(binary value), upper case US-ASCII.
    inline constexpr char kHttpHeaderName[] = "Trace-Context";

    // Largest binary value the facade will stage for the header path.
    inline constexpr u32 kMaxBinaryValueBytes = 256;

    // Header value length under the default handler, excluding the NUL.
    inline constexpr u32 kHttpHeaderValueBytes = base16_encoded_len(kFormatBytes);

    [[nodiscard]] const VersionHandler& default_handler() noexcept;

    // Handler used by every call below until replaced.
    [[nodiscard]] const VersionHandler& active_handler() noexcept;

    // Process-wide. nullptr reinstates the default handler. The handler must
    // outlive every call that may still be using it.
    void set_handler(const VersionHandler* handler) noexcept;

    [[nodiscard]] Status to_binary_value(const SpanContext& ctx, BufferMut out, u32* written) noexcept;
    [[nodiscard]] Status from_binary_value(BufferView in, SpanContext* out) noexcept;

    // out.len must hold 2 * encoded_size() + 1 bytes.
    [[nodiscard]] Status to_http_header_value(const SpanContext& ctx, TextMut out, u32* written) noexcept;

    // Text errors (Malformed/Text) surface before any version check runs.
    // The whole text is checked, but only the first kMaxBinaryValueBytes
    // decoded bytes reach the handler; the rest is trailing data. A handler
    // whose encoded_size() exceeds that bound is refused with NoSpace.
    [[nodiscard]] Status from_http_header_value(TextView in, SpanContext* out) noexcept;

} // namespace tracectx::net
