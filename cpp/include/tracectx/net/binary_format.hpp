#pragma once

#include "tracectx/core/buffer.hpp"
#include "tracectx/core/errors.hpp"
#include "tracectx/core/ids.hpp"
#include "tracectx/core/span_context.hpp"
#include "tracectx/core/types.hpp"

namespace tracectx::net {
    using u8 = tracectx::core::u8;
    using u32 = tracectx::core::u32;
    using BufferView = tracectx::core::BufferView;
    using BufferMut = tracectx::core::BufferMut;
    using SpanContext = tracectx::core::SpanContext;
    using Status = tracectx::core::Status;

    // One revision of the binary wire format. Implementations hold no
    // mutable state, so a single instance may serve every thread.
    class VersionHandler {
    public:
        virtual ~VersionHandler() = default;

        // Leading byte this handler writes and accepts.
        [[nodiscard]] virtual u8 version_id() const noexcept = 0;

        // Upper bound on bytes written by to_binary_format.
        [[nodiscard]] virtual u32 encoded_size() const noexcept = 0;

        [[nodiscard]] virtual Status to_binary_format(const SpanContext& ctx,
            BufferMut out,
            u32* written) const noexcept = 0;

        // Unsupported when the version byte is missing or not ours.
        [[nodiscard]] virtual Status from_binary_format(BufferView in, SpanContext* out) const noexcept = 0;
    };

    // Version 0 layout:
    // 0 version(=0), 1 tag(=0), 2..17 trace_id, 18 tag(=1), 19..26 span_id,
    // 27 tag(=2), 28..31 trace_options.
    inline constexpr u8 kVersionId = 0;
    inline constexpr u32 kIdBytes = 1;

    inline constexpr u8 kTraceIdFieldId = 0;
    inline constexpr u8 kSpanIdFieldId = 1;
    inline constexpr u8 kTraceOptionsFieldId = 2;

    inline constexpr u32 kVersionIdOffset = 0;
    inline constexpr u32 kTraceIdFieldIdOffset = kVersionIdOffset + kIdBytes;
    inline constexpr u32 kTraceIdOffset = kTraceIdFieldIdOffset + kIdBytes;
    inline constexpr u32 kSpanIdFieldIdOffset = kTraceIdOffset + tracectx::core::TraceId::kSize;
    inline constexpr u32 kSpanIdOffset = kSpanIdFieldIdOffset + kIdBytes;
    inline constexpr u32 kTraceOptionsFieldIdOffset = kSpanIdOffset + tracectx::core::SpanId::kSize;
    inline constexpr u32 kTraceOptionsOffset = kTraceOptionsFieldIdOffset + kIdBytes;

    inline constexpr u32 kFormatBytes = 4 * kIdBytes
        + tracectx::core::TraceId::kSize
        + tracectx::core::SpanId::kSize
        + tracectx::core::TraceOptions::kSize;

    static_assert(kFormatBytes == 32);
    static_assert(kTraceOptionsOffset + tracectx::core::TraceOptions::kSize == kFormatBytes);

    class DefaultHandler final : public VersionHandler {
    public:
        [[nodiscard]] static const DefaultHandler& instance() noexcept;

        [[nodiscard]] u8 version_id() const noexcept override { return kVersionId; }
        [[nodiscard]] u32 encoded_size() const noexcept override { return kFormatBytes; }

        // Always emits all three fields, kFormatBytes in total.
        [[nodiscard]] Status to_binary_format(const SpanContext& ctx,
            BufferMut out,
            u32* written) const noexcept override;

        // Fields are recognised strictly in tag order. A missing or mismatched
        // tag, or a truncated id payload, leaves that field and every later one
        // at its sentinel without failing. Trailing bytes are ignored.
        [[nodiscard]] Status from_binary_format(BufferView in, SpanContext* out) const noexcept override;

    private:
        DefaultHandler() noexcept = default;
    };

} // namespace tracectx::net
