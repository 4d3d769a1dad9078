#include "tracectx/net/binary_format.hpp"

namespace tracectx::net {
    using tracectx::core::make_status;
    using tracectx::core::ok_status;
    using tracectx::core::StatusCode;
    using tracectx::core::StatusDomain;

    namespace {
        enum class DecodeStep : u8 {
            TraceId = 0,
            SpanId,
            TraceOptions,
            Done,
        };

        bool tag_at(BufferView in, u32 pos, u8 field_id) noexcept {
            return pos < in.len && in.data[pos] == field_id;
        }

        // Consumes <tag><Id::kSize bytes> at *pos. False leaves *out and *pos untouched.
        template <typename Id>
        bool read_id_field(BufferView in, u8 field_id, u32* pos, Id* out) noexcept {
            if (!tag_at(in, *pos, field_id)) {
                return false;
            }
            const u32 payload = *pos + kIdBytes;
            if (in.len - payload < Id::kSize) {
                return false;
            }
            Id v{};
            if (!tracectx::core::is_ok(Id::from_bytes(in, payload, &v))) {
                return false;
            }
            *out = v;
            *pos = payload + Id::kSize;
            return true;
        }

        // Options are little-endian with only the low byte defined, so a short
        // payload fills the low positions and the rest stay zero.
        void read_options_field(BufferView in, u32 pos, tracectx::core::TraceOptions* out) noexcept {
            if (!tag_at(in, pos, kTraceOptionsFieldId)) {
                return;
            }
            const u32 payload = pos + kIdBytes;
            u32 avail = in.len - payload;
            if (avail > tracectx::core::TraceOptions::kSize) {
                avail = tracectx::core::TraceOptions::kSize;
            }
            tracectx::core::TraceOptions o{};
            for (u32 i = 0; i < avail; ++i) {
                o.b[i] = in.data[payload + i];
            }
            *out = o;
        }
    } // namespace

    const DefaultHandler& DefaultHandler::instance() noexcept {
        static const DefaultHandler handler{};
        return handler;
    }

    Status DefaultHandler::to_binary_format(const SpanContext& ctx, BufferMut out, u32* written) const noexcept {
        if (written == nullptr || out.data == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        *written = 0;
        if (out.len < kFormatBytes) {
            return make_status(StatusDomain::Codec, StatusCode::NoSpace, kFormatBytes);
        }

        out.data[kVersionIdOffset] = kVersionId;

        out.data[kTraceIdFieldIdOffset] = kTraceIdFieldId;
        Status s = ctx.trace_id.copy_bytes_to(out, kTraceIdOffset);
        if (!tracectx::core::is_ok(s)) return s;

        out.data[kSpanIdFieldIdOffset] = kSpanIdFieldId;
        s = ctx.span_id.copy_bytes_to(out, kSpanIdOffset);
        if (!tracectx::core::is_ok(s)) return s;

        out.data[kTraceOptionsFieldIdOffset] = kTraceOptionsFieldId;
        s = ctx.trace_options.copy_bytes_to(out, kTraceOptionsOffset);
        if (!tracectx::core::is_ok(s)) return s;

        *written = kFormatBytes;
        return ok_status();
    }

    Status DefaultHandler::from_binary_format(BufferView in, SpanContext* out) const noexcept {
        if (out == nullptr || in.data == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (in.len == 0) {
            return make_status(StatusDomain::Codec, StatusCode::Unsupported, tracectx::core::kAuxNoVersionByte);
        }
        if (in.data[kVersionIdOffset] != kVersionId) {
            return make_status(StatusDomain::Codec, StatusCode::Unsupported, in.data[kVersionIdOffset]);
        }

        SpanContext ctx = SpanContext::invalid();
        u32 pos = kVersionIdOffset + kIdBytes;

        DecodeStep step = DecodeStep::TraceId;
        while (step != DecodeStep::Done) {
            switch (step) {
            case DecodeStep::TraceId:
                step = read_id_field(in, kTraceIdFieldId, &pos, &ctx.trace_id)
                    ? DecodeStep::SpanId
                    : DecodeStep::Done;
                break;
            case DecodeStep::SpanId:
                step = read_id_field(in, kSpanIdFieldId, &pos, &ctx.span_id)
                    ? DecodeStep::TraceOptions
                    : DecodeStep::Done;
                break;
            case DecodeStep::TraceOptions:
                read_options_field(in, pos, &ctx.trace_options);
                step = DecodeStep::Done;
                break;
            case DecodeStep::Done:
                break;
            }
        }

        *out = ctx;
        return ok_status();
    }
} // namespace tracectx::net
