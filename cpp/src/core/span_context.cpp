#include "tracectx/core/span_context.hpp"

namespace tracectx::core {
    namespace {
        constexpr u64 kFnvOffset = 0xcbf29ce484222325ull;
        constexpr u64 kFnvPrime = 0x100000001b3ull;

        template <typename Bytes>
        u64 fnv1a(u64 h, const Bytes& bytes) noexcept {
            for (u8 v : bytes.b) {
                h ^= static_cast<u64>(v);
                h *= kFnvPrime;
            }
            return h;
        }
    } // namespace

    u64 span_context_hash(const SpanContext& ctx) noexcept {
        u64 h = kFnvOffset;
        h = fnv1a(h, ctx.trace_id);
        h = fnv1a(h, ctx.span_id);
        h = fnv1a(h, ctx.trace_options);
        return h;
    }
} // namespace tracectx::core
