#pragma once

#include <cstddef>
#include <functional>
#include <type_traits>

#include "tracectx/core/ids.hpp"
#include "tracectx/core/types.hpp"

namespace tracectx::core {

    // Immutable once built; shared read-only across threads.
    struct SpanContext {
        TraceId trace_id{TraceId::invalid()};
        SpanId span_id{SpanId::invalid()};
        TraceOptions trace_options{TraceOptions::default_options()};

        static constexpr SpanContext invalid() noexcept { return SpanContext{}; }

        [[nodiscard]] constexpr bool is_valid() const noexcept {
            return trace_id.is_valid() && span_id.is_valid();
        }

        friend constexpr bool operator==(const SpanContext&, const SpanContext&) noexcept = default;
    };

    [[nodiscard]] u64 span_context_hash(const SpanContext& ctx) noexcept;

    static_assert(sizeof(SpanContext) == 28);
    static_assert(std::is_trivially_copyable_v<SpanContext>);
    static_assert(std::is_standard_layout_v<SpanContext>);

} // namespace tracectx::core

template <>
struct std::hash<tracectx::core::SpanContext> {
    std::size_t operator()(const tracectx::core::SpanContext& ctx) const noexcept {
        return static_cast<std::size_t>(tracectx::core::span_context_hash(ctx));
    }
};
