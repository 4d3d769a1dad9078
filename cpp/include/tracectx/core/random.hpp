#pragma once

#include "tracectx/core/errors.hpp"
#include "tracectx/core/ids.hpp"

namespace tracectx::core {
    // Fill from the system CSPRNG. Never yields the invalid (all-zero) id.
    // Unavailable/External when built without libsodium.
    [[nodiscard]] Status trace_id_generate(TraceId* out) noexcept;
    [[nodiscard]] Status span_id_generate(SpanId* out) noexcept;
} // namespace tracectx::core
