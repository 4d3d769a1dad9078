#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <type_traits>

#include "tracectx/core/buffer.hpp"
#include "tracectx/core/errors.hpp"
#include "tracectx/core/types.hpp"

namespace tracectx::core {

    namespace detail {
        template <std::size_t N>
        [[nodiscard]] constexpr Status bytes_copy_to(const std::array<u8, N>& b, BufferMut out, u32 off) noexcept {
            if (out.data == nullptr || off > out.len || out.len - off < N) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, off);
            }
            for (u32 i = 0; i < N; ++i) {
                out.data[off + i] = b[i];
            }
            return ok_status();
        }

        template <std::size_t N>
        [[nodiscard]] constexpr Status bytes_read(BufferView in, u32 off, std::array<u8, N>* out) noexcept {
            if (out == nullptr || in.data == nullptr) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            if (off > in.len || in.len - off < N) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, off);
            }
            for (u32 i = 0; i < N; ++i) {
                (*out)[i] = in.data[off + i];
            }
            return ok_status();
        }
    } // namespace detail

    // Opaque fixed-length byte identifier. Any byte pattern is legal;
    // all-zero is reserved as the invalid sentinel.
    template <typename Tag, u32 N>
    struct FixedBytes {
        static constexpr u32 kSize = N;

        std::array<u8, N> b{};

        static constexpr FixedBytes invalid() noexcept { return FixedBytes{}; }

        [[nodiscard]] constexpr bool is_valid() const noexcept {
            for (u8 v : b) {
                if (v != 0) {
                    return true;
                }
            }
            return false;
        }

        // Writes exactly kSize bytes at out.data + off.
        [[nodiscard]] constexpr Status copy_bytes_to(BufferMut out, u32 off) const noexcept {
            return detail::bytes_copy_to(b, out, off);
        }

        // Reads exactly kSize bytes starting at in.data + off.
        [[nodiscard]] static constexpr Status from_bytes(BufferView in, u32 off, FixedBytes* out) noexcept {
            if (out == nullptr) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            FixedBytes v{};
            const Status s = detail::bytes_read(in, off, &v.b);
            if (is_ok(s)) {
                *out = v;
            }
            return s;
        }

        friend constexpr bool operator==(const FixedBytes&, const FixedBytes&) noexcept = default;
        friend constexpr auto operator<=>(const FixedBytes&, const FixedBytes&) noexcept = default;
    };

    struct TraceIdTag {};
    using TraceId = FixedBytes<TraceIdTag, 16>;

    struct SpanIdTag {};
    using SpanId = FixedBytes<SpanIdTag, 8>;

    // Only byte 0 carries flags today (little-endian when read as an int).
    // Bytes 1..3 are reserved and must round-trip untouched. All-zero is the
    // default ("not sampled"), not an invalid value.
    struct TraceOptions {
        static constexpr u32 kSize = 4;
        static constexpr u8 kSampled = 1u << 0;

        std::array<u8, kSize> b{};

        static constexpr TraceOptions default_options() noexcept { return TraceOptions{}; }

        static constexpr TraceOptions from_byte(u8 flags) noexcept {
            TraceOptions o{};
            o.b[0] = flags;
            return o;
        }

        [[nodiscard]] constexpr bool is_sampled() const noexcept {
            return (b[0] & kSampled) != 0;
        }

        [[nodiscard]] constexpr TraceOptions with_sampled(bool sampled) const noexcept {
            TraceOptions o = *this;
            if (sampled) {
                o.b[0] = static_cast<u8>(o.b[0] | kSampled);
            } else {
                o.b[0] = static_cast<u8>(o.b[0] & ~kSampled);
            }
            return o;
        }

        [[nodiscard]] constexpr Status copy_bytes_to(BufferMut out, u32 off) const noexcept {
            return detail::bytes_copy_to(b, out, off);
        }

        [[nodiscard]] static constexpr Status from_bytes(BufferView in, u32 off, TraceOptions* out) noexcept {
            if (out == nullptr) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            TraceOptions v{};
            const Status s = detail::bytes_read(in, off, &v.b);
            if (is_ok(s)) {
                *out = v;
            }
            return s;
        }

        friend constexpr bool operator==(const TraceOptions&, const TraceOptions&) noexcept = default;
        friend constexpr auto operator<=>(const TraceOptions&, const TraceOptions&) noexcept = default;
    };

    static_assert(sizeof(TraceId) == 16);
    static_assert(sizeof(SpanId) == 8);
    static_assert(sizeof(TraceOptions) == 4);
    static_assert(std::is_trivially_copyable_v<TraceId>);
    static_assert(std::is_trivially_copyable_v<SpanId>);
    static_assert(std::is_trivially_copyable_v<TraceOptions>);
    static_assert(std::is_standard_layout_v<TraceId>);

} // namespace tracectx::core
