#include "tracectx/net/base16.hpp"

namespace tracectx::net {
    using tracectx::core::make_status;
    using tracectx::core::ok_status;
    using tracectx::core::Status;
    using tracectx::core::StatusCode;
    using tracectx::core::StatusDomain;

    namespace {
        constexpr char kDigits[] = "0123456789ABCDEF";

        // -1 for anything outside the upper-case alphabet.
        int nibble(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    Status base16_encode(tracectx::core::BufferView in, tracectx::core::TextMut out, u32* written) noexcept {
        if (written == nullptr || out.data == nullptr) {
            return make_status(StatusDomain::Text, StatusCode::Invalid);
        }
        *written = 0;
        if (in.data == nullptr && in.len > 0) {
            return make_status(StatusDomain::Text, StatusCode::Invalid);
        }
        const u32 need = base16_encoded_len(in.len);
        if (out.len <= need) {
            return make_status(StatusDomain::Text, StatusCode::NoSpace, need + 1);
        }

        u32 pos = 0;
        for (u32 i = 0; i < in.len; ++i) {
            out.data[pos++] = kDigits[(in.data[i] >> 4) & 0xF];
            out.data[pos++] = kDigits[in.data[i] & 0xF];
        }
        out.data[pos] = '\0';
        *written = pos;
        return ok_status();
    }

    Status base16_decode(tracectx::core::TextView in, tracectx::core::BufferMut out, u32* written) noexcept {
        if (written == nullptr || in.data == nullptr) {
            return make_status(StatusDomain::Text, StatusCode::Invalid);
        }
        *written = 0;
        if ((in.len & 1u) != 0) {
            return make_status(StatusDomain::Text, StatusCode::Malformed, in.len);
        }

        for (u32 i = 0; i < in.len; ++i) {
            if (nibble(in.data[i]) < 0) {
                return make_status(StatusDomain::Text, StatusCode::Malformed, i);
            }
        }

        const u32 n = in.len / 2;
        if (n > 0 && out.data == nullptr) {
            return make_status(StatusDomain::Text, StatusCode::Invalid);
        }
        if (out.len < n) {
            return make_status(StatusDomain::Text, StatusCode::NoSpace, n);
        }

        for (u32 i = 0; i < n; ++i) {
            const int hi = nibble(in.data[2 * i]);
            const int lo = nibble(in.data[2 * i + 1]);
            out.data[i] = static_cast<u8>((hi << 4) | lo);
        }
        *written = n;
        return ok_status();
    }
} // namespace tracectx::net
