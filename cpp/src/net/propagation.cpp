#include "tracectx/net/propagation.hpp"

#include <array>
#include <atomic>

namespace tracectx::net {
    using tracectx::core::is_ok;
    using tracectx::core::make_status;
    using tracectx::core::StatusCode;
    using tracectx::core::StatusDomain;

    namespace {
        // nullptr means the default handler.
        std::atomic<const VersionHandler*> g_active_handler{nullptr};
    } // namespace

    const VersionHandler& default_handler() noexcept {
        return DefaultHandler::instance();
    }

    const VersionHandler& active_handler() noexcept {
        const VersionHandler* h = g_active_handler.load(std::memory_order_acquire);
        return h != nullptr ? *h : default_handler();
    }

    void set_handler(const VersionHandler* handler) noexcept {
        g_active_handler.store(handler, std::memory_order_release);
    }

    Status to_binary_value(const SpanContext& ctx, BufferMut out, u32* written) noexcept {
        if (written == nullptr || out.data == nullptr) {
            return make_status(StatusDomain::Propagation, StatusCode::Invalid);
        }
        return active_handler().to_binary_format(ctx, out, written);
    }

    Status from_binary_value(BufferView in, SpanContext* out) noexcept {
        if (out == nullptr || in.data == nullptr) {
            return make_status(StatusDomain::Propagation, StatusCode::Invalid);
        }
        return active_handler().from_binary_format(in, out);
    }

    Status to_http_header_value(const SpanContext& ctx, TextMut out, u32* written) noexcept {
        if (written == nullptr || out.data == nullptr) {
            return make_status(StatusDomain::Propagation, StatusCode::Invalid);
        }
        *written = 0;

        // One load so encode and size agree even if the slot is swapped meanwhile.
        const VersionHandler& handler = active_handler();
        if (handler.encoded_size() > kMaxBinaryValueBytes) {
            return make_status(StatusDomain::Propagation, StatusCode::NoSpace, handler.encoded_size());
        }

        std::array<u8, kMaxBinaryValueBytes> bin{};
        u32 bin_len = 0;
        const Status s = handler.to_binary_format(ctx, {bin.data(), static_cast<u32>(bin.size())}, &bin_len);
        if (!is_ok(s)) {
            return s;
        }
        return base16_encode({bin.data(), bin_len}, out, written);
    }

    Status from_http_header_value(TextView in, SpanContext* out) noexcept {
        if (out == nullptr || in.data == nullptr) {
            return make_status(StatusDomain::Propagation, StatusCode::Invalid);
        }

        const VersionHandler& handler = active_handler();
        if (handler.encoded_size() > kMaxBinaryValueBytes) {
            return make_status(StatusDomain::Propagation, StatusCode::NoSpace, handler.encoded_size());
        }

        std::array<u8, kMaxBinaryValueBytes> bin{};
        u32 bin_len = 0;
        Status s = base16_decode(in, {bin.data(), static_cast<u32>(bin.size())}, &bin_len);
        if (s.code == StatusCode::NoSpace) {
            // Valid text longer than any encoding the handler emits: the tail
            // is trailing data, hand over the prefix.
            s = base16_decode({in.data, base16_encoded_len(kMaxBinaryValueBytes)},
                {bin.data(), static_cast<u32>(bin.size())},
                &bin_len);
        }
        if (!is_ok(s)) {
            return s;
        }
        return handler.from_binary_format({bin.data(), bin_len}, out);
    }
} // namespace tracectx::net
