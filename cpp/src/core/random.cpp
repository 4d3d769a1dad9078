#include "tracectx/core/random.hpp"

#if defined(TRACECTX_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

namespace tracectx::core {
    namespace {
#if defined(TRACECTX_HAVE_LIBSODIUM)
        Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return make_status(StatusDomain::External, StatusCode::Unavailable);
            }
            return ok_status();
        }
#endif

        template <typename Id>
        Status generate(Id* out) noexcept {
            if (out == nullptr) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
#if defined(TRACECTX_HAVE_LIBSODIUM)
            const Status init = ensure_sodium();
            if (!is_ok(init)) {
                return init;
            }

            Id id{};
            do {
                randombytes_buf(id.b.data(), id.b.size());
            } while (!id.is_valid());

            *out = id;
            return ok_status();
#else
            *out = Id::invalid();
            return make_status(StatusDomain::External, StatusCode::Unavailable);
#endif
        }
    } // namespace

    Status trace_id_generate(TraceId* out) noexcept {
        return generate(out);
    }

    Status span_id_generate(SpanId* out) noexcept {
        return generate(out);
    }
} // namespace tracectx::core
