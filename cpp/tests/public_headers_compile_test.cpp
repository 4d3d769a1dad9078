#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "tracectx/core/buffer.hpp"
#include "tracectx/core/errors.hpp"
#include "tracectx/core/ids.hpp"
#include "tracectx/core/random.hpp"
#include "tracectx/core/span_context.hpp"
#include "tracectx/core/types.hpp"
#include "tracectx/net/base16.hpp"
#include "tracectx/net/binary_format.hpp"
#include "tracectx/net/propagation.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
