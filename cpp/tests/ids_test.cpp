#include <array>

#include <gtest/gtest.h>

#include "tracectx/core/ids.hpp"

using namespace tracectx::core;

namespace {
    template <typename T>
    concept HasInvalidSentinel = requires(const T& t) {
        T::invalid();
        t.is_valid();
    };
} // namespace

static_assert(HasInvalidSentinel<TraceId>);
static_assert(HasInvalidSentinel<SpanId>);
static_assert(!HasInvalidSentinel<TraceOptions>);

TEST(CoreIds, SizesMatchWireFields) {
    EXPECT_EQ(TraceId::kSize, 16u);
    EXPECT_EQ(SpanId::kSize, 8u);
    EXPECT_EQ(TraceOptions::kSize, 4u);
}

TEST(CoreIds, AllZeroIsInvalid) {
    EXPECT_FALSE(TraceId::invalid().is_valid());
    EXPECT_FALSE(SpanId::invalid().is_valid());

    SpanId s{};
    s.b[7] = 1;
    EXPECT_TRUE(s.is_valid());
}

TEST(CoreIds, CopyBytesToAtOffset) {
    TraceId id{};
    for (u32 i = 0; i < TraceId::kSize; ++i) {
        id.b[i] = static_cast<u8>(0x40 + i);
    }

    std::array<u8, 20> buf{};
    ASSERT_EQ(id.copy_bytes_to({buf.data(), static_cast<u32>(buf.size())}, 2).code, StatusCode::Ok);
    EXPECT_EQ(buf[0], 0);
    EXPECT_EQ(buf[1], 0);
    for (u32 i = 0; i < TraceId::kSize; ++i) {
        EXPECT_EQ(buf[2 + i], static_cast<u8>(0x40 + i)) << "byte " << i;
    }
    EXPECT_EQ(buf[18], 0);
}

TEST(CoreIds, CopyBytesToFailsWhenShort) {
    SpanId id{};
    std::array<u8, 10> buf{};
    const Status s = id.copy_bytes_to({buf.data(), static_cast<u32>(buf.size())}, 3);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Core);

    EXPECT_EQ(id.copy_bytes_to({buf.data(), static_cast<u32>(buf.size())}, 11).code, StatusCode::Invalid);
    EXPECT_EQ(id.copy_bytes_to({nullptr, 0}, 0).code, StatusCode::Invalid);
}

TEST(CoreIds, FromBytesReadsExactlySize) {
    const std::array<u8, 10> buf = {9, 97, 98, 99, 100, 101, 102, 103, 104, 9};
    SpanId id{};
    ASSERT_EQ(SpanId::from_bytes({buf.data(), static_cast<u32>(buf.size())}, 1, &id).code, StatusCode::Ok);

    const std::array<u8, 8> expected = {97, 98, 99, 100, 101, 102, 103, 104};
    EXPECT_EQ(id.b, expected);
}

TEST(CoreIds, FromBytesFailsWhenShort) {
    const std::array<u8, 4> buf = {1, 2, 3, 4};
    TraceOptions o = TraceOptions::from_byte(7);
    EXPECT_EQ(TraceOptions::from_bytes({buf.data(), static_cast<u32>(buf.size())}, 1, &o).code,
              StatusCode::Invalid);
    EXPECT_EQ(o, TraceOptions::from_byte(7));

    EXPECT_EQ(TraceOptions::from_bytes({buf.data(), static_cast<u32>(buf.size())}, 0, nullptr).code,
              StatusCode::Invalid);
}

TEST(CoreIds, TraceOptionsSampledBit) {
    EXPECT_FALSE(TraceOptions::default_options().is_sampled());

    TraceOptions o = TraceOptions::default_options().with_sampled(true);
    EXPECT_TRUE(o.is_sampled());
    EXPECT_EQ(o.b[0], 1);

    o.b[2] = 0xee;
    o = o.with_sampled(false);
    EXPECT_FALSE(o.is_sampled());
    EXPECT_EQ(o.b[2], 0xee);
}

TEST(CoreIds, StructuralOrdering) {
    SpanId a{};
    SpanId b{};
    a.b[0] = 1;
    b.b[0] = 2;
    EXPECT_LT(a, b);
    EXPECT_NE(a, b);
    b.b[0] = 1;
    EXPECT_EQ(a, b);
}

TEST(CoreIds, DefaultTraceOptionsIsOrdinaryValue) {
    const TraceOptions d = TraceOptions::default_options();
    EXPECT_EQ(d, TraceOptions{});
    EXPECT_FALSE(d.is_sampled());
    const std::array<u8, 4> zeros = {0, 0, 0, 0};
    EXPECT_EQ(d.b, zeros);

    const TraceOptions sampled = TraceOptions::from_byte(TraceOptions::kSampled);
    EXPECT_TRUE(sampled.is_sampled());
    EXPECT_NE(sampled, d);
    EXPECT_EQ(sampled.with_sampled(false), d);
}

TEST(CoreIds, TraceOptionsCopyAndRead) {
    TraceOptions o{};
    o.b = {0x01, 0xaa, 0xbb, 0xcc};

    std::array<u8, 6> buf{};
    ASSERT_EQ(o.copy_bytes_to({buf.data(), static_cast<u32>(buf.size())}, 2).code, StatusCode::Ok);
    EXPECT_EQ(buf[2], 0x01);
    EXPECT_EQ(buf[5], 0xcc);
    EXPECT_EQ(o.copy_bytes_to({buf.data(), static_cast<u32>(buf.size())}, 3).code, StatusCode::Invalid);

    TraceOptions back{};
    ASSERT_EQ(TraceOptions::from_bytes({buf.data(), static_cast<u32>(buf.size())}, 2, &back).code, StatusCode::Ok);
    EXPECT_EQ(back, o);
}
