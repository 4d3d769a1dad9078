#include <array>
#include <cstddef>

#include <benchmark/benchmark.h>

#include "tracectx/net/base16.hpp"

static void BM_Base16Encode(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::array<tracectx::core::u8, 256> buf{};
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<tracectx::core::u8>(i & 0xffu);
    }
    std::array<char, 2 * 256 + 1> text{};

    for (auto _ : state){
        tracectx::core::u32 written = 0;
        tracectx::core::Status s = tracectx::net::base16_encode({buf.data(), static_cast<tracectx::core::u32>(n)},
            {text.data(), static_cast<tracectx::core::u32>(text.size())}, &written);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(written);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_Base16Encode)->Arg(0)->Arg(16)->Arg(32)->Arg(256);

static void BM_Base16Decode(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::array<char, 2 * 256> text{};
    for (size_t i = 0; i < text.size(); ++i){
        text[i] = "0123456789ABCDEF"[i & 0xfu];
    }
    std::array<tracectx::core::u8, 256> buf{};

    for (auto _ : state){
        tracectx::core::u32 written = 0;
        tracectx::core::Status s = tracectx::net::base16_decode({text.data(), static_cast<tracectx::core::u32>(2 * n)},
            {buf.data(), static_cast<tracectx::core::u32>(buf.size())}, &written);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(buf);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_Base16Decode)->Arg(0)->Arg(16)->Arg(32)->Arg(256);
