#include <benchmark/benchmark.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "tiercache.h"

using namespace tiercache;

#define TIERCACHE_POLICY_BENCH(test, eviction)                                                                        \
    BENCHMARK_TEMPLATE(test, eviction, true)->ArgsProduct({{1, 1000, 10000, 100000}})->Complexity()->UseManualTime(); \
    BENCHMARK_TEMPLATE(test, eviction, false)->ArgsProduct({{1, 1000, 10000, 100000}})->Complexity()->UseManualTime()

#define TIERCACHE_BENCH(test)                          \
    TIERCACHE_POLICY_BENCH(test, policy::EvictionLFU); \
    TIERCACHE_POLICY_BENCH(test, policy::EvictionLRU); \
    TIERCACHE_POLICY_BENCH(test, policy::EvictionFIFO)

template<template<class, class, class> class E, bool ThreadSafe>
using BenchCache = TieredCache<std::string, std::string, E, absl::Hash<std::string>, ThreadSafe>;

// Three tiers, each twice as large as the one above it. The whole key set fits in the last two tiers.
template<class C> std::unique_ptr<C> setup(size_t item_count)
{
    const size_t first_capacity = item_count / 4 + 1;
    auto         cache = std::make_unique<C>(3, std::vector<size_t>{first_capacity, first_capacity * 2, first_capacity * 4});

    for (size_t i = 0; i < item_count; ++i) {
        cache->write(std::to_string(i), "some_value");
    }

    return cache;
}

template<template<class, class, class> class Eviction, bool ThreadSafe> void cache_write(benchmark::State& state)
{
    const size_t previous_insertions = state.range(0);
    auto         cache               = setup<BenchCache<Eviction, ThreadSafe>>(previous_insertions);

    size_t next_key = previous_insertions;
    for (auto _ : state) {
        // A new key every iteration, so every write cascades once the first tier is full.
        const std::string key = std::to_string(next_key++);

        const auto start = std::chrono::high_resolution_clock::now();
        cache->write(key, "some cache value");
        const auto end = std::chrono::high_resolution_clock::now();

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(previous_insertions);
}

TIERCACHE_BENCH(cache_write);

template<template<class, class, class> class Eviction, bool ThreadSafe> void cache_read_first_tier(benchmark::State& state)
{
    const size_t previous_insertions = state.range(0);
    auto         cache               = setup<BenchCache<Eviction, ThreadSafe>>(previous_insertions);

    // The most recent write is always in the first tier.
    const std::string key = std::to_string(previous_insertions - 1);

    for (auto _ : state) {
        const auto start = std::chrono::high_resolution_clock::now();
        auto       value = cache->read(key);
        benchmark::DoNotOptimize(value);
        const auto end = std::chrono::high_resolution_clock::now();

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(previous_insertions);
}

TIERCACHE_BENCH(cache_read_first_tier);

template<template<class, class, class> class Eviction, bool ThreadSafe> void cache_read_miss(benchmark::State& state)
{
    const size_t previous_insertions = state.range(0);
    auto         cache               = setup<BenchCache<Eviction, ThreadSafe>>(previous_insertions);

    // Misses scan every tier.
    const std::string key = "absent";

    for (auto _ : state) {
        const auto start = std::chrono::high_resolution_clock::now();
        auto       value = cache->read(key);
        benchmark::DoNotOptimize(value);
        const auto end = std::chrono::high_resolution_clock::now();

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(previous_insertions);
}

TIERCACHE_BENCH(cache_read_miss);
