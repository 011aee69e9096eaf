/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for streamkit
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <thread>
#include <vector>

#include "streamkit/streamkit.hpp"

using namespace streamkit;

static void BM_QueueHandOffLatency(benchmark::State& state) {
    for (auto _ : state) {
        state.PauseTiming();
        BackpressureQueue<Timestamp> queue;
        Timestamp received{};
        std::thread consumer([&] {
            if (auto value = queue.next()) {
                received = Clock::now();
                benchmark::DoNotOptimize(*value);
            }
        });
        while (queue.waiting() == 0) {
            std::this_thread::yield();
        }
        state.ResumeTiming();

        auto sent = Clock::now();
        queue.enqueue(sent);
        consumer.join();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(received - sent);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_QueueHandOffLatency)->UseManualTime();

static void BM_StreamToSequenceLatency(benchmark::State& state) {
    const int count = static_cast<int>(state.range(0));
    EventStreamConfig config;
    config.scheduler = std::make_shared<RunLoop>();

    for (auto _ : state) {
        state.PauseTiming();
        auto source = make_event_stream<int>(config);
        auto values = seq::from_stream(source);
        state.ResumeTiming();

        auto start = std::chrono::high_resolution_clock::now();
        std::thread producer([&] {
            for (int i = 0; i < count; i++) {
                source->emit(i);
            }
            source->complete();
        });
        auto consumed = seq::for_each(std::move(values), [](const int& v) {
            benchmark::DoNotOptimize(v);
        });
        producer.join();
        auto end = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(consumed);

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_StreamToSequenceLatency)->Arg(100)->Arg(1000)->UseManualTime();

static void BM_PipelineDepthLatency(benchmark::State& state) {
    const int depth = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto values = seq::from_values<int>(std::vector<int>(100, 1));
        for (int i = 0; i < depth; i++) {
            values = pipe(std::move(values), seq::map([](const int& v) { return v + 1; }));
        }

        auto start = std::chrono::high_resolution_clock::now();
        auto result = seq::to_vector(std::move(values));
        auto end = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(result);

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_PipelineDepthLatency)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseManualTime();

static void BM_WorkerPoolRoundTrip(benchmark::State& state) {
    logging::set_level(spdlog::level::warn);
    WorkerPoolConfig config;
    config.min_workers = static_cast<std::uint32_t>(state.range(0));
    config.max_workers = static_cast<std::uint32_t>(state.range(0));

    WorkerPool<int, int> pool([] { return [](int x) { return x + 1; }; }, config);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        auto result = pool.execute(1).get();
        auto end = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(result);

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_WorkerPoolRoundTrip)->Arg(1)->Arg(4)->UseManualTime();

BENCHMARK_MAIN();
