/**
 * @file sequence_operator_test.cpp
 * @brief Unit tests for pull-model sequence operators, sources and sinks
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/event_stream.hpp"
#include "streamkit/core/queue.hpp"
#include "streamkit/core/scheduler.hpp"
#include "streamkit/core/sequence.hpp"
#include "streamkit/operators/batch.hpp"
#include "streamkit/operators/combine.hpp"
#include "streamkit/operators/pump.hpp"
#include "streamkit/operators/retry.hpp"
#include "streamkit/operators/sink.hpp"
#include "streamkit/operators/source.hpp"
#include "streamkit/operators/transform.hpp"

using namespace streamkit;

namespace {

/**
 * @brief Yields `values`, then throws `message`
 */
SequencePtr<int> failing_after(std::vector<int> values, std::string message) {
    auto index = std::make_shared<std::size_t>(0);
    return seq::from_generator<int>([values, message, index]() -> std::optional<int> {
        if (*index < values.size()) {
            return values[(*index)++];
        }
        throw std::runtime_error(message);
    });
}

seq::RetryOptions no_backoff(std::uint32_t attempts) {
    seq::RetryOptions options;
    options.max_attempts = attempts;
    options.backoff = [](std::uint32_t) { return Millis(0); };
    return options;
}

} // namespace

class SequenceOperatorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(SequenceOperatorTest, MapFilterTakeSkip) {
    auto result = seq::to_vector(pipe(
        seq::from_values<int>({1, 2, 3, 4, 5, 6, 7, 8}),
        seq::skip(1),
        seq::filter([](const int& v) { return v % 2 == 0; }),
        seq::map([](const int& v) { return v * v; }),
        seq::take(2)));

    EXPECT_EQ(result, (std::vector<int>{4, 16}));
}

TEST_F(SequenceOperatorTest, TakeDoesNotPullPastCount) {
    int produced = 0;
    auto source = seq::from_generator<int>([&produced]() -> std::optional<int> {
        return ++produced;
    });

    auto result = seq::to_vector(pipe(std::move(source), seq::take(3)));
    EXPECT_EQ(result, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(produced, 3);
}

TEST_F(SequenceOperatorTest, ScanEmitsRunningAccumulation) {
    auto result = seq::to_vector(pipe(
        seq::from_values<int>({1, 2, 3, 4}),
        seq::scan([](const int& acc, const int& v) { return acc + v; }, 0)));

    EXPECT_EQ(result, (std::vector<int>{1, 3, 6, 10}));
}

TEST_F(SequenceOperatorTest, DistinctUntilChangedDropsRepeats) {
    auto result = seq::to_vector(pipe(
        seq::from_values<int>({1, 1, 2, 2, 2, 1, 3, 3}),
        seq::distinct_until_changed()));

    EXPECT_EQ(result, (std::vector<int>{1, 2, 1, 3}));
}

TEST_F(SequenceOperatorTest, BatchBySize) {
    auto result = seq::to_vector(pipe(seq::from_values<int>({1, 2, 3, 4, 5}), seq::batch(3)));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(result[1], (std::vector<int>{4, 5}));
}

TEST_F(SequenceOperatorTest, BatchFailureCarriesBufferedItems) {
    auto batched = pipe(failing_after({1, 2, 3, 4}, "source broke"), seq::batch(3));

    auto first = batched->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, (std::vector<int>{1, 2, 3}));

    try {
        batched->next();
        FAIL() << "expected BatchFailure";
    } catch (const BatchFailure<int>& e) {
        EXPECT_EQ(e.batch(), (std::vector<int>{4}));
        EXPECT_EQ(e.pending(), 1u);
        EXPECT_EQ(e.code(), ErrorCode::BatchOperation);
        EXPECT_EQ(describe(e.cause()), "source broke");
    }
}

TEST_F(SequenceOperatorTest, BufferGroupsBySize) {
    auto result = seq::to_vector(pipe(seq::from_values<int>({1, 2, 3, 4, 5}), seq::buffer(2)));

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[2], (std::vector<int>{5}));
}

TEST_F(SequenceOperatorTest, WindowEmitsOnlyCompleteWindows) {
    auto result = seq::to_vector(pipe(seq::from_values<int>({1, 2, 3, 4}), seq::window(3, 1)));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(result[1], (std::vector<int>{2, 3, 4}));
}

TEST_F(SequenceOperatorTest, WindowWithSlideEqualToSize) {
    auto result = seq::to_vector(pipe(seq::from_values<int>({1, 2, 3, 4, 5, 6, 7}), seq::window(2, 2)));

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[2], (std::vector<int>{5, 6}));
}

TEST_F(SequenceOperatorTest, WindowWithSlideLargerThanSizeSkipsValues) {
    auto result = seq::to_vector(pipe(seq::from_values<int>({1, 2, 3, 4, 5, 6, 7}), seq::window(2, 3)));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], (std::vector<int>{1, 2}));
    EXPECT_EQ(result[1], (std::vector<int>{4, 5}));
}

TEST_F(SequenceOperatorTest, InvalidArgumentsThrow) {
    EXPECT_THROW(seq::window(0, 1), ValidationError);
    EXPECT_THROW(seq::window(3, 0), ValidationError);
    EXPECT_THROW(seq::batch(0), ValidationError);
    EXPECT_THROW(seq::buffer(0), ValidationError);
    EXPECT_THROW(seq::retry(no_backoff(0)), ValidationError);
    EXPECT_THROW(seq::from_interval(Millis(0)), ValidationError);

    seq::BackoffOptions backoff;
    backoff.jitter = 1.5;
    EXPECT_THROW(seq::retry_with_backoff(3, backoff), ValidationError);
}

TEST_F(SequenceOperatorTest, RetrySucceedsOnThirdAttempt) {
    int attempts = 0;
    SequenceFactory<int> factory = [&attempts]() -> SequencePtr<int> {
        attempts++;
        if (attempts < 3) {
            return failing_after({}, "attempt " + std::to_string(attempts) + " failed");
        }
        return seq::from_values<int>({1, 2, 3});
    };

    auto retried = seq::retry(no_backoff(3))(factory);
    EXPECT_EQ(seq::to_vector(std::move(retried)), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(attempts, 3);
}

TEST_F(SequenceOperatorTest, RetryExhaustedCarriesAttemptsAndLastError) {
    int attempts = 0;
    SequenceFactory<int> factory = [&attempts]() -> SequencePtr<int> {
        attempts++;
        return failing_after({}, "always fails");
    };

    try {
        seq::to_vector(seq::retry(no_backoff(3))(factory));
        FAIL() << "expected RetryExhaustedError";
    } catch (const RetryExhaustedError& e) {
        EXPECT_EQ(e.attempts(), 3u);
        EXPECT_EQ(describe(e.last_error()), "always fails");
        EXPECT_EQ(std::string(e.what()), "Failed after 3 attempts: always fails");
    }
    EXPECT_EQ(attempts, 3);
}

TEST_F(SequenceOperatorTest, RetryIfRejectsNonRetryableErrors) {
    int attempts = 0;
    SequenceFactory<int> factory = [&attempts]() -> SequencePtr<int> {
        attempts++;
        return failing_after({}, "fatal");
    };

    auto options = no_backoff(5);
    options.retry_if = [](const std::exception_ptr& error) { return describe(error) != "fatal"; };

    EXPECT_THROW(seq::to_vector(seq::retry(options)(factory)), RetryExhaustedError);
    EXPECT_EQ(attempts, 1);
}

TEST_F(SequenceOperatorTest, RetryWaitsForBackoff) {
    int attempts = 0;
    SequenceFactory<int> factory = [&attempts]() -> SequencePtr<int> {
        attempts++;
        if (attempts == 1) {
            return failing_after({}, "first");
        }
        return seq::from_values<int>({42});
    };

    seq::RetryOptions options;
    options.backoff = [](std::uint32_t) { return Millis(40); };
    auto retried = seq::retry(options)(factory);

    auto step = retried->pull(deadline_after(Millis(5)));
    EXPECT_TRUE(step.is_timeout());
    EXPECT_EQ(attempts, 1);

    auto value = retried->next();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
    EXPECT_EQ(attempts, 2);
}

TEST_F(SequenceOperatorTest, RetryCancelledDuringBackoff) {
    CancellationSource source;
    SequenceFactory<int> factory = []() -> SequencePtr<int> {
        return failing_after({}, "down");
    };

    seq::RetryOptions options;
    options.max_attempts = 10;
    options.backoff = [](std::uint32_t) { return Millis(10000); };
    options.token = source.token();
    auto retried = seq::retry(options)(factory);

    std::thread canceller([&source] {
        std::this_thread::sleep_for(Millis(20));
        source.cancel();
    });
    EXPECT_THROW(retried->next(), RetryExhaustedError);
    canceller.join();
}

TEST_F(SequenceOperatorTest, DefaultBackoffDoublesUpToCap) {
    EXPECT_EQ(seq::default_backoff(1), Millis(1000));
    EXPECT_EQ(seq::default_backoff(2), Millis(2000));
    EXPECT_EQ(seq::default_backoff(5), Millis(16000));
    EXPECT_EQ(seq::default_backoff(6), Millis(30000));
    EXPECT_EQ(seq::default_backoff(40), Millis(30000));
}

TEST_F(SequenceOperatorTest, ExponentialBackoffStaysWithinJitter) {
    auto backoff = seq::exponential_backoff(Millis(100), Millis(1000), 0.1);
    for (int i = 0; i < 20; i++) {
        auto delay = backoff(3);
        EXPECT_GE(delay.count(), 360);
        EXPECT_LE(delay.count(), 440);
    }
    auto capped = seq::exponential_backoff(Millis(100), Millis(1000), 0.0);
    EXPECT_EQ(capped(10), Millis(1000));
}

TEST_F(SequenceOperatorTest, ConcatDrainsInOrder) {
    auto result = seq::to_vector(seq::concat(
        seq::from_values<int>({1, 2}),
        seq::from_values<int>({}),
        seq::from_values<int>({3})));

    EXPECT_EQ(result, (std::vector<int>{1, 2, 3}));
}

TEST_F(SequenceOperatorTest, ZipEndsWithShortestSource) {
    auto result = seq::to_vector(seq::zip(
        seq::from_values<int>({1, 2, 3}),
        seq::from_values<int>({10, 20})));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], (std::vector<int>{1, 10}));
    EXPECT_EQ(result[1], (std::vector<int>{2, 20}));
}

TEST_F(SequenceOperatorTest, MergeDeliversEveryValue) {
    auto result = seq::to_vector(seq::merge(
        seq::from_values<int>({1, 2, 3}),
        seq::from_values<int>({4, 5}),
        seq::from_values<int>({})));

    std::sort(result.begin(), result.end());
    EXPECT_EQ(result, (std::vector<int>{1, 2, 3, 4, 5}));
}

TEST_F(SequenceOperatorTest, MergePreservesPerSourceOrder) {
    std::vector<SequencePtr<int>> sources;
    sources.push_back(seq::from_values<int>({1, 2, 3, 4}));
    sources.push_back(seq::from_values<int>({10, 20, 30, 40}));
    auto result = seq::to_vector(seq::merge(std::move(sources)));

    std::vector<int> low;
    std::vector<int> high;
    for (int v : result) {
        (v < 10 ? low : high).push_back(v);
    }
    EXPECT_EQ(low, (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(high, (std::vector<int>{10, 20, 30, 40}));
}

TEST_F(SequenceOperatorTest, MergePropagatesSourceFailure) {
    auto ticks = pipe(seq::from_interval(Millis(10)),
                      seq::map([](const std::uint64_t& v) { return static_cast<int>(v); }));
    auto merged = seq::merge(failing_after({}, "merge source failed"), std::move(ticks));

    try {
        seq::to_vector(std::move(merged));
        FAIL() << "expected the source failure";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "merge source failed");
    }
}

TEST_F(SequenceOperatorTest, MergeReadsAtMostOneValueAheadPerSource) {
    std::atomic<int> left_calls{0};
    std::atomic<int> right_calls{0};
    auto left = seq::from_generator<int>([&left_calls]() -> std::optional<int> {
        return ++left_calls;
    });
    auto right = seq::from_generator<int>([&right_calls]() -> std::optional<int> {
        return 1000 + ++right_calls;
    });

    auto merged = seq::merge(std::move(left), std::move(right));
    auto first = merged->next();
    ASSERT_TRUE(first.has_value());
    std::this_thread::sleep_for(Millis(100));

    EXPECT_LE(left_calls.load() + right_calls.load(), 3);
}

TEST_F(SequenceOperatorTest, RaceWinnerIsPulledOnlyOnDemand) {
    std::atomic<int> calls{0};
    auto endless = seq::from_generator<int>([&calls]() -> std::optional<int> {
        return ++calls;
    });

    auto raced = seq::race(std::move(endless), seq::from_values<int>({}));
    EXPECT_EQ(raced->next(), std::optional<int>(1));
    EXPECT_EQ(raced->next(), std::optional<int>(2));
    std::this_thread::sleep_for(Millis(50));

    EXPECT_LE(calls.load(), 3);
}

TEST_F(SequenceOperatorTest, RaceForwardsOnlyTheFirstSource) {
    auto slow = pipe(seq::from_interval(Millis(200), std::uint64_t{3}),
                     seq::map([](const std::uint64_t& v) { return static_cast<int>(v) + 100; }));
    auto fast = seq::from_values<int>({1, 2, 3});

    auto result = seq::to_vector(seq::race(std::move(slow), std::move(fast)));
    EXPECT_EQ(result, (std::vector<int>{1, 2, 3}));
}

TEST_F(SequenceOperatorTest, RaceIgnoresSourcesThatEndEmpty) {
    auto result = seq::to_vector(seq::race(
        seq::from_values<int>({}),
        seq::from_values<int>({7, 8})));

    EXPECT_EQ(result, (std::vector<int>{7, 8}));
}

TEST_F(SequenceOperatorTest, FirstAndForEach) {
    EXPECT_EQ(seq::first(seq::from_values<int>({5, 6})), std::optional<int>(5));
    EXPECT_EQ(seq::first(seq::from_values<int>({})), std::nullopt);

    int sum = 0;
    auto consumed = seq::for_each(seq::from_values<int>({1, 2, 3}), [&sum](const int& v) { sum += v; });
    EXPECT_EQ(consumed, 3u);
    EXPECT_EQ(sum, 6);
}

TEST_F(SequenceOperatorTest, FromIntervalHonoursCount) {
    auto result = seq::to_vector(seq::from_interval(Millis(2), std::uint64_t{4}));
    EXPECT_EQ(result, (std::vector<std::uint64_t>{0, 1, 2, 3}));
}

TEST_F(SequenceOperatorTest, FromIntervalAbortsOnCancellation) {
    CancellationSource source;
    auto interval = seq::from_interval(Millis(10000), std::nullopt, source.token());

    std::thread canceller([&source] {
        std::this_thread::sleep_for(Millis(20));
        source.cancel();
    });
    EXPECT_THROW(interval->next(), OperationAbortedError);
    canceller.join();
}

TEST_F(SequenceOperatorTest, FromQueueDrainsThenEnds) {
    auto queue = std::make_shared<BackpressureQueue<int>>();
    queue->enqueue(1);
    queue->enqueue(2);
    queue->end();

    EXPECT_EQ(seq::to_vector(seq::from_queue(queue)), (std::vector<int>{1, 2}));
}

TEST_F(SequenceOperatorTest, FromStreamBridgesPushToPull) {
    auto loop = std::make_shared<RunLoop>();
    EventStreamConfig config;
    config.scheduler = loop;
    auto stream = make_event_stream<int>(config);

    auto sequence = seq::from_stream(stream);
    EXPECT_EQ(stream->listener_count(), 1u);

    stream->emit(1);
    stream->emit(2);
    stream->complete();

    EXPECT_EQ(seq::to_vector(std::move(sequence)), (std::vector<int>{1, 2}));
}

TEST_F(SequenceOperatorTest, FromStreamUnsubscribesOnCancellation) {
    auto loop = std::make_shared<RunLoop>();
    EventStreamConfig config;
    config.scheduler = loop;
    auto stream = make_event_stream<int>(config);

    CancellationSource cancel;
    QueueOptions options;
    options.token = cancel.token();
    auto sequence = seq::from_stream(stream, options);
    stream->emit(1);

    cancel.cancel();
    EXPECT_EQ(stream->listener_count(), 0u);
    EXPECT_THROW(sequence->next(), OperationAbortedError);

    cancel.cancel();
    stream->emit(2);
}

TEST_F(SequenceOperatorTest, FromStreamDestructorUnsubscribes) {
    auto loop = std::make_shared<RunLoop>();
    EventStreamConfig config;
    config.scheduler = loop;
    auto stream = make_event_stream<int>(config);

    {
        auto sequence = seq::from_stream(stream);
        EXPECT_EQ(stream->listener_count(), 1u);
    }
    EXPECT_EQ(stream->listener_count(), 0u);
}

TEST_F(SequenceOperatorTest, WithQueueDropsOldWhenConsumerLags) {
    QueueOptions options;
    options.limit = 2;
    options.overflow = OverflowPolicy::DropOld;

    std::atomic<bool> produced_all{false};
    auto values = std::make_shared<int>(0);
    auto source = seq::from_generator<int>([values, &produced_all]() -> std::optional<int> {
        if (*values == 10) {
            produced_all = true;
            return std::nullopt;
        }
        return ++*values;
    });

    auto queued = pipe(std::move(source), seq::with_queue(options));
    auto first = queued->next();
    ASSERT_TRUE(first.has_value());

    // let the pump run ahead of the consumer
    while (!produced_all) {
        std::this_thread::sleep_for(Millis(1));
    }
    std::this_thread::sleep_for(Millis(20));

    auto rest = seq::to_vector(std::move(queued));
    ASSERT_LE(rest.size(), 2u);
    ASSERT_FALSE(rest.empty());
    EXPECT_EQ(rest.back(), 10);
}
