/**
 * @file stream_operator_test.cpp
 * @brief Unit tests for push-model stream operators and sources
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "streamkit/core/event_stream.hpp"
#include "streamkit/core/rate_limiter.hpp"
#include "streamkit/core/scheduler.hpp"
#include "streamkit/stream/operators.hpp"
#include "streamkit/stream/sources.hpp"

using namespace streamkit;

namespace {

template<typename T>
struct Recorder {
    std::vector<T> values;
    int completions{0};

    Observer<T> observer() {
        return Observer<T>(
            [this](const T& v) { values.push_back(v); },
            nullptr,
            [this] { completions++; });
    }
};

} // namespace

class StreamOperatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        loop_ = std::make_shared<RunLoop>();
        config_.scheduler = loop_;
    }

    void TearDown() override {}

    std::shared_ptr<RunLoop> loop_;
    EventStreamConfig config_;
};

TEST_F(StreamOperatorTest, MapAndFilterCompose) {
    auto source = make_event_stream<int>(config_);
    auto out = source->pipe(
        stream::filter([](const int& v) { return v % 2 == 0; }),
        stream::map([](const int& v) { return std::to_string(v * 10); }));

    Recorder<std::string> recorder;
    out->subscribe(recorder.observer());

    for (int i = 1; i <= 5; i++) {
        source->emit(i);
    }
    source->complete();

    EXPECT_EQ(recorder.values, (std::vector<std::string>{"20", "40"}));
    EXPECT_EQ(recorder.completions, 1);
}

TEST_F(StreamOperatorTest, DerivedStreamSubscribesUpstreamLazily) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::map([](const int& v) { return v + 1; }));
    EXPECT_EQ(source->listener_count(), 0u);

    auto unsubscribe = out->subscribe([](const int&) {});
    EXPECT_EQ(source->listener_count(), 1u);

    unsubscribe();
    EXPECT_EQ(source->listener_count(), 0u);
}

TEST_F(StreamOperatorTest, TakeCompletesAfterCount) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::take(2));

    Recorder<int> recorder;
    out->subscribe(recorder.observer());
    source->emit(1);
    source->emit(2);
    source->emit(3);

    EXPECT_EQ(recorder.values, (std::vector<int>{1, 2}));
    EXPECT_EQ(recorder.completions, 1);
    EXPECT_EQ(source->listener_count(), 0u);
}

TEST_F(StreamOperatorTest, TakeZeroCompletesOnNextTurn) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::take(0));

    Recorder<int> recorder;
    out->subscribe(recorder.observer());
    EXPECT_EQ(recorder.completions, 0);

    loop_->run_pending();
    EXPECT_EQ(recorder.completions, 1);
}

TEST_F(StreamOperatorTest, SkipDropsLeadingValues) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::skip(2));

    Recorder<int> recorder;
    out->subscribe(recorder.observer());
    for (int i = 1; i <= 4; i++) {
        source->emit(i);
    }
    EXPECT_EQ(recorder.values, (std::vector<int>{3, 4}));
}

TEST_F(StreamOperatorTest, BatchFlushesRemainderOnComplete) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::batch(3));

    Recorder<std::vector<int>> recorder;
    out->subscribe(recorder.observer());
    for (int i = 1; i <= 5; i++) {
        source->emit(i);
    }
    source->complete();

    ASSERT_EQ(recorder.values.size(), 2u);
    EXPECT_EQ(recorder.values[0], (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(recorder.values[1], (std::vector<int>{4, 5}));
    EXPECT_EQ(recorder.completions, 1);
}

TEST_F(StreamOperatorTest, InvalidArgumentsThrow) {
    EXPECT_THROW(stream::batch(0), ValidationError);
    EXPECT_THROW(stream::debounce(Millis(-1)), ValidationError);
    EXPECT_THROW(stream::rate_limit(nullptr), ValidationError);
    EXPECT_THROW(stream::from_interval(config_, Millis(0)), ValidationError);
}

TEST_F(StreamOperatorTest, DebounceEmitsLatestAfterQuietPeriod) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::debounce(Millis(30)));

    Recorder<int> recorder;
    out->subscribe(recorder.observer());
    source->emit(1);
    source->emit(2);
    source->emit(3);

    loop_->run_until([&] { return !recorder.values.empty(); }, Millis(2000));
    EXPECT_EQ(recorder.values, (std::vector<int>{3}));

    source->emit(4);
    source->complete();
    EXPECT_EQ(recorder.values, (std::vector<int>{3, 4}));
    EXPECT_EQ(recorder.completions, 1);
    EXPECT_TRUE(loop_->empty());
}

TEST_F(StreamOperatorTest, DebounceTeardownCancelsTimer) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::debounce(Millis(20)));

    std::vector<int> received;
    auto unsubscribe = out->subscribe([&](const int& v) { received.push_back(v); });
    source->emit(1);
    unsubscribe();

    EXPECT_TRUE(loop_->empty());
    loop_->run_for(Millis(50));
    EXPECT_TRUE(received.empty());
}

TEST_F(StreamOperatorTest, MergeCompletesWhenAllSourcesComplete) {
    auto a = make_event_stream<int>(config_);
    auto b = make_event_stream<int>(config_);
    auto out = pipe(a, stream::merge_with<int>({b}));

    Recorder<int> recorder;
    out->subscribe(recorder.observer());
    a->emit(1);
    b->emit(2);
    a->complete();
    EXPECT_EQ(recorder.completions, 0);
    b->emit(3);
    b->complete();

    EXPECT_EQ(recorder.values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(recorder.completions, 1);
}

TEST_F(StreamOperatorTest, RateLimitDropsDeniedValues) {
    RateLimiterConfig limiter_config;
    limiter_config.capacity = 2;
    limiter_config.refill_rate = 0.001;
    auto limiter = std::make_shared<TokenBucket>(limiter_config);

    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::rate_limit(limiter));

    Recorder<int> recorder;
    out->subscribe(recorder.observer());
    for (int i = 1; i <= 5; i++) {
        source->emit(i);
    }
    EXPECT_EQ(recorder.values, (std::vector<int>{1, 2}));
    EXPECT_EQ(limiter->status().denied, 3u);
}

TEST_F(StreamOperatorTest, OperatorFailureDropsOnlyThatValue) {
    auto source = make_event_stream<int>(config_);
    auto out = pipe(source, stream::map([](const int& v) {
        if (v == 2) {
            throw std::runtime_error("bad value");
        }
        return v;
    }));

    Recorder<int> recorder;
    out->subscribe(recorder.observer());
    source->emit(1);
    source->emit(2);
    source->emit(3);
    EXPECT_EQ(recorder.values, (std::vector<int>{1, 3}));
}

TEST_F(StreamOperatorTest, FromValuesEmitsOnNextTurnThenCompletes) {
    auto stream = stream::from_values<int>(config_, {1, 2, 3});

    Recorder<int> recorder;
    stream->subscribe(recorder.observer());
    EXPECT_TRUE(recorder.values.empty());

    loop_->run_pending();
    EXPECT_EQ(recorder.values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(recorder.completions, 1);
    EXPECT_TRUE(stream->is_completed());
}

TEST_F(StreamOperatorTest, FromIntervalCountsAndCompletes) {
    auto stream = stream::from_interval(config_, Millis(5), std::uint64_t{3});

    Recorder<std::uint64_t> recorder;
    stream->subscribe(recorder.observer());
    ASSERT_TRUE(loop_->run_until([&] { return recorder.completions == 1; }, Millis(2000)));

    EXPECT_EQ(recorder.values, (std::vector<std::uint64_t>{0, 1, 2}));
    EXPECT_TRUE(loop_->empty());
}

TEST_F(StreamOperatorTest, FromIntervalStopsOnTeardown) {
    auto stream = stream::from_interval(config_, Millis(5));

    std::vector<std::uint64_t> received;
    auto unsubscribe = stream->subscribe([&](const std::uint64_t& v) { received.push_back(v); });
    ASSERT_TRUE(loop_->run_until([&] { return received.size() >= 2; }, Millis(2000)));

    unsubscribe();
    EXPECT_TRUE(loop_->empty());
}

TEST_F(StreamOperatorTest, FromEventSourceRegistersWhileActive) {
    stream::EmitFn<std::string> registered;
    int removals = 0;

    auto stream = stream::from_event_source<std::string>(config_, [&](stream::EmitFn<std::string> emit) {
        registered = std::move(emit);
        return Unsubscribe([&] {
            registered = nullptr;
            removals++;
        });
    });
    EXPECT_FALSE(registered);

    std::vector<std::string> received;
    auto unsubscribe = stream->subscribe([&](const std::string& v) { received.push_back(v); });
    ASSERT_TRUE(registered);
    registered("hello");
    registered("world");

    unsubscribe();
    EXPECT_EQ(removals, 1);
    EXPECT_FALSE(registered);
    EXPECT_EQ(received, (std::vector<std::string>{"hello", "world"}));
}
