/**
 * @file event_stream_test.cpp
 * @brief Unit tests for EventStream and AsyncResult
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "streamkit/core/event_stream.hpp"
#include "streamkit/core/scheduler.hpp"

using namespace streamkit;

class EventStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        loop_ = std::make_shared<RunLoop>();
        config_.scheduler = loop_;
    }

    void TearDown() override {}

    StreamPtr<int> make_stream() {
        return make_event_stream<int>(config_);
    }

    std::shared_ptr<RunLoop> loop_;
    EventStreamConfig config_;
};

TEST_F(EventStreamTest, RequiresScheduler) {
    EXPECT_THROW(make_event_stream<int>(EventStreamConfig{}), ValidationError);
    EXPECT_THROW({ EventStream<int> stream(EventStreamConfig{}); }, ValidationError);
}

TEST_F(EventStreamTest, DeliversValuesInOrderToEveryListener) {
    auto stream = make_stream();
    std::vector<int> first;
    std::vector<int> second;

    stream->subscribe([&](const int& v) { first.push_back(v); });
    stream->subscribe(Observer<int>([&](const int& v) { second.push_back(v); }));

    stream->emit(1);
    stream->emit(2);
    stream->emit(3);

    EXPECT_EQ(first, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(second, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(stream->listener_count(), 2u);
}

TEST_F(EventStreamTest, UnsubscribeStopsDelivery) {
    auto stream = make_stream();
    std::vector<int> received;

    auto unsubscribe = stream->subscribe([&](const int& v) { received.push_back(v); });
    stream->emit(1);
    unsubscribe();
    stream->emit(2);
    unsubscribe();  // idempotent

    EXPECT_EQ(received, (std::vector<int>{1}));
    EXPECT_EQ(stream->listener_count(), 0u);
}

TEST_F(EventStreamTest, ThrowingListenerDoesNotBlockOthers) {
    auto stream = make_stream();
    std::vector<int> received;
    std::vector<std::string> errors;

    stream->subscribe(Observer<int>(
        [](const int&) { throw std::runtime_error("boom"); },
        [&](std::exception_ptr e) { errors.push_back(describe(e)); }));
    stream->subscribe([](const int&) { throw std::runtime_error("unhandled"); });
    stream->subscribe([&](const int& v) { received.push_back(v); });

    stream->emit(7);
    stream->emit(8);

    EXPECT_EQ(received, (std::vector<int>{7, 8}));
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "boom");
}

TEST_F(EventStreamTest, NonStandardCompletionFailureIsContained) {
    auto stream = make_stream();
    bool second_completed = false;
    stream->subscribe(Observer<int>([](const int&) {}, nullptr, [] { throw 42; }));
    stream->subscribe(Observer<int>([](const int&) {}, nullptr, [&] { second_completed = true; }));

    EXPECT_NO_THROW(stream->complete());
    EXPECT_TRUE(second_completed);

    bool late_completed = false;
    stream->subscribe(Observer<int>([](const int&) {}, nullptr, [] { throw 7; }));
    stream->subscribe(Observer<int>([](const int&) {}, nullptr, [&] { late_completed = true; }));
    EXPECT_NO_THROW(loop_->run_pending());
    EXPECT_TRUE(late_completed);
}

TEST_F(EventStreamTest, PendingAsyncFailureIsForwardedToErrorHandler) {
    auto stream = make_stream();
    AsyncPromise promise;
    int errors = 0;

    stream->subscribe(Observer<int>(
        [&](const int&) { return promise.result(); },
        [&](std::exception_ptr) { errors++; }));

    stream->emit(1);
    EXPECT_EQ(errors, 0);

    EXPECT_TRUE(promise.reject(std::make_exception_ptr(std::runtime_error("late"))));
    EXPECT_EQ(errors, 1);
    EXPECT_FALSE(promise.resolve());
}

TEST_F(EventStreamTest, ResolvedAsyncResultReportsNothing) {
    auto stream = make_stream();
    AsyncPromise promise;
    int errors = 0;

    stream->subscribe(Observer<int>(
        [&](const int&) { return promise.result(); },
        [&](std::exception_ptr) { errors++; }));

    stream->emit(1);
    promise.resolve();
    EXPECT_EQ(errors, 0);
}

TEST_F(EventStreamTest, CompleteNotifiesObserversOnceAndClearsListeners) {
    auto stream = make_stream();
    int completions = 0;
    std::vector<int> received;

    stream->subscribe(Observer<int>(
        [&](const int& v) { received.push_back(v); }, nullptr, [&] { completions++; }));

    stream->emit(1);
    stream->complete();
    stream->complete();
    stream->emit(2);

    EXPECT_EQ(completions, 1);
    EXPECT_EQ(received, (std::vector<int>{1}));
    EXPECT_TRUE(stream->is_completed());
    EXPECT_EQ(stream->listener_count(), 0u);
}

TEST_F(EventStreamTest, SubscribeAfterCompleteDefersCompletion) {
    auto stream = make_stream();
    stream->complete();

    int nexts = 0;
    int completions = 0;
    auto unsubscribe = stream->subscribe(Observer<int>(
        [&](const int&) { nexts++; }, nullptr, [&] { completions++; }));

    // never synchronous
    EXPECT_EQ(completions, 0);
    unsubscribe();

    loop_->run_pending();
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(nexts, 0);

    int callbacks = 0;
    stream->subscribe([&](const int&) { callbacks++; });
    loop_->run_pending();
    EXPECT_EQ(callbacks, 0);
}

TEST_F(EventStreamTest, LifecycleFollowsListenerSet) {
    int activations = 0;
    int teardowns = 0;
    config_.lifecycle.activate = [&] { activations++; };
    config_.lifecycle.teardown = [&] { teardowns++; };
    auto stream = make_stream();

    auto a = stream->subscribe([](const int&) {});
    auto b = stream->subscribe([](const int&) {});
    EXPECT_EQ(activations, 1);

    a();
    EXPECT_EQ(teardowns, 0);
    b();
    EXPECT_EQ(teardowns, 1);

    auto c = stream->subscribe([](const int&) {});
    EXPECT_EQ(activations, 2);
    stream->complete();
    EXPECT_EQ(teardowns, 2);
    c();
    EXPECT_EQ(teardowns, 2);
}

TEST_F(EventStreamTest, ListenerMayUnsubscribeDuringEmit) {
    auto stream = make_stream();
    std::vector<int> received;
    Unsubscribe self;

    self = stream->subscribe([&](const int& v) {
        received.push_back(v);
        self();
    });
    int others = 0;
    stream->subscribe([&](const int&) { others++; });

    stream->emit(1);
    stream->emit(2);

    EXPECT_EQ(received, (std::vector<int>{1}));
    EXPECT_EQ(others, 2);
}

TEST_F(EventStreamTest, UnsubscribeOutlivesStream) {
    Unsubscribe unsubscribe;
    {
        auto stream = make_stream();
        unsubscribe = stream->subscribe([](const int&) {});
    }
    unsubscribe();
}
