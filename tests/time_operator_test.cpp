/**
 * @file time_operator_test.cpp
 * @brief Unit tests for time-based sequence operators
 *
 * Timings use wide margins: scripted values are tens of milliseconds apart.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/sequence.hpp"
#include "streamkit/operators/batch.hpp"
#include "streamkit/operators/sink.hpp"
#include "streamkit/operators/source.hpp"
#include "streamkit/operators/time.hpp"

using namespace streamkit;

namespace {

/**
 * @brief Emits each value at its offset from the first pull, then ends
 *        `end_after` past the first pull
 */
class ScriptedSequence : public Sequence<int> {
public:
    ScriptedSequence(std::vector<std::pair<Millis, int>> script, Millis end_after)
        : script_(std::move(script))
        , end_after_(end_after) {}

    Step<int> pull(Timestamp deadline) override {
        if (!started_) {
            started_ = true;
            start_ = Clock::now();
        }
        auto due = index_ < script_.size() ? start_ + script_[index_].first : start_ + end_after_;
        if (Clock::now() < due) {
            std::this_thread::sleep_until(std::min(deadline, due));
            if (Clock::now() < due) {
                return Step<int>::timeout();
            }
        }
        if (index_ < script_.size()) {
            return Step<int>::of(script_[index_++].second);
        }
        return Step<int>::done();
    }

private:
    std::vector<std::pair<Millis, int>> script_;
    Millis end_after_;
    Timestamp start_{};
    std::size_t index_{0};
    bool started_{false};
};

SequencePtr<int> scripted(std::vector<std::pair<Millis, int>> script, Millis end_after) {
    return std::make_unique<ScriptedSequence>(std::move(script), end_after);
}

} // namespace

class TimeOperatorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TimeOperatorTest, DebounceKeepsLastOfEachBurst) {
    auto source = scripted({{Millis(0), 1}, {Millis(5), 2}, {Millis(10), 3},
                            {Millis(150), 4}, {Millis(155), 5}},
                           Millis(300));

    auto result = seq::to_vector(pipe(std::move(source), seq::debounce_time(Millis(60))));
    EXPECT_EQ(result, (std::vector<int>{3, 5}));
}

TEST_F(TimeOperatorTest, DebounceFlushesPendingOnCompletion) {
    auto source = scripted({{Millis(0), 1}, {Millis(5), 2}}, Millis(10));

    auto result = seq::to_vector(pipe(std::move(source), seq::debounce_time(Millis(500))));
    EXPECT_EQ(result, (std::vector<int>{2}));
}

TEST_F(TimeOperatorTest, DebounceHonoursCallerDeadline) {
    auto debounced = pipe(scripted({{Millis(0), 1}}, Millis(1000)), seq::debounce_time(Millis(200)));

    auto step = debounced->pull(deadline_after(Millis(20)));
    EXPECT_TRUE(step.is_timeout());

    auto value = debounced->next();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 1);
}

TEST_F(TimeOperatorTest, ThrottleLeadingAndTrailing) {
    auto source = scripted({{Millis(0), 1}, {Millis(10), 2}, {Millis(20), 3},
                            {Millis(300), 4}},
                           Millis(400));

    auto result = seq::to_vector(pipe(std::move(source), seq::throttle_time(Millis(100))));
    EXPECT_EQ(result, (std::vector<int>{1, 3, 4}));
}

TEST_F(TimeOperatorTest, ThrottleWithoutTrailingDropsSuppressedValues) {
    auto source = scripted({{Millis(0), 1}, {Millis(10), 2}, {Millis(20), 3},
                            {Millis(300), 4}},
                           Millis(400));

    seq::ThrottleOptions options;
    options.trailing = false;
    auto result = seq::to_vector(pipe(std::move(source), seq::throttle_time(Millis(100), options)));
    EXPECT_EQ(result, (std::vector<int>{1, 4}));
}

TEST_F(TimeOperatorTest, ThrottleWithoutLeadingEmitsAtWindowClose) {
    auto source = scripted({{Millis(0), 1}, {Millis(10), 2}}, Millis(400));

    seq::ThrottleOptions options;
    options.leading = false;
    auto result = seq::to_vector(pipe(std::move(source), seq::throttle_time(Millis(100), options)));
    EXPECT_EQ(result, (std::vector<int>{2}));
}

TEST_F(TimeOperatorTest, TimeoutFailsWhenSourceStalls) {
    auto source = scripted({{Millis(0), 1}, {Millis(500), 2}}, Millis(600));
    auto guarded = pipe(std::move(source), seq::timeout(Millis(50)));

    auto first = guarded->next();
    ASSERT_TRUE(first.has_value());

    try {
        guarded->next();
        FAIL() << "expected OperatorTimeoutError";
    } catch (const OperatorTimeoutError& e) {
        EXPECT_EQ(std::string(e.what()), "Operation timed out after 50ms");
        EXPECT_EQ(e.code(), ErrorCode::OperatorTimeout);
    }
}

TEST_F(TimeOperatorTest, TimeoutUsesCustomMessage) {
    seq::TimeoutOptions options;
    options.message = "no heartbeat";
    auto guarded = pipe(scripted({}, Millis(500)), seq::timeout(Millis(20), options));

    EXPECT_THROW({
        try {
            guarded->next();
        } catch (const OperatorTimeoutError& e) {
            EXPECT_EQ(std::string(e.what()), "no heartbeat");
            throw;
        }
    }, OperatorTimeoutError);
}

TEST_F(TimeOperatorTest, TimeoutPassesFastSources) {
    auto result = seq::to_vector(pipe(seq::from_values<int>({1, 2, 3}), seq::timeout(Millis(100))));
    EXPECT_EQ(result, (std::vector<int>{1, 2, 3}));
}

TEST_F(TimeOperatorTest, BatchFlushesOnTimeout) {
    auto source = scripted({{Millis(0), 1}, {Millis(5), 2}, {Millis(200), 3}}, Millis(210));

    seq::BatchOptions options;
    options.timeout = Millis(50);
    auto result = seq::to_vector(pipe(std::move(source), seq::batch(10, options)));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], (std::vector<int>{1, 2}));
    EXPECT_EQ(result[1], (std::vector<int>{3}));
}

TEST_F(TimeOperatorTest, BatchAbortsOnCancellation) {
    CancellationSource cancel;
    seq::BatchOptions options;
    options.token = cancel.token();
    auto batched = pipe(scripted({{Millis(0), 1}}, Millis(5000)), seq::batch(10, options));

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(Millis(30));
        cancel.cancel();
    });
    EXPECT_THROW(batched->next(), OperationAbortedError);
    canceller.join();
}

TEST_F(TimeOperatorTest, DebounceAbortsOnCancellation) {
    CancellationSource cancel;
    auto debounced = pipe(scripted({}, Millis(5000)), seq::debounce_time(Millis(10), cancel.token()));

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(Millis(30));
        cancel.cancel();
    });
    EXPECT_THROW(debounced->next(), OperationAbortedError);
    canceller.join();
}

TEST_F(TimeOperatorTest, NegativeDurationsAreRejected) {
    EXPECT_THROW(seq::debounce_time(Millis(-1)), ValidationError);
    EXPECT_THROW(seq::throttle_time(Millis(-1)), ValidationError);
    EXPECT_THROW(seq::timeout(Millis(-5)), ValidationError);

    seq::BatchOptions options;
    options.timeout = Millis(-1);
    EXPECT_THROW(options.validate(), ValidationError);
    EXPECT_THROW(seq::batch(3, options), ValidationError);
}

TEST_F(TimeOperatorTest, ThrottleWithNoEmissionEdgeIsRejected) {
    seq::ThrottleOptions options;
    options.leading = false;
    options.trailing = false;
    EXPECT_THROW(options.validate(), ValidationError);
    EXPECT_THROW(seq::throttle_time(Millis(10), options), ValidationError);

    options.trailing = true;
    EXPECT_NO_THROW(options.validate());
}
