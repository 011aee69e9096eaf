#pragma once

/**
 * @file metrics.hpp
 * @brief Counters, gauges, histograms and component statistics snapshots
 */

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace streamkit {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        value_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void set(std::int64_t value) noexcept {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

/**
 * @brief Bucketed histogram, values in milliseconds
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> buckets = default_buckets())
        : buckets_(std::move(buckets))
        , counts_(buckets_.size() + 1, 0) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;
        if (value > max_) {
            max_ = value;
        }

        for (std::size_t i = 0; i < buckets_.size(); i++) {
            if (value <= buckets_[i]) {
                counts_[i]++;
                return;
            }
        }
        counts_.back()++;  // +Inf bucket
    }

    [[nodiscard]] std::uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    [[nodiscard]] double max() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_;
    }

    /**
     * @brief Per-bucket counts; the last entry is the +Inf bucket
     */
    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_;
    }

    static std::vector<double> default_buckets() {
        return {1.0, 5.0, 10.0, 25.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 5000.0};
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> buckets_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    double max_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief BackpressureQueue snapshot
 */
struct QueueStats {
    std::uint64_t enqueued{0};
    std::uint64_t dequeued{0};
    std::uint64_t dropped{0};
    std::uint64_t handed_off{0};    // delivered straight to a waiting consumer
    std::size_t high_watermark{0};
    std::size_t current_size{0};
    std::size_t limit{0};           // 0 = unbounded
};

/**
 * @brief WorkerPool snapshot
 */
struct PoolStats {
    std::size_t total_workers{0};
    std::size_t idle_workers{0};
    std::size_t busy_workers{0};
    std::size_t terminating_workers{0};
    std::size_t terminated_workers{0};
    std::size_t queued_tasks{0};
};

/**
 * @brief Running totals kept by a WorkerPool
 */
class PoolMetrics {
public:
    Counter& submitted() { return submitted_; }
    Counter& completed() { return completed_; }
    Counter& failed() { return failed_; }
    Counter& rejected() { return rejected_; }
    Counter& workers_created() { return workers_created_; }
    Counter& workers_replaced() { return workers_replaced_; }
    Counter& workers_reaped() { return workers_reaped_; }
    Histogram& queue_wait_ms() { return queue_wait_ms_; }
    Gauge& live_workers() { return live_workers_; }
    Gauge& busy_workers() { return busy_workers_; }

    [[nodiscard]] const Counter& submitted() const { return submitted_; }
    [[nodiscard]] const Counter& completed() const { return completed_; }
    [[nodiscard]] const Counter& failed() const { return failed_; }
    [[nodiscard]] const Counter& rejected() const { return rejected_; }
    [[nodiscard]] const Counter& workers_created() const { return workers_created_; }
    [[nodiscard]] const Counter& workers_replaced() const { return workers_replaced_; }
    [[nodiscard]] const Counter& workers_reaped() const { return workers_reaped_; }
    [[nodiscard]] const Histogram& queue_wait_ms() const { return queue_wait_ms_; }
    [[nodiscard]] const Gauge& live_workers() const { return live_workers_; }
    [[nodiscard]] const Gauge& busy_workers() const { return busy_workers_; }

    /**
     * @brief One-line human readable summary
     */
    [[nodiscard]] std::string format() const {
        std::ostringstream oss;
        oss << "submitted=" << submitted_.value()
            << " completed=" << completed_.value()
            << " failed=" << failed_.value()
            << " rejected=" << rejected_.value()
            << " created=" << workers_created_.value()
            << " replaced=" << workers_replaced_.value()
            << " reaped=" << workers_reaped_.value()
            << " live=" << live_workers_.value()
            << " busy=" << busy_workers_.value()
            << " queue_wait_avg_ms=" << std::fixed << std::setprecision(2)
            << queue_wait_ms_.mean();
        return oss.str();
    }

private:
    Counter submitted_;
    Counter completed_;
    Counter failed_;
    Counter rejected_;
    Counter workers_created_;
    Counter workers_replaced_;
    Counter workers_reaped_;
    Histogram queue_wait_ms_;
    Gauge live_workers_;
    Gauge busy_workers_;
};

} // namespace streamkit
