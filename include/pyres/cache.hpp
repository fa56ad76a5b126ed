#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pyres {

class CancelToken;

// Concurrent memoizer with at-most-once population per key. A second
// caller asking for a key whose computation is in flight waits for that
// computation instead of starting its own. Values must be copyable.
template <typename K, typename V>
class OnceCache {
public:
    template <typename F>
    V get_or_compute(const K& key, F&& compute) {
        std::shared_future<V> pending;
        std::promise<V> promise;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                ++hits_;
                pending = it->second;
            } else {
                owner = true;
                pending = promise.get_future().share();
                entries_.emplace(key, pending);
            }
        }
        if (owner) {
            ++computations_;
            promise.set_value(compute());
        }
        return pending.get();
    }

    // Finished value for a key, without waiting or computing
    std::optional<V> peek(const K& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end() ||
            it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return std::nullopt;
        }
        return it->second.get();
    }

    bool contains(const K& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        return entries_.count(key) > 0;
    }

    // Drops finished entries whose value matches; returns how many
    template <typename Pred>
    size_t erase_if(Pred&& pred) {
        std::lock_guard<std::mutex> lock(mu_);
        size_t erased = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            bool ready = it->second.wait_for(std::chrono::seconds(0)) ==
                         std::future_status::ready;
            if (ready && pred(it->second.get())) {
                it = entries_.erase(it);
                ++erased;
            } else {
                ++it;
            }
        }
        return erased;
    }

    // In-flight computations still complete for their waiters
    void clear() {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return entries_.size();
    }

    size_t computations() const { return computations_.load(); }
    size_t hits() const { return hits_.load(); }

private:
    mutable std::mutex mu_;
    std::map<K, std::shared_future<V>> entries_;
    std::atomic<size_t> computations_{0};
    std::atomic<size_t> hits_{0};
};

// Fixed set of worker threads draining a FIFO of warm-up tasks. Tasks only
// fill caches; their results are never observed directly.
class PrefetchPool {
public:
    explicit PrefetchPool(size_t workers, const CancelToken* cancel = nullptr);
    ~PrefetchPool();

    PrefetchPool(const PrefetchPool&) = delete;
    PrefetchPool& operator=(const PrefetchPool&) = delete;

    // Dropped silently once the pool is stopping or cancelled
    void submit(std::function<void()> task);

    // Blocks until the queue is empty and no task is running
    void wait_idle();

    // Discards queued tasks; running ones finish
    void drain();

    size_t size() const { return threads_.size(); }

private:
    void worker_loop(size_t id);

    const CancelToken* cancel_;
    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;
    std::mutex mu_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    size_t running_ = 0;
    bool stopping_ = false;
};

} // namespace pyres
