#include <pyres/cache.hpp>
#include <pyres/cancel.hpp>
#include <pyres/log.hpp>

namespace pyres {

PrefetchPool::PrefetchPool(size_t workers, const CancelToken* cancel)
    : cancel_(cancel) {
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads_.emplace_back([this, i] { worker_loop(i); });
    }
}

PrefetchPool::~PrefetchPool() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
        queue_.clear();
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void PrefetchPool::submit(std::function<void()> task) {
    if (threads_.empty()) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_ || (cancel_ && cancel_->is_cancelled())) return;
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
}

void PrefetchPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mu_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void PrefetchPool::drain() {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.clear();
    if (running_ == 0) idle_cv_.notify_all();
}

void PrefetchPool::worker_loop(size_t id) {
    log::set_thread_tag("prefetch-" + std::to_string(id));
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        if (!cancel_ || !cancel_->is_cancelled()) task();

        {
            std::lock_guard<std::mutex> lock(mu_);
            --running_;
            if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
        }
    }
}

} // namespace pyres
