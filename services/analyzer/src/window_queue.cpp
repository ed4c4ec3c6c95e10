#include "../include/window_queue.hpp"
#include <utility>

void WindowQueue::enqueue(WindowItem item) {
    std::lock_guard<std::mutex> lock(mtx_);
    queued_.push_back(std::move(item));
}

std::optional<WindowItem> WindowQueue::dequeue() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queued_.empty()) return std::nullopt;
    WindowItem item = queued_.front();
    queued_.pop_front();
    inflight_.emplace(item.job_id, item);
    return item;
}

void WindowQueue::complete(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    inflight_.erase(job_id);
}

std::size_t WindowQueue::cancel_queued() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t removed = queued_.size();
    queued_.clear();
    return removed;
}

WindowSnapshot WindowQueue::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    WindowSnapshot s;
    s.queued.assign(queued_.begin(), queued_.end());
    s.inflight.reserve(inflight_.size());
    for (const auto& kv : inflight_) s.inflight.push_back(kv.second);
    return s;
}
