#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct WindowItem {
    std::string job_id;
    int tier{0};
};

struct WindowSnapshot {
    std::vector<WindowItem> queued;
    std::vector<WindowItem> inflight;
};

// Work list of one processing window. Workers pull until it is empty.
class WindowQueue {
public:
    void enqueue(WindowItem item);
    std::optional<WindowItem> dequeue();
    void complete(const std::string& job_id);
    // Drops everything not yet handed to a worker; in-flight items are kept.
    std::size_t cancel_queued();
    WindowSnapshot snapshot();

private:
    std::mutex mtx_;
    std::deque<WindowItem> queued_;
    std::unordered_map<std::string, WindowItem> inflight_;
};
