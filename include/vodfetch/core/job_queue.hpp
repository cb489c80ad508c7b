// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/error.hpp>
#include <vodfetch/core/job.hpp>
#include <cstddef>
#include <deque>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace vodfetch::core {

// FIFO of pending jobs with an item id membership index.
// All operations are serialized by an internal mutex.
class JobQueue {
public:
    JobQueue() = default;

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // Append a job; fails with already_queued if its item id is present
    [[nodiscard]] std::expected<JobId, std::error_code> enqueue(Job job);

    // Remove and return the head. The item id is released in the same
    // critical section, so the item may be queued again right away.
    [[nodiscard]] std::expected<Job, std::error_code> dequeue_front();

    // Remove a job regardless of position
    [[nodiscard]] std::error_code remove(JobId id);

    // Put the named jobs first in the given order; the others follow in
    // their previous relative order. Unknown ids are ignored.
    void reorder(const std::vector<JobId>& order);

    void clear() noexcept;

    [[nodiscard]] std::vector<Job> list() const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] bool contains(std::string_view item_id) const;

private:
    std::deque<Job> jobs_;
    std::unordered_set<std::string> queued_ids_;
    mutable std::mutex mutex_;
};

} // namespace vodfetch::core
