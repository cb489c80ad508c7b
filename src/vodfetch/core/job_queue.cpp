// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/core/job_queue.hpp>
#include <algorithm>
#include <iterator>

namespace vodfetch::core {

std::expected<JobId, std::error_code> JobQueue::enqueue(Job job) {
    auto lock = std::unique_lock(mutex_);

    auto item_id = job.item_id();
    if (queued_ids_.contains(item_id)) {
        return std::unexpected(make_error_code(QueueErrc::already_queued));
    }

    JobId id = job.id;
    queued_ids_.insert(std::move(item_id));
    jobs_.push_back(std::move(job));
    return id;
}

std::expected<Job, std::error_code> JobQueue::dequeue_front() {
    auto lock = std::unique_lock(mutex_);

    if (jobs_.empty()) {
        return std::unexpected(make_error_code(QueueErrc::queue_empty));
    }

    Job job = std::move(jobs_.front());
    jobs_.pop_front();
    queued_ids_.erase(job.item_id());
    return job;
}

std::error_code JobQueue::remove(JobId id) {
    auto lock = std::unique_lock(mutex_);

    auto it = std::find_if(jobs_.begin(), jobs_.end(),
        [id](const Job& j) { return j.id == id; });
    if (it == jobs_.end()) {
        return make_error_code(QueueErrc::job_not_found);
    }

    queued_ids_.erase(it->item_id());
    jobs_.erase(it);
    return {};
}

void JobQueue::reorder(const std::vector<JobId>& order) {
    auto lock = std::unique_lock(mutex_);

    std::deque<Job> reordered;
    for (JobId id : order) {
        auto it = std::find_if(jobs_.begin(), jobs_.end(),
            [id](const Job& j) { return j.id == id; });
        if (it == jobs_.end()) {
            continue;  // Unknown or already placed
        }
        reordered.push_back(std::move(*it));
        jobs_.erase(it);
    }

    // Jobs not mentioned keep their relative order after the explicit ones
    std::move(jobs_.begin(), jobs_.end(), std::back_inserter(reordered));
    jobs_ = std::move(reordered);
}

void JobQueue::clear() noexcept {
    auto lock = std::unique_lock(mutex_);
    jobs_.clear();
    queued_ids_.clear();
}

std::vector<Job> JobQueue::list() const {
    auto lock = std::unique_lock(mutex_);
    return {jobs_.begin(), jobs_.end()};
}

std::size_t JobQueue::size() const noexcept {
    auto lock = std::unique_lock(mutex_);
    return jobs_.size();
}

bool JobQueue::empty() const noexcept {
    auto lock = std::unique_lock(mutex_);
    return jobs_.empty();
}

bool JobQueue::contains(std::string_view item_id) const {
    auto lock = std::unique_lock(mutex_);
    return queued_ids_.contains(std::string(item_id));
}

} // namespace vodfetch::core
