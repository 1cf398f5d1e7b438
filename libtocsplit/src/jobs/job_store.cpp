#include "job_store.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace tocsplit {

std::string job_status_to_string(const JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::InProgress: return "in_progress";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

void JobStore::insert(SplitJob job) {
    if (job.id.empty()) {
        throw std::invalid_argument("job id must not be empty");
    }
    std::lock_guard lock(mtx_);
    if (jobs_.contains(job.id)) {
        throw std::invalid_argument("duplicate job id: " + job.id);
    }
    if (job.created_at == SplitJob::Clock::time_point{}) {
        job.created_at = SplitJob::Clock::now();
    }
    job.updated_at = job.created_at;
    order_.push_back(job.id);
    const std::string id = job.id;
    jobs_.emplace(id, std::move(job));
}

SplitJob JobStore::get(const std::string& id) const {
    std::lock_guard lock(mtx_);
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw JobNotFound(id);
    }
    return it->second;
}

bool JobStore::contains(const std::string& id) const {
    std::lock_guard lock(mtx_);
    return jobs_.contains(id);
}

void JobStore::update(const std::string& id, const std::function<void(SplitJob&)>& fn) {
    std::lock_guard lock(mtx_);
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw JobNotFound(id);
    }
    SplitJob& job = it->second;
    if (is_terminal(job.status)) {
        throw std::logic_error("job " + id + " is already " + job_status_to_string(job.status));
    }
    fn(job);
    job.id = id;
    job.updated_at = SplitJob::Clock::now();
}

std::size_t JobStore::size() const {
    std::lock_guard lock(mtx_);
    return jobs_.size();
}

std::vector<std::string> JobStore::ids() const {
    std::lock_guard lock(mtx_);
    return order_;
}

} // namespace tocsplit
