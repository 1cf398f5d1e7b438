/**
 * @file job_store.hpp
 * @brief Process-scoped table of split jobs.
 */

#ifndef TOCSPLIT_JOB_STORE_HPP
#define TOCSPLIT_JOB_STORE_HPP

#include "split_job.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tocsplit {

/**
 * @brief Thread-safe map from job id to SplitJob.
 *
 * @details Created by the embedding application and handed to the
 * engine by reference; it outlives every engine that writes to it.
 * Entries are never evicted. Readers always receive copies, so a
 * snapshot stays consistent while the worker keeps writing.
 */
class JobStore {
public:
    JobStore() = default;
    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /**
     * @brief Adds a new job.
     * @throws std::invalid_argument if the id is empty or already present.
     */
    void insert(SplitJob job);

    /**
     * @brief Returns a copy of the job.
     * @throws JobNotFound if the id is unknown.
     */
    [[nodiscard]] SplitJob get(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const;

    /**
     * @brief Applies fn to the stored job under the store lock and bumps updated_at.
     *
     * @throws JobNotFound if the id is unknown.
     * @throws std::logic_error if the job is already Completed or Failed.
     */
    void update(const std::string& id, const std::function<void(SplitJob&)>& fn);

    [[nodiscard]] std::size_t size() const;

    /// Ids in creation order.
    [[nodiscard]] std::vector<std::string> ids() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, SplitJob> jobs_;
    std::vector<std::string> order_;
};

} // namespace tocsplit

#endif // TOCSPLIT_JOB_STORE_HPP
