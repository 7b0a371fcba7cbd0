#include "filedock/server/job_store.hpp"

#include <mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace filedock::server
{

    namespace
    {
        using protocol::JobState;

        bool record_consistent(const Job &job) noexcept
        {
            if (job.progress < 0 || job.progress > 100)
            {
                return false;
            }
            if ((job.state == JobState::Completed) != (job.progress == 100))
            {
                return false;
            }
            return (job.state == JobState::Failed) == job.error.has_value();
        }
    } // namespace

    bool valid_transition(const Job &before, const Job &after) noexcept
    {
        if (protocol::is_terminal(before.state) || before.id != after.id || !record_consistent(after))
        {
            return false;
        }
        switch (after.state)
        {
        case JobState::Pending:
            return before.state == JobState::Pending;
        case JobState::Running:
            return before.state == JobState::Pending ||
                   (before.state == JobState::Running && after.progress >= before.progress);
        case JobState::Completed:
        case JobState::Failed:
            return before.state == JobState::Running;
        case JobState::Cancelled:
            return true;
        }
        return false;
    }

    void JobStore::insert(Job job)
    {
        if (!record_consistent(job) || job.state != JobState::Pending)
        {
            throw std::invalid_argument("New jobs must be pending");
        }
        std::unique_lock lock(mutex_);
        const auto id = job.id;
        if (!jobs_.emplace(id, std::move(job)).second)
        {
            throw std::invalid_argument("Duplicate job id: " + id);
        }
        order_.push_back(id);
    }

    std::optional<Job> JobStore::get(const std::string &id) const
    {
        std::shared_lock lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<Job> JobStore::list() const
    {
        std::shared_lock lock(mutex_);
        std::vector<Job> result;
        result.reserve(order_.size());
        for (auto it = order_.rbegin(); it != order_.rend(); ++it)
        {
            result.push_back(jobs_.at(*it));
        }
        return result;
    }

    JobMutation JobStore::update(const std::string &id, const Mutator &mutator)
    {
        std::unique_lock lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end())
        {
            return {.found = false, .applied = false, .job = {}};
        }
        if (protocol::is_terminal(it->second.state))
        {
            return {.found = true, .applied = false, .job = it->second};
        }

        Job candidate = it->second;
        if (!mutator(candidate))
        {
            return {.found = true, .applied = false, .job = it->second};
        }
        if (!valid_transition(it->second, candidate))
        {
            spdlog::warn("Rejected job {} transition {} -> {} ({}%)", id, protocol::to_string(it->second.state),
                         protocol::to_string(candidate.state), candidate.progress);
            return {.found = true, .applied = false, .job = it->second};
        }
        it->second = std::move(candidate);
        return {.found = true, .applied = true, .job = it->second};
    }

    std::size_t JobStore::size() const
    {
        std::shared_lock lock(mutex_);
        return jobs_.size();
    }

} // namespace filedock::server
