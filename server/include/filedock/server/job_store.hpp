#pragma once

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "filedock/server/job.hpp"

namespace filedock::server
{

    struct JobMutation
    {
        bool found{};
        bool applied{};
        Job job;
    };

    // Source of truth for job records. Terminal records are immutable and every mutation is checked
    // against the record invariants before it is committed.
    class JobStore
    {
    public:
        using Mutator = std::function<bool(Job &)>;

        void insert(Job job);

        std::optional<Job> get(const std::string &id) const;

        // Newest first.
        std::vector<Job> list() const;

        // The mutator edits a copy and returns false to leave the record untouched.
        JobMutation update(const std::string &id, const Mutator &mutator);

        std::size_t size() const;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, Job> jobs_;
        std::vector<std::string> order_;
    };

    bool valid_transition(const Job &before, const Job &after) noexcept;

} // namespace filedock::server
