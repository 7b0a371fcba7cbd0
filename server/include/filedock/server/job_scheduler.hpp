#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "filedock/error_codes.hpp"
#include "filedock/protocol.hpp"
#include "filedock/server/bounded_queue.hpp"
#include "filedock/server/clock.hpp"
#include "filedock/server/filesystem.hpp"
#include "filedock/server/job.hpp"
#include "filedock/server/job_executor.hpp"
#include "filedock/server/job_store.hpp"
#include "filedock/server/mount_table.hpp"

namespace filedock::server
{

    class JobError : public std::runtime_error
    {
    public:
        JobError(filedock::ErrorCode code, std::string message);

        filedock::ErrorCode code() const noexcept { return code_; }

    private:
        filedock::ErrorCode code_;
    };

    struct SchedulerOptions
    {
        std::size_t worker_count{4};
        std::size_t queue_capacity{100};
        std::size_t buffer_size{1024 * 1024};
    };

    enum class CancelResult : std::uint8_t
    {
        Cancelled,
        CancelRequested,
        NotFound,
        NotCancellable
    };

    // Called after every committed state or progress change, from the thread that made it.
    using JobListener = std::function<void(const Job &)>;

    class JobScheduler
    {
    public:
        JobScheduler(Filesystem &filesystem, const MountTable &mounts, const Clock &clock, SchedulerOptions options,
                     JobListener listener);
        ~JobScheduler();

        JobScheduler(const JobScheduler &) = delete;
        JobScheduler &operator=(const JobScheduler &) = delete;

        void start();
        // Requests cancellation of every unfinished job and joins the workers.
        void stop();

        // Validates synchronously and returns the pending record. Throws JobError.
        Job submit(const protocol::CreateJobRequest &request);

        std::optional<Job> get(const std::string &id) const;
        std::vector<Job> list() const;
        CancelResult cancel(const std::string &id);

    private:
        struct QueuedJob
        {
            std::string id;
            protocol::JobType type{};
            ResolvedPath source;
            std::optional<ResolvedPath> destination;
            std::shared_ptr<CancellationFlag> cancelled;
        };

        void worker_loop(std::size_t index);
        void execute(JobExecutor &executor, const QueuedJob &job);
        void report_progress(const std::string &id, int progress);
        void finish(const std::string &id, ExecutionOutcome outcome);
        void fail(const std::string &id, const std::string &cause);
        void publish(const JobMutation &mutation);
        void release(const std::string &id);

        Filesystem &filesystem_;
        const MountTable &mounts_;
        const Clock &clock_;
        SchedulerOptions options_;
        JobListener listener_;

        JobStore store_;
        BoundedQueue<QueuedJob> queue_;

        std::mutex submit_mutex_;
        std::mutex flags_mutex_;
        std::unordered_map<std::string, std::shared_ptr<CancellationFlag>> flags_;

        std::atomic<bool> running_{false};
        std::vector<std::thread> workers_;
    };

} // namespace filedock::server
