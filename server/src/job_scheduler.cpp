#include "filedock/server/job_scheduler.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "filedock/crypto.hpp"

namespace filedock::server
{

    JobError::JobError(filedock::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        using protocol::JobState;
        using protocol::JobType;

        bool is_within(const std::string &candidate, const std::string &parent)
        {
            return candidate == parent || candidate.starts_with(parent + "/");
        }
    } // namespace

    JobScheduler::JobScheduler(Filesystem &filesystem, const MountTable &mounts, const Clock &clock,
                               SchedulerOptions options, JobListener listener)
        : filesystem_(filesystem),
          mounts_(mounts),
          clock_(clock),
          options_(options),
          listener_(std::move(listener)),
          queue_(options.queue_capacity)
    {
        if (options_.worker_count == 0)
        {
            options_.worker_count = 1;
        }
    }

    JobScheduler::~JobScheduler()
    {
        stop();
    }

    void JobScheduler::start()
    {
        if (running_.exchange(true))
        {
            return;
        }
        workers_.reserve(options_.worker_count);
        for (std::size_t i = 0; i < options_.worker_count; ++i)
        {
            workers_.emplace_back(&JobScheduler::worker_loop, this, i);
        }
        spdlog::info("Job scheduler started with {} workers, queue capacity {}", options_.worker_count,
                     queue_.capacity());
    }

    void JobScheduler::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }
        {
            std::lock_guard lock(submit_mutex_);
            queue_.close();
        }
        for (const auto &job : store_.list())
        {
            if (!protocol::is_terminal(job.state))
            {
                cancel(job.id);
            }
        }
        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
        spdlog::info("Job scheduler stopped");
    }

    Job JobScheduler::submit(const protocol::CreateJobRequest &request)
    {
        const auto type = protocol::job_type_from_string(request.type);
        if (!type)
        {
            throw JobError(filedock::ErrorCode::ValidationError,
                           "Invalid job type. Must be 'copy', 'move', or 'delete'");
        }
        if (request.source_path.empty())
        {
            throw JobError(filedock::ErrorCode::ValidationError, "Source path is required");
        }
        if (*type != JobType::Delete && (!request.dest_path || request.dest_path->empty()))
        {
            throw JobError(filedock::ErrorCode::ValidationError,
                           "Destination path is required for copy and move jobs");
        }

        ResolvedPath source;
        std::optional<ResolvedPath> destination;
        try
        {
            source = mounts_.resolve(request.source_path, *type == JobType::Copy ? Access::Read : Access::Write);
            if (*type != JobType::Delete)
            {
                destination = mounts_.resolve(*request.dest_path, Access::Write);
            }
        }
        catch (const FilesystemError &ex)
        {
            throw JobError(ex.code(), ex.what());
        }

        if (*type != JobType::Copy && source.is_mount_root)
        {
            throw JobError(filedock::ErrorCode::ValidationError, "Cannot move or delete a mount point root");
        }
        if (destination)
        {
            if (destination->is_mount_root)
            {
                throw JobError(filedock::ErrorCode::ValidationError, "Destination must be inside a mount point");
            }
            if (destination->mount == source.mount && is_within(destination->virtual_path, source.virtual_path))
            {
                throw JobError(filedock::ErrorCode::ValidationError, "Destination cannot be inside the source");
            }
        }

        if (!running_.load())
        {
            throw JobError(filedock::ErrorCode::InternalError, "Job scheduler is not running");
        }

        Job job{};
        job.id = crypto::random_id();
        job.type = *type;
        job.state = JobState::Pending;
        job.source_path = source.virtual_path;
        if (destination)
        {
            job.dest_path = destination->virtual_path;
        }
        job.created_at = clock_.now();

        auto flag = std::make_shared<CancellationFlag>(false);
        {
            std::lock_guard lock(submit_mutex_);
            if (queue_.full())
            {
                throw JobError(filedock::ErrorCode::QueueFull, "Job queue is full, try again later");
            }
            store_.insert(job);
            {
                std::lock_guard flags_lock(flags_mutex_);
                flags_[job.id] = flag;
            }
            const bool queued = queue_.try_push(QueuedJob{
                .id = job.id,
                .type = job.type,
                .source = source,
                .destination = destination,
                .cancelled = flag,
            });
            if (!queued)
            {
                store_.update(job.id, [this](Job &record)
                              {
                    record.state = JobState::Cancelled;
                    record.completed_at = clock_.now();
                    return true; });
                release(job.id);
                throw JobError(filedock::ErrorCode::InternalError, "Job scheduler is shutting down");
            }
        }

        spdlog::info("Job {} submitted: {} {}{}", job.id, protocol::to_string(job.type), job.source_path,
                     job.dest_path ? " -> " + *job.dest_path : std::string{});
        return job;
    }

    std::optional<Job> JobScheduler::get(const std::string &id) const
    {
        return store_.get(id);
    }

    std::vector<Job> JobScheduler::list() const
    {
        return store_.list();
    }

    CancelResult JobScheduler::cancel(const std::string &id)
    {
        std::shared_ptr<CancellationFlag> flag;
        {
            std::lock_guard lock(flags_mutex_);
            if (auto it = flags_.find(id); it != flags_.end())
            {
                flag = it->second;
            }
        }

        const auto now = clock_.now();
        auto result = CancelResult::NotCancellable;
        // Raised under the store lock; finish() reads it under the same lock.
        auto mutation = store_.update(id, [&](Job &job)
                                      {
            if (job.state == JobState::Pending)
            {
                job.state = JobState::Cancelled;
                job.completed_at = now;
                result = CancelResult::Cancelled;
                return true;
            }
            if (job.state == JobState::Running && flag)
            {
                flag->store(true, std::memory_order_release);
                result = CancelResult::CancelRequested;
            }
            return false; });

        if (!mutation.found)
        {
            return CancelResult::NotFound;
        }
        if (mutation.applied)
        {
            if (flag)
            {
                flag->store(true, std::memory_order_release);
            }
            spdlog::info("Job {} cancelled before it started", id);
            publish(mutation);
        }
        else if (result == CancelResult::CancelRequested)
        {
            spdlog::info("Cancellation requested for running job {}", id);
        }
        return result;
    }

    void JobScheduler::worker_loop(std::size_t index)
    {
        JobExecutor executor(filesystem_, options_.buffer_size);
        spdlog::debug("Job worker {} started", index);
        while (auto job = queue_.pop())
        {
            execute(executor, *job);
        }
        spdlog::debug("Job worker {} exiting", index);
    }

    void JobScheduler::execute(JobExecutor &executor, const QueuedJob &job)
    {
        const auto started = clock_.now();
        auto claim = store_.update(job.id, [&](Job &record)
                                   {
            if (record.state != JobState::Pending)
            {
                return false;
            }
            record.state = JobState::Running;
            record.started_at = started;
            return true; });
        if (!claim.applied)
        {
            release(job.id);
            return;
        }
        publish(claim);

        const auto sink = [this, &job](int progress)
        { report_progress(job.id, progress); };

        try
        {
            auto outcome = ExecutionOutcome::Completed;
            switch (job.type)
            {
            case JobType::Copy:
                outcome = executor.copy(job.source.physical, job.destination->physical, *job.cancelled, sink);
                break;
            case JobType::Move:
                outcome = executor.move(job.source.physical, job.destination->physical,
                                        job.source.mount == job.destination->mount, *job.cancelled, sink);
                break;
            case JobType::Delete:
                outcome = executor.remove(job.source.physical, *job.cancelled, sink);
                break;
            }
            finish(job.id, outcome);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Job {} failed: {}", job.id, ex.what());
            fail(job.id, ex.what());
        }
        release(job.id);
    }

    void JobScheduler::report_progress(const std::string &id, int progress)
    {
        const int capped = std::clamp(progress, 0, 99);
        auto mutation = store_.update(id, [capped](Job &job)
                                      {
            if (job.state != JobState::Running || capped <= job.progress)
            {
                return false;
            }
            job.progress = capped;
            return true; });
        if (mutation.applied)
        {
            publish(mutation);
        }
    }

    void JobScheduler::finish(const std::string &id, ExecutionOutcome outcome)
    {
        std::shared_ptr<CancellationFlag> flag;
        {
            std::lock_guard lock(flags_mutex_);
            if (auto it = flags_.find(id); it != flags_.end())
            {
                flag = it->second;
            }
        }
        const auto now = clock_.now();
        auto mutation = store_.update(id, [&](Job &job)
                                      {
            job.completed_at = now;
            if (outcome == ExecutionOutcome::Completed && !(flag && flag->load(std::memory_order_acquire)))
            {
                job.state = JobState::Completed;
                job.progress = 100;
            }
            else
            {
                job.state = JobState::Cancelled;
            }
            return true; });
        if (mutation.applied)
        {
            spdlog::info("Job {} {}", id, protocol::to_string(mutation.job.state));
            publish(mutation);
        }
    }

    void JobScheduler::fail(const std::string &id, const std::string &cause)
    {
        const auto now = clock_.now();
        auto mutation = store_.update(id, [&](Job &job)
                                      {
            job.state = JobState::Failed;
            job.error = cause;
            job.completed_at = now;
            return true; });
        if (mutation.applied)
        {
            publish(mutation);
        }
    }

    void JobScheduler::publish(const JobMutation &mutation)
    {
        if (!listener_)
        {
            return;
        }
        try
        {
            listener_(mutation.job);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Job listener failed for {}: {}", mutation.job.id, ex.what());
        }
    }

    void JobScheduler::release(const std::string &id)
    {
        std::lock_guard lock(flags_mutex_);
        flags_.erase(id);
    }

} // namespace filedock::server
