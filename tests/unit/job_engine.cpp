#include <algorithm>
#include <cassert>
#include <mutex>
#include <string>
#include <vector>

#include "filedock/server/job_scheduler.hpp"
#include "filedock/server/job_store.hpp"
#include "filedock/server/memory_filesystem.hpp"
#include "filedock/server/mount_table.hpp"
#include "test_support.hpp"

using namespace filedock;
using namespace filedock::server;
using filedock::protocol::JobState;
using filedock::protocol::JobType;

namespace
{

    class JobRecorder
    {
    public:
        void operator()(const Job &job)
        {
            std::lock_guard lock(mutex_);
            events_.push_back(job);
        }

        std::vector<Job> events_for(const std::string &id) const
        {
            std::lock_guard lock(mutex_);
            std::vector<Job> matching;
            std::copy_if(events_.begin(), events_.end(), std::back_inserter(matching),
                         [&](const Job &job)
                         { return job.id == id; });
            return matching;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<Job> events_;
    };

    MountTable make_mounts()
    {
        return MountTable({
            MountPoint{.name = "data", .root = "/srv/data", .read_only = false},
            MountPoint{.name = "media", .root = "/srv/media", .read_only = false},
            MountPoint{.name = "archive", .root = "/srv/archive", .read_only = true},
        });
    }

    void prepare_roots(MemoryFilesystem &filesystem)
    {
        filesystem.create_directories("/srv/data");
        filesystem.create_directories("/srv/media");
        filesystem.create_directories("/srv/archive");
    }

    bool reaches_terminal(const JobScheduler &scheduler, const std::string &id)
    {
        return test::wait_until([&]
                                {
            auto job = scheduler.get(id);
            return job && protocol::is_terminal(job->state); });
    }

    Job pending_job(const std::string &id)
    {
        Job job{};
        job.id = id;
        job.type = JobType::Copy;
        job.source_path = "/data/a";
        job.dest_path = "/data/b";
        return job;
    }

    void test_job_store_invariants()
    {
        JobStore store;
        store.insert(pending_job("one"));
        store.insert(pending_job("two"));

        const auto listed = store.list();
        assert(listed.size() == 2);
        assert(listed.front().id == "two");

        auto started = store.update("one", [](Job &job)
                                    {
            job.state = JobState::Running;
            return true; });
        assert(started.found && started.applied);

        auto progressed = store.update("one", [](Job &job)
                                       {
            job.progress = 40;
            return true; });
        assert(progressed.applied);

        auto backwards = store.update("one", [](Job &job)
                                      {
            job.progress = 10;
            return true; });
        assert(!backwards.applied);
        assert(store.get("one")->progress == 40);

        auto early_completion = store.update("one", [](Job &job)
                                             {
            job.state = JobState::Completed;
            return true; });
        assert(!early_completion.applied);

        auto failure_without_cause = store.update("one", [](Job &job)
                                                  {
            job.state = JobState::Failed;
            return true; });
        assert(!failure_without_cause.applied);

        auto completed = store.update("one", [](Job &job)
                                      {
            job.state = JobState::Completed;
            job.progress = 100;
            return true; });
        assert(completed.applied);

        auto after_terminal = store.update("one", [](Job &job)
                                           {
            job.state = JobState::Cancelled;
            return true; });
        assert(after_terminal.found);
        assert(!after_terminal.applied);
        assert(store.get("one")->state == JobState::Completed);

        auto missing = store.update("ghost", [](Job &)
                                    { return true; });
        assert(!missing.found);
    }

    void test_copy_directory_reports_file_progress()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare_roots(filesystem);
        filesystem.create_directories("/srv/data/src/nested");
        filesystem.write_file("/srv/data/src/a.txt", std::string(10, 'a'));
        filesystem.write_file("/srv/data/src/b.txt", std::string(20, 'b'));
        filesystem.write_file("/srv/data/src/nested/c.txt", std::string(30, 'c'));
        const auto mounts = make_mounts();

        JobRecorder recorder;
        JobScheduler scheduler(filesystem, mounts, clock, SchedulerOptions{.worker_count = 2},
                               [&recorder](const Job &job)
                               { recorder(job); });
        scheduler.start();

        const auto job = scheduler.submit({.type = "copy", .source_path = "/data/src", .dest_path = "/media/dst"});
        assert(job.state == JobState::Pending);
        assert(job.id.size() == 36);
        assert(reaches_terminal(scheduler, job.id));

        const auto finished = scheduler.get(job.id);
        assert(finished->state == JobState::Completed);
        assert(finished->progress == 100);
        assert(finished->started_at && finished->completed_at);
        assert(filesystem.read_file("/srv/media/dst/a.txt") == std::string(10, 'a'));
        assert(filesystem.read_file("/srv/media/dst/b.txt") == std::string(20, 'b'));
        assert(filesystem.read_file("/srv/media/dst/nested/c.txt") == std::string(30, 'c'));
        assert(filesystem.exists("/srv/data/src/a.txt"));

        const auto events = recorder.events_for(job.id);
        std::vector<int> progress;
        for (const auto &event : events)
        {
            progress.push_back(event.progress);
        }
        assert(std::is_sorted(progress.begin(), progress.end()));
        assert(events.front().state == JobState::Running);
        assert(events.back().state == JobState::Completed);
        assert(std::count_if(events.begin(), events.end(), [](const Job &event)
                             { return protocol::is_terminal(event.state); }) == 1);
        // One, two and three of three files, the last one held at 99 until completion.
        const auto one_third = std::find(progress.begin(), progress.end(), 33);
        const auto two_thirds = std::find(progress.begin(), progress.end(), 66);
        assert(one_third != progress.end());
        assert(two_thirds != progress.end());
        assert(one_third < two_thirds);
        assert(progress.back() == 100);
        for (const auto &event : events)
        {
            assert((event.progress == 100) == (event.state == JobState::Completed));
        }
        scheduler.stop();
    }

    void test_copy_file_reports_byte_progress()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare_roots(filesystem);
        filesystem.write_file("/srv/data/big.bin", std::string(40, 'x'));
        const auto mounts = make_mounts();

        JobRecorder recorder;
        JobScheduler scheduler(filesystem, mounts, clock, SchedulerOptions{.worker_count = 1, .buffer_size = 10},
                               [&recorder](const Job &job)
                               { recorder(job); });
        scheduler.start();

        const auto job = scheduler.submit({.type = "copy", .source_path = "/data/big.bin", .dest_path = "/media/big.bin"});
        assert(reaches_terminal(scheduler, job.id));
        assert(filesystem.read_file("/srv/media/big.bin") == std::string(40, 'x'));

        std::vector<int> progress;
        for (const auto &event : recorder.events_for(job.id))
        {
            progress.push_back(event.progress);
        }
        assert((progress == std::vector<int>{0, 25, 50, 75, 99, 100}));
        scheduler.stop();
    }

    void test_move_and_delete()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare_roots(filesystem);
        filesystem.create_directories("/srv/data/docs");
        filesystem.write_file("/srv/data/docs/one.txt", "one");
        filesystem.write_file("/srv/data/docs/two.txt", "two");
        filesystem.write_file("/srv/data/photo.jpg", "jpeg");
        const auto mounts = make_mounts();

        JobRecorder recorder;
        JobScheduler scheduler(filesystem, mounts, clock, SchedulerOptions{}, [&recorder](const Job &job)
                               { recorder(job); });
        scheduler.start();

        const auto same_mount = scheduler.submit({.type = "move", .source_path = "/data/docs", .dest_path = "/data/papers"});
        assert(reaches_terminal(scheduler, same_mount.id));
        assert(scheduler.get(same_mount.id)->state == JobState::Completed);
        assert(!filesystem.exists("/srv/data/docs"));
        assert(filesystem.read_file("/srv/data/papers/two.txt") == "two");

        const auto cross_mount = scheduler.submit({.type = "move", .source_path = "/data/photo.jpg", .dest_path = "/media/photo.jpg"});
        assert(reaches_terminal(scheduler, cross_mount.id));
        assert(scheduler.get(cross_mount.id)->state == JobState::Completed);
        assert(!filesystem.exists("/srv/data/photo.jpg"));
        assert(filesystem.read_file("/srv/media/photo.jpg") == "jpeg");

        const auto removal = scheduler.submit({.type = "delete", .source_path = "/data/papers"});
        assert(!removal.dest_path);
        assert(reaches_terminal(scheduler, removal.id));
        assert(scheduler.get(removal.id)->state == JobState::Completed);
        assert(!filesystem.exists("/srv/data/papers"));
        assert(filesystem.exists("/srv/data"));

        const auto events = recorder.events_for(removal.id);
        for (std::size_t i = 1; i < events.size(); ++i)
        {
            assert(events[i - 1].progress <= events[i].progress);
        }
        scheduler.stop();
    }

    void test_submit_validation()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare_roots(filesystem);
        const auto mounts = make_mounts();
        JobScheduler scheduler(filesystem, mounts, clock, SchedulerOptions{}, nullptr);
        scheduler.start();

        const auto rejects = [&](protocol::CreateJobRequest request, ErrorCode expected)
        {
            try
            {
                scheduler.submit(request);
            }
            catch (const JobError &ex)
            {
                assert(ex.code() == expected);
                return;
            }
            assert(false && "submit should have thrown");
        };

        rejects({.type = "rename", .source_path = "/data/a", .dest_path = "/data/b"}, ErrorCode::ValidationError);
        rejects({.type = "copy", .source_path = "", .dest_path = "/data/b"}, ErrorCode::ValidationError);
        rejects({.type = "copy", .source_path = "/data/a"}, ErrorCode::ValidationError);
        rejects({.type = "move", .source_path = "/data/a", .dest_path = ""}, ErrorCode::ValidationError);
        rejects({.type = "copy", .source_path = "/data/dir", .dest_path = "/data/dir/inner"}, ErrorCode::ValidationError);
        rejects({.type = "delete", .source_path = "/data"}, ErrorCode::ValidationError);
        rejects({.type = "copy", .source_path = "/data/../etc", .dest_path = "/data/b"}, ErrorCode::InvalidPath);
        rejects({.type = "copy", .source_path = "/nowhere/a", .dest_path = "/data/b"}, ErrorCode::NotFound);
        rejects({.type = "copy", .source_path = "/data/a", .dest_path = "/archive/a"}, ErrorCode::ReadOnly);
        rejects({.type = "delete", .source_path = "/archive/a"}, ErrorCode::ReadOnly);
        assert(scheduler.list().empty());

        // Reading from a read-only mount is fine.
        const auto copy = scheduler.submit({.type = "copy", .source_path = "/archive/a", .dest_path = "/data/a"});
        assert(copy.state == JobState::Pending);
        scheduler.stop();
    }

    void test_failed_job_captures_cause()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare_roots(filesystem);
        filesystem.write_file("/srv/data/broken.bin", "data");
        filesystem.fail_reads_of("/srv/data/broken.bin");
        const auto mounts = make_mounts();
        JobScheduler scheduler(filesystem, mounts, clock, SchedulerOptions{}, nullptr);
        scheduler.start();

        const auto job = scheduler.submit({.type = "copy", .source_path = "/data/broken.bin", .dest_path = "/media/copy.bin"});
        assert(reaches_terminal(scheduler, job.id));
        const auto failed = scheduler.get(job.id);
        assert(failed->state == JobState::Failed);
        assert(failed->error && !failed->error->empty());
        assert(failed->progress < 100);

        const auto missing = scheduler.submit({.type = "delete", .source_path = "/data/absent"});
        assert(reaches_terminal(scheduler, missing.id));
        assert(scheduler.get(missing.id)->state == JobState::Failed);
        scheduler.stop();
    }

    void test_queue_capacity_and_cancellation()
    {
        test::ManualClock clock;
        test::GatedFilesystem filesystem(clock);
        prepare_roots(filesystem.inner());
        filesystem.inner().write_file("/srv/data/big.bin", std::string(64, 'x'));
        const auto mounts = make_mounts();

        JobRecorder recorder;
        JobScheduler scheduler(filesystem, mounts, clock,
                               SchedulerOptions{.worker_count = 1, .queue_capacity = 1, .buffer_size = 16},
                               [&recorder](const Job &job)
                               { recorder(job); });
        scheduler.start();
        filesystem.close_gate();

        const protocol::CreateJobRequest copy{.type = "copy", .source_path = "/data/big.bin", .dest_path = "/media/big.bin"};
        const auto running = scheduler.submit(copy);
        assert(test::wait_until([&]
                                { return filesystem.waiting() == 1; }));
        assert(scheduler.get(running.id)->state == JobState::Running);

        const auto queued = scheduler.submit(copy);
        try
        {
            scheduler.submit(copy);
            assert(false && "queue should be full");
        }
        catch (const JobError &ex)
        {
            assert(ex.code() == ErrorCode::QueueFull);
            assert(is_resource_error(ex.code()));
        }

        assert(scheduler.cancel(queued.id) == CancelResult::Cancelled);
        assert(scheduler.get(queued.id)->state == JobState::Cancelled);
        assert(scheduler.cancel(queued.id) == CancelResult::NotCancellable);
        assert(scheduler.cancel("missing") == CancelResult::NotFound);

        assert(scheduler.cancel(running.id) == CancelResult::CancelRequested);
        filesystem.open_gate();
        assert(reaches_terminal(scheduler, running.id));
        const auto cancelled = scheduler.get(running.id);
        assert(cancelled->state == JobState::Cancelled);
        assert(!cancelled->error);

        assert(test::wait_until([&]
                                { return recorder.events_for(queued.id).size() == 1; }));
        const auto queued_events = recorder.events_for(queued.id);
        assert(queued_events.front().state == JobState::Cancelled);
        assert(!scheduler.get(queued.id)->started_at);

        const auto running_events = recorder.events_for(running.id);
        assert(running_events.back().state == JobState::Cancelled);
        for (const auto &event : running_events)
        {
            assert(event.state != JobState::Completed);
        }
        scheduler.stop();
    }

    void test_stop_cancels_unfinished_jobs()
    {
        test::ManualClock clock;
        test::GatedFilesystem filesystem(clock);
        prepare_roots(filesystem.inner());
        filesystem.inner().write_file("/srv/data/file.bin", "payload");
        const auto mounts = make_mounts();
        JobScheduler scheduler(filesystem, mounts, clock, SchedulerOptions{.worker_count = 1}, nullptr);
        scheduler.start();
        filesystem.close_gate();

        const protocol::CreateJobRequest copy{.type = "copy", .source_path = "/data/file.bin", .dest_path = "/media/file.bin"};
        const auto first = scheduler.submit(copy);
        const auto second = scheduler.submit(copy);
        assert(test::wait_until([&]
                                { return filesystem.waiting() == 1; }));

        std::thread releaser([&]
                             {
            test::wait_until([&] { return scheduler.get(first.id)->state == JobState::Running; });
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
            filesystem.open_gate(); });
        scheduler.stop();
        releaser.join();

        assert(scheduler.get(first.id)->state == JobState::Cancelled);
        assert(scheduler.get(second.id)->state == JobState::Cancelled);
        try
        {
            scheduler.submit(copy);
            assert(false && "stopped scheduler accepted a job");
        }
        catch (const JobError &ex)
        {
            assert(ex.code() == ErrorCode::InternalError);
        }
    }

} // namespace

void run_job_engine_tests()
{
    test_job_store_invariants();
    test_copy_directory_reports_file_progress();
    test_copy_file_reports_byte_progress();
    test_move_and_delete();
    test_submit_validation();
    test_failed_job_captures_cause();
    test_queue_capacity_and_cancellation();
    test_stop_cancels_unfinished_jobs();
}
