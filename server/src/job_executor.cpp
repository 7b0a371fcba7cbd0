#include "filedock/server/job_executor.hpp"

#include <spdlog/spdlog.h>

namespace filedock::server
{

    namespace
    {

        int percent(std::uint64_t done, std::uint64_t total)
        {
            if (total == 0)
            {
                return 0;
            }
            return static_cast<int>(done * 100 / total);
        }

        bool is_cancelled(const CancellationFlag &cancelled)
        {
            return cancelled.load(std::memory_order_acquire);
        }

    } // namespace

    JobExecutor::JobExecutor(Filesystem &filesystem, std::size_t buffer_size)
        : filesystem_(filesystem), buffer_(buffer_size == 0 ? 64 * 1024 : buffer_size)
    {
    }

    ExecutionOutcome JobExecutor::copy(const std::filesystem::path &source, const std::filesystem::path &destination,
                                       const CancellationFlag &cancelled, const ProgressSink &progress)
    {
        auto entries = plan(source, Order::ParentsFirst, cancelled);
        if (!entries)
        {
            return ExecutionOutcome::Cancelled;
        }

        // A single file reports per buffer; a tree reports per finished file.
        const bool single_file = entries->size() == 1 && !entries->front().is_directory;
        std::uint64_t total_bytes = 0;
        std::uint64_t total_files = 0;
        for (const auto &entry : *entries)
        {
            total_bytes += entry.size;
            total_files += entry.is_directory ? 0 : 1;
        }

        const ProgressSink no_progress = [](int) {};
        std::uint64_t copied = 0;
        std::uint64_t files_done = 0;
        for (const auto &entry : *entries)
        {
            if (is_cancelled(cancelled))
            {
                return ExecutionOutcome::Cancelled;
            }
            const auto from = entry.relative.empty() ? source : source / entry.relative;
            const auto to = entry.relative.empty() ? destination : destination / entry.relative;
            if (entry.is_directory)
            {
                filesystem_.create_directories(to);
                continue;
            }
            if (entry.relative.empty() && to.has_parent_path())
            {
                filesystem_.create_directories(to.parent_path());
            }
            if (!copy_file(from, to, copied, total_bytes, cancelled, single_file ? progress : no_progress))
            {
                return ExecutionOutcome::Cancelled;
            }
            ++files_done;
            progress(single_file ? percent(copied, total_bytes) : percent(files_done, total_files));
        }
        return ExecutionOutcome::Completed;
    }

    ExecutionOutcome JobExecutor::move(const std::filesystem::path &source, const std::filesystem::path &destination,
                                       bool same_mount, const CancellationFlag &cancelled,
                                       const ProgressSink &progress)
    {
        if (same_mount)
        {
            try
            {
                if (destination.has_parent_path())
                {
                    filesystem_.create_directories(destination.parent_path());
                }
                filesystem_.rename(source, destination);
                return ExecutionOutcome::Completed;
            }
            catch (const FilesystemError &ex)
            {
                if (ex.code() == filedock::ErrorCode::NotFound && !filesystem_.exists(source))
                {
                    throw;
                }
                spdlog::debug("Rename {} -> {} failed ({}), copying instead", source.generic_string(),
                              destination.generic_string(), ex.what());
            }
        }

        if (copy(source, destination, cancelled, progress) == ExecutionOutcome::Cancelled)
        {
            return ExecutionOutcome::Cancelled;
        }
        // No progress for removing the source.
        return remove(source, cancelled, [](int) {});
    }

    ExecutionOutcome JobExecutor::remove(const std::filesystem::path &target, const CancellationFlag &cancelled,
                                         const ProgressSink &progress)
    {
        auto entries = plan(target, Order::ChildrenFirst, cancelled);
        if (!entries)
        {
            return ExecutionOutcome::Cancelled;
        }

        const auto total_entries = static_cast<std::uint64_t>(entries->size());
        std::uint64_t deleted = 0;
        for (const auto &entry : *entries)
        {
            if (is_cancelled(cancelled))
            {
                return ExecutionOutcome::Cancelled;
            }
            filesystem_.remove(entry.relative.empty() ? target : target / entry.relative);
            ++deleted;
            progress(percent(deleted, total_entries));
        }
        return ExecutionOutcome::Completed;
    }

    std::optional<std::vector<JobExecutor::PlanEntry>> JobExecutor::plan(const std::filesystem::path &root, Order order,
                                                                        const CancellationFlag &cancelled) const
    {
        std::vector<PlanEntry> entries;
        if (!walk(root, {}, order, cancelled, entries))
        {
            return std::nullopt;
        }
        return entries;
    }

    bool JobExecutor::walk(const std::filesystem::path &root, const std::filesystem::path &relative, Order order,
                           const CancellationFlag &cancelled, std::vector<PlanEntry> &entries) const
    {
        if (is_cancelled(cancelled))
        {
            return false;
        }
        const auto info = filesystem_.stat(relative.empty() ? root : root / relative);
        if (!info.is_directory)
        {
            entries.push_back({.relative = relative, .is_directory = false, .size = info.size});
            return true;
        }

        if (order == Order::ParentsFirst)
        {
            entries.push_back({.relative = relative, .is_directory = true, .size = 0});
        }
        for (const auto &child : filesystem_.list_directory(relative.empty() ? root : root / relative))
        {
            if (!walk(root, relative / child.path.filename(), order, cancelled, entries))
            {
                return false;
            }
        }
        if (order == Order::ChildrenFirst)
        {
            entries.push_back({.relative = relative, .is_directory = true, .size = 0});
        }
        return true;
    }

    bool JobExecutor::copy_file(const std::filesystem::path &source, const std::filesystem::path &destination,
                                std::uint64_t &copied, std::uint64_t total, const CancellationFlag &cancelled,
                                const ProgressSink &progress)
    {
        auto input = filesystem_.open_read(source);
        auto output = filesystem_.open_write(destination, WriteMode::Truncate);
        while (true)
        {
            const auto count = input->read(buffer_);
            if (count == 0)
            {
                break;
            }
            output->write(std::span<const std::byte>(buffer_.data(), count));
            copied += count;
            progress(percent(copied, total));
            if (is_cancelled(cancelled))
            {
                output->close();
                return false;
            }
        }
        output->close();
        return true;
    }

} // namespace filedock::server
