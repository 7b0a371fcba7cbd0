#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

#include "filedock/server/filesystem.hpp"

namespace filedock::server
{

    using CancellationFlag = std::atomic<bool>;

    enum class ExecutionOutcome : std::uint8_t
    {
        Completed,
        Cancelled
    };

    // Runs copy / move / delete against the filesystem abstraction. Cancellation is polled between files,
    // directory listings and transfer buffers. I/O failures propagate as FilesystemError.
    class JobExecutor
    {
    public:
        // Receives bytesCopied * 100 / totalBytes for a single-file copy, filesCopied * 100 / totalFiles for a
        // directory copy and entriesDeleted * 100 / totalEntries for deletes.
        using ProgressSink = std::function<void(int)>;

        JobExecutor(Filesystem &filesystem, std::size_t buffer_size);

        ExecutionOutcome copy(const std::filesystem::path &source, const std::filesystem::path &destination,
                              const CancellationFlag &cancelled, const ProgressSink &progress);

        // Renames when both paths live on the same mount, otherwise copies then deletes the source.
        ExecutionOutcome move(const std::filesystem::path &source, const std::filesystem::path &destination,
                              bool same_mount, const CancellationFlag &cancelled, const ProgressSink &progress);

        ExecutionOutcome remove(const std::filesystem::path &target, const CancellationFlag &cancelled,
                                const ProgressSink &progress);

    private:
        struct PlanEntry
        {
            std::filesystem::path relative;
            bool is_directory{};
            std::uint64_t size{};
        };

        enum class Order : std::uint8_t
        {
            ParentsFirst,
            ChildrenFirst
        };

        std::optional<std::vector<PlanEntry>> plan(const std::filesystem::path &root, Order order,
                                                   const CancellationFlag &cancelled) const;
        bool walk(const std::filesystem::path &root, const std::filesystem::path &relative, Order order,
                  const CancellationFlag &cancelled, std::vector<PlanEntry> &entries) const;
        bool copy_file(const std::filesystem::path &source, const std::filesystem::path &destination,
                       std::uint64_t &copied, std::uint64_t total, const CancellationFlag &cancelled,
                       const ProgressSink &progress);

        Filesystem &filesystem_;
        std::vector<std::byte> buffer_;
    };

} // namespace filedock::server
