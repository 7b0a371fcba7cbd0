#pragma once

#include <chrono>
#include <string>

namespace filedock::server
{

    using Timestamp = std::chrono::system_clock::time_point;

    class Clock
    {
    public:
        virtual ~Clock() = default;

        virtual Timestamp now() const = 0;
    };

    class SystemClock final : public Clock
    {
    public:
        Timestamp now() const override { return std::chrono::system_clock::now(); }
    };

    // RFC 3339 in UTC with second precision, e.g. 2024-05-01T12:00:00Z.
    std::string format_timestamp(Timestamp time);

} // namespace filedock::server
