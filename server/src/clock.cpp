#include "filedock/server/clock.hpp"

#include <array>
#include <ctime>

namespace filedock::server
{

    std::string format_timestamp(Timestamp time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::array<char, 32> buffer{};
        const auto length = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return std::string(buffer.data(), length);
    }

} // namespace filedock::server
