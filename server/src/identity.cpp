#include "filedock/server/identity.hpp"

#include <algorithm>
#include <cctype>

#include "filedock/crypto.hpp"

namespace filedock::server
{

    namespace
    {
        constexpr std::string_view kBearerPrefix = "bearer ";

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string_view strip_scheme(std::string_view origin)
        {
            if (const auto pos = origin.find("://"); pos != std::string_view::npos)
            {
                origin.remove_prefix(pos + 3);
            }
            return origin;
        }
    } // namespace

    StaticTokenVerifier::StaticTokenVerifier(std::unordered_map<std::string, std::string> tokens)
    {
        crypto::ensure_sodium_init();
        for (auto &[user, token] : tokens)
        {
            if (!token.empty())
            {
                tokens_.emplace_back(user, std::move(token));
            }
        }
    }

    std::optional<Identity> StaticTokenVerifier::verify(std::string_view token) const
    {
        if (token.empty())
        {
            return std::nullopt;
        }
        std::optional<Identity> match;
        // No early exit.
        for (const auto &[user, expected] : tokens_)
        {
            if (crypto::constant_time_equals(token, expected) && !match)
            {
                match = Identity{.user = user};
            }
        }
        return match;
    }

    std::optional<std::string> bearer_token(std::string_view authorization)
    {
        if (authorization.size() <= kBearerPrefix.size() ||
            to_lower(authorization.substr(0, kBearerPrefix.size())) != kBearerPrefix)
        {
            return std::nullopt;
        }
        auto token = authorization.substr(kBearerPrefix.size());
        while (!token.empty() && token.front() == ' ')
        {
            token.remove_prefix(1);
        }
        if (token.empty())
        {
            return std::nullopt;
        }
        return std::string(token);
    }

    std::optional<std::pair<std::string, std::string>> parse_token_spec(std::string_view spec)
    {
        const auto equals = spec.find('=');
        if (equals == std::string_view::npos || equals == 0 || equals + 1 == spec.size())
        {
            return std::nullopt;
        }
        return std::make_pair(std::string(spec.substr(0, equals)), std::string(spec.substr(equals + 1)));
    }

    bool origin_allowed(std::string_view origin, const std::vector<std::string> &allowed)
    {
        if (allowed.empty() || origin.empty())
        {
            return true;
        }
        const auto host = to_lower(strip_scheme(origin));
        for (const auto &pattern : allowed)
        {
            if (pattern == "*")
            {
                return true;
            }
            const auto normalized = to_lower(strip_scheme(pattern));
            if (normalized.starts_with("*."))
            {
                const auto suffix = normalized.substr(1);
                if (host.size() > suffix.size() && host.ends_with(suffix))
                {
                    return true;
                }
            }
            else if (normalized == host)
            {
                return true;
            }
        }
        return false;
    }

} // namespace filedock::server
