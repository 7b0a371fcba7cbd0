#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace filedock::server
{

    struct Identity
    {
        std::string user;
    };

    class IdentityVerifier
    {
    public:
        virtual ~IdentityVerifier() = default;

        virtual std::optional<Identity> verify(std::string_view token) const = 0;
    };

    // Tokens issued out of band and handed to the server at start-up.
    class StaticTokenVerifier final : public IdentityVerifier
    {
    public:
        // user -> token
        explicit StaticTokenVerifier(std::unordered_map<std::string, std::string> tokens);

        std::optional<Identity> verify(std::string_view token) const override;

    private:
        std::vector<std::pair<std::string, std::string>> tokens_;
    };

    // Returns the credential of an "Authorization: Bearer <token>" header value.
    std::optional<std::string> bearer_token(std::string_view authorization);

    // "user=token"
    std::optional<std::pair<std::string, std::string>> parse_token_spec(std::string_view spec);

    // Exact match or "*.example.com" suffix match; an empty allow-list admits every origin.
    bool origin_allowed(std::string_view origin, const std::vector<std::string> &allowed);

} // namespace filedock::server
