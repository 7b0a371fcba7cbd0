/**
 * FileDock - Hashing, identifiers and token comparison built on libsodium.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct crypto_hash_sha256_state;

namespace filedock::crypto
{

    void ensure_sodium_init();

    // Incremental SHA-256, hex encoded on finish.
    class Sha256
    {
    public:
        Sha256();
        ~Sha256();

        Sha256(const Sha256 &) = delete;
        Sha256 &operator=(const Sha256 &) = delete;

        void update(std::span<const std::byte> data);
        std::string finish_hex();

    private:
        std::unique_ptr<crypto_hash_sha256_state> state_;
        bool finished_{false};
    };

    std::string sha256_hex(std::span<const std::byte> data);

    // Lowercases and strips an optional "sha256:" prefix.
    std::string normalize_checksum(std::string_view checksum);

    // 128 random bits formatted as 8-4-4-4-12 hex groups.
    std::string random_id();

    bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace filedock::crypto
