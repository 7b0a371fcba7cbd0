#include "filedock/crypto.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace filedock::crypto
{

    namespace
    {

        constexpr std::string_view kChecksumPrefix = "sha256:";

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    Sha256::Sha256() : state_(std::make_unique<crypto_hash_sha256_state>())
    {
        ensure_initialized_once();
        if (crypto_hash_sha256_init(state_.get()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    Sha256::~Sha256() = default;

    void Sha256::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("Sha256::update called after finish");
        }
        if (crypto_hash_sha256_update(state_.get(), reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
    }

    std::string Sha256::finish_hex()
    {
        if (finished_)
        {
            throw std::logic_error("Sha256::finish_hex called twice");
        }
        finished_ = true;
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256_final(state_.get(), digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        return to_hex(digest);
    }

    std::string sha256_hex(std::span<const std::byte> data)
    {
        Sha256 hasher;
        hasher.update(data);
        return hasher.finish_hex();
    }

    std::string normalize_checksum(std::string_view checksum)
    {
        std::string result(checksum);
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (result.starts_with(kChecksumPrefix))
        {
            result.erase(0, kChecksumPrefix.size());
        }
        return result;
    }

    std::string random_id()
    {
        ensure_initialized_once();
        std::array<unsigned char, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        // RFC 4122 version 4 / variant bits
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        const auto hex = to_hex(bytes);
        std::string id;
        id.reserve(36);
        id.append(hex, 0, 8).append("-");
        id.append(hex, 8, 4).append("-");
        id.append(hex, 12, 4).append("-");
        id.append(hex, 16, 4).append("-");
        id.append(hex, 20, 12);
        return id;
    }

    bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        if (lhs.empty())
        {
            return true;
        }
        return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
    }

} // namespace filedock::crypto
