#include "chunklift/crypto.hpp"

#include <array>
#include <mutex>
#include <span>
#include <stdexcept>

#include <sodium.h>

namespace chunklift::crypto
{

    namespace
    {

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

    std::string sha256_hex(std::string_view data)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()),
                               static_cast<unsigned long long>(data.size())) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(digest);
    }

    std::uint32_t random_uniform(std::uint32_t upper_bound)
    {
        if (upper_bound == 0)
        {
            return 0;
        }
        ensure_initialized_once();
        return randombytes_uniform(upper_bound);
    }

} // namespace chunklift::crypto
