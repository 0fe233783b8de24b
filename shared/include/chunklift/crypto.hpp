/**
 * ChunkLift - Hashing and randomness helpers built on libsodium.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace chunklift::crypto
{

    // Lowercase hex SHA-256 of the given bytes.
    std::string sha256_hex(std::string_view data);

    // Uniformly distributed value in [0, upper_bound). Returns 0 when upper_bound is 0.
    std::uint32_t random_uniform(std::uint32_t upper_bound);

} // namespace chunklift::crypto
