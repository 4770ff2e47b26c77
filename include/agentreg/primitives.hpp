#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agentreg
{

    using Bytes = std::vector<uint8_t>;
    using Address = std::array<uint8_t, 20>;
    using Hash32 = std::array<uint8_t, 32>;

    /** Sequential agent identifier; 0 is the "not found" sentinel. */
    using AgentId = uint64_t;

    constexpr AgentId kNoAgent = 0;

    /**
     * Envelope supplied by the ledger for each state transition.
     * The caller is already authenticated by the time it reaches a registry.
     */
    struct CallContext
    {
        Address caller{};
        uint64_t timestamp{0}; // logical clock
        Hash32 entropy{};      // per-transaction seed
        uint64_t value{0};     // payment attached to the call
    };

    template <std::size_t N>
    bool is_zero(const std::array<uint8_t, N> &bytes)
    {
        for (auto b : bytes)
        {
            if (b != 0)
                return false;
        }
        return true;
    }

    /** Lower-case hex with a 0x prefix. */
    std::string to_hex(const uint8_t *data, std::size_t size);

    template <std::size_t N>
    std::string to_hex(const std::array<uint8_t, N> &bytes)
    {
        return to_hex(bytes.data(), N);
    }

    inline std::string to_hex(const Bytes &bytes)
    {
        return to_hex(bytes.data(), bytes.size());
    }

    /** Parse hex (optional 0x prefix) of any even length. */
    Result<Bytes> bytes_from_hex(std::string_view hex);

    Result<Address> address_from_hex(std::string_view hex);

    Result<Hash32> hash_from_hex(std::string_view hex);

    /** ASCII lower-casing used for case-insensitive domain keys. */
    std::string to_lower_ascii(std::string_view text);

    /** Append a 64-bit unsigned integer big-endian. */
    void append_u64_be(Bytes &out, uint64_t value);

} // namespace agentreg
