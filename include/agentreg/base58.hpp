#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace agentreg::base58
{

    /** Bitcoin alphabet: digits and letters without 0, O, I and l. */
    inline constexpr std::string_view kAlphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    /** Capacity of the decode scratch buffer in bytes. */
    inline constexpr std::size_t kMaxDecodedSize = 64;

    /**
     * Decode base58 text.
     * Each leading '1' yields one leading zero byte. Fails on symbols outside
     * the alphabet or when the value overflows kMaxDecodedSize bytes.
     */
    Result<Bytes> decode(std::string_view text);

    std::string encode(const Bytes &data);

} // namespace agentreg::base58
