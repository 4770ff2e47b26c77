#include "agentreg/base58.hpp"
#include <array>

namespace agentreg::base58
{

    namespace
    {
        constexpr std::array<int8_t, 128> make_reverse_table()
        {
            std::array<int8_t, 128> table{};
            for (auto &v : table)
                v = -1;
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
                table[static_cast<std::size_t>(kAlphabet[i])] = static_cast<int8_t>(i);
            return table;
        }

        constexpr auto kReverse = make_reverse_table();

        int symbol_value(char c)
        {
            auto uc = static_cast<unsigned char>(c);
            if (uc >= kReverse.size())
                return -1;
            return kReverse[uc];
        }
    } // namespace

    Result<Bytes> decode(std::string_view text)
    {
        std::size_t leading_zeros = 0;
        while (leading_zeros < text.size() && text[leading_zeros] == kAlphabet[0])
            ++leading_zeros;

        // Big-endian accumulator; `used` counts significant bytes at the tail.
        std::array<uint8_t, kMaxDecodedSize> scratch{};
        std::size_t used = 0;

        for (char c : text)
        {
            int value = symbol_value(c);
            if (value < 0)
            {
                return std::unexpected(RegistryError::parsing(
                    std::string("Invalid base58 symbol '") + c + "'"));
            }

            uint32_t carry = static_cast<uint32_t>(value);
            for (std::size_t i = 0; i < used; ++i)
            {
                auto &byte = scratch[kMaxDecodedSize - 1 - i];
                carry += static_cast<uint32_t>(byte) * 58;
                byte = static_cast<uint8_t>(carry & 0xff);
                carry >>= 8;
            }
            while (carry > 0)
            {
                if (used == kMaxDecodedSize)
                    return std::unexpected(RegistryError::parsing("Base58 value overflows decode buffer"));
                scratch[kMaxDecodedSize - 1 - used] = static_cast<uint8_t>(carry & 0xff);
                ++used;
                carry >>= 8;
            }
        }

        Bytes out(leading_zeros, 0);
        out.insert(out.end(), scratch.end() - static_cast<std::ptrdiff_t>(used), scratch.end());
        return out;
    }

    std::string encode(const Bytes &data)
    {
        std::size_t leading_zeros = 0;
        while (leading_zeros < data.size() && data[leading_zeros] == 0)
            ++leading_zeros;

        // Little-endian base58 digits
        std::vector<uint8_t> digits;
        for (std::size_t i = leading_zeros; i < data.size(); ++i)
        {
            uint32_t carry = data[i];
            for (auto &digit : digits)
            {
                carry += static_cast<uint32_t>(digit) * 256;
                digit = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            while (carry > 0)
            {
                digits.push_back(static_cast<uint8_t>(carry % 58));
                carry /= 58;
            }
        }

        std::string result(leading_zeros, kAlphabet[0]);
        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
            result += kAlphabet[*it];
        return result;
    }

} // namespace agentreg::base58
