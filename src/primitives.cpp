#include "agentreg/primitives.hpp"
#include <algorithm>

namespace agentreg
{

    namespace
    {
        constexpr char kHexDigits[] = "0123456789abcdef";

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        template <std::size_t N>
        Result<std::array<uint8_t, N>> fixed_from_hex(std::string_view hex, const char *what)
        {
            auto bytes = bytes_from_hex(hex);
            if (!bytes)
                return std::unexpected(bytes.error());
            if (bytes->size() != N)
            {
                return std::unexpected(RegistryError::invalid_input(
                    std::string(what) + " must be " + std::to_string(N) + " bytes"));
            }
            std::array<uint8_t, N> out{};
            std::copy(bytes->begin(), bytes->end(), out.begin());
            return out;
        }
    } // namespace

    std::string to_hex(const uint8_t *data, std::size_t size)
    {
        std::string hex;
        hex.reserve(2 + size * 2);
        hex += "0x";
        for (std::size_t i = 0; i < size; ++i)
        {
            hex += kHexDigits[data[i] >> 4];
            hex += kHexDigits[data[i] & 0x0f];
        }
        return hex;
    }

    Result<Bytes> bytes_from_hex(std::string_view hex)
    {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
            hex.remove_prefix(2);

        if (hex.size() % 2 != 0)
            return std::unexpected(RegistryError::invalid_input("Odd-length hex string"));

        Bytes out;
        out.reserve(hex.size() / 2);
        for (std::size_t i = 0; i < hex.size(); i += 2)
        {
            int hi = hex_value(hex[i]);
            int lo = hex_value(hex[i + 1]);
            if (hi < 0 || lo < 0)
                return std::unexpected(RegistryError::invalid_input("Invalid hex character"));
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    Result<Address> address_from_hex(std::string_view hex)
    {
        return fixed_from_hex<20>(hex, "Address");
    }

    Result<Hash32> hash_from_hex(std::string_view hex)
    {
        return fixed_from_hex<32>(hex, "Hash");
    }

    std::string to_lower_ascii(std::string_view text)
    {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
        });
        return out;
    }

    void append_u64_be(Bytes &out, uint64_t value)
    {
        for (int shift = 56; shift >= 0; shift -= 8)
            out.push_back(static_cast<uint8_t>((value >> shift) & 0xff));
    }

} // namespace agentreg
