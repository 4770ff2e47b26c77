#include "agentreg/did_validator.hpp"
#include "agentreg/base58.hpp"
#include <algorithm>

namespace agentreg
{

    std::optional<std::string_view> DidValidator::payload_of(std::string_view did)
    {
        std::size_t separators = 0;
        std::size_t payload_begin = 0;
        for (std::size_t i = 0; i < did.size(); ++i)
        {
            if (did[i] != ':')
                continue;
            ++separators;
            if (separators == kSeparatorCount)
                payload_begin = i + 1;
        }

        if (separators != kSeparatorCount)
            return std::nullopt;
        return did.substr(payload_begin);
    }

    std::optional<Address> DidValidator::extract_address(std::string_view did)
    {
        auto payload = payload_of(did);
        if (!payload)
            return std::nullopt;

        auto decoded = base58::decode(*payload);
        if (!decoded || decoded->size() != kPayloadSize)
            return std::nullopt;

        const auto &bytes = *decoded;
        for (std::size_t i = kPaddingBegin; i < kAddressBegin; ++i)
        {
            if (bytes[i] != 0)
                return std::nullopt;
        }

        Address address;
        std::copy(bytes.begin() + kAddressBegin, bytes.begin() + kAddressEnd, address.begin());
        return address;
    }

    bool DidValidator::validate(std::string_view did, const Address &expected_address)
    {
        auto embedded = extract_address(did);
        return embedded && *embedded == expected_address;
    }

    Result<std::string> DidValidator::make_address_did(
        const Address &address,
        std::string_view prefix,
        const std::array<uint8_t, 2> &id_type)
    {
        if (std::count(prefix.begin(), prefix.end(), ':') != static_cast<std::ptrdiff_t>(kSeparatorCount - 1))
        {
            return std::unexpected(RegistryError::invalid_input(
                "DID prefix must contain exactly three ':' separators: " + std::string(prefix)));
        }

        Bytes payload(kPayloadSize, 0);
        payload[0] = id_type[0];
        payload[1] = id_type[1];
        std::copy(address.begin(), address.end(), payload.begin() + kAddressBegin);

        uint16_t checksum = 0;
        for (std::size_t i = 0; i < kAddressEnd; ++i)
            checksum = static_cast<uint16_t>(checksum + payload[i]);
        payload[kAddressEnd] = static_cast<uint8_t>(checksum & 0xff);
        payload[kAddressEnd + 1] = static_cast<uint8_t>(checksum >> 8);

        return std::string(prefix) + ":" + base58::encode(payload);
    }

} // namespace agentreg
