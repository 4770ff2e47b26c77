#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace agentreg
{

    /**
     * Checks whether an address-controlled DID embeds a given account address.
     *
     * A DID has exactly four ':' separators; the text after the fourth is a
     * base58 payload that must decode to 31 bytes laid out as
     *
     *   [0..2)   identity type
     *   [2..9)   zero padding (address-controlled marker)
     *   [9..29)  account address
     *   [29..31) checksum
     *
     * Stateless and side-effect free.
     */
    class DidValidator
    {
    public:
        static constexpr std::size_t kPayloadSize = 31;
        static constexpr std::size_t kPaddingBegin = 2;
        static constexpr std::size_t kAddressBegin = 9;
        static constexpr std::size_t kAddressEnd = 29;
        static constexpr std::size_t kSeparatorCount = 4;

        static constexpr std::string_view kDefaultPrefix = "did:iden3:polygon:amoy";
        static constexpr std::array<uint8_t, 2> kDefaultIdType{0x0d, 0x02};

        /** True only if the DID decodes, is well formed and embeds expected_address. */
        static bool validate(std::string_view did, const Address &expected_address);

        /** Embedded address, or nullopt when the DID is malformed. */
        static std::optional<Address> extract_address(std::string_view did);

        /**
         * Build an address-controlled DID under a four-separator prefix
         * (e.g. "did:iden3:polygon:amoy").
         */
        static Result<std::string> make_address_did(
            const Address &address,
            std::string_view prefix = kDefaultPrefix,
            const std::array<uint8_t, 2> &id_type = kDefaultIdType);

    private:
        static std::optional<std::string_view> payload_of(std::string_view did);
    };

} // namespace agentreg
