#pragma once

#include "crypto.hpp"
#include "primitives.hpp"
#include <cstdint>
#include <string>

namespace agentreg
{

    /**
     * Domain separating consent signatures from other signed payloads:
     * a signature made for one registry deployment never verifies on another.
     */
    struct SigningDomain
    {
        std::string name{"AgentIdentityRegistry"};
        std::string version{"1"};
        uint64_t chain_id{1};
        Address verifying_contract{};

        Hash32 separator() const;
    };

    /**
     * Offline consent an agent grants to a developer to register it.
     */
    struct DelegatedConsent
    {
        std::string developer_did;
        std::string agent_did;
        Address agent_address{};
        std::string description;
        uint64_t nonce{0};
        uint64_t expiry{0};

        Hash32 struct_hash() const;
    };

    /** SHA256(0x19 0x01 || domain separator || struct hash) */
    Hash32 consent_digest(const SigningDomain &domain, const DelegatedConsent &consent);

    /** Agent-side signing of a consent, producing the recoverable signature bytes. */
    Bytes sign_consent(
        const crypto::Ed25519KeyPair &agent_key,
        const SigningDomain &domain,
        const DelegatedConsent &consent);

} // namespace agentreg
