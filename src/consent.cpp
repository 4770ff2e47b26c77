#include "agentreg/consent.hpp"

namespace agentreg
{

    namespace
    {
        constexpr const char *kDomainType =
            "SigningDomain(string name,string version,uint64 chainId,address verifyingContract)";
        constexpr const char *kConsentType =
            "DelegatedConsent(string developerDID,string agentDID,address agentAddress,"
            "string description,uint64 nonce,uint64 expiry)";

        template <std::size_t N>
        void append(Bytes &out, const std::array<uint8_t, N> &bytes)
        {
            out.insert(out.end(), bytes.begin(), bytes.end());
        }

        // Dynamic fields are hashed before encoding so every field is fixed width.
        void append_string_hash(Bytes &out, const std::string &text)
        {
            append(out, crypto::SHA256::hash(text));
        }
    } // namespace

    Hash32 SigningDomain::separator() const
    {
        Bytes encoded;
        append_string_hash(encoded, kDomainType);
        append_string_hash(encoded, name);
        append_string_hash(encoded, version);
        append_u64_be(encoded, chain_id);
        append(encoded, verifying_contract);
        return crypto::SHA256::hash(encoded);
    }

    Hash32 DelegatedConsent::struct_hash() const
    {
        Bytes encoded;
        append_string_hash(encoded, kConsentType);
        append_string_hash(encoded, developer_did);
        append_string_hash(encoded, agent_did);
        append(encoded, agent_address);
        append_string_hash(encoded, description);
        append_u64_be(encoded, nonce);
        append_u64_be(encoded, expiry);
        return crypto::SHA256::hash(encoded);
    }

    Hash32 consent_digest(const SigningDomain &domain, const DelegatedConsent &consent)
    {
        Bytes encoded{0x19, 0x01};
        append(encoded, domain.separator());
        append(encoded, consent.struct_hash());
        return crypto::SHA256::hash(encoded);
    }

    Bytes sign_consent(
        const crypto::Ed25519KeyPair &agent_key,
        const SigningDomain &domain,
        const DelegatedConsent &consent)
    {
        auto sig = crypto::sign_recoverable(agent_key, consent_digest(domain, consent));
        return Bytes(sig.begin(), sig.end());
    }

} // namespace agentreg
