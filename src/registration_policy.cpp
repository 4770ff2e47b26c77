#include "agentreg/registration_policy.hpp"

namespace agentreg
{

    std::string_view identifier_requirement_name(IdentifierRequirement req)
    {
        switch (req)
        {
        case IdentifierRequirement::None:
            return "none";
        case IdentifierRequirement::Domain:
            return "domain";
        case IdentifierRequirement::Did:
            return "did";
        case IdentifierRequirement::DomainOrDid:
            return "domain_or_did";
        }
        return "none";
    }

    Result<IdentifierRequirement> identifier_requirement_from_string(std::string_view s)
    {
        if (s == "none")
            return IdentifierRequirement::None;
        if (s == "domain")
            return IdentifierRequirement::Domain;
        if (s == "did")
            return IdentifierRequirement::Did;
        if (s == "domain_or_did")
            return IdentifierRequirement::DomainOrDid;
        return std::unexpected(RegistryError::config("Invalid identifier requirement: " + std::string(s)));
    }

    Result<void> check_identifiers(IdentifierRequirement req, std::string_view domain, std::string_view did)
    {
        switch (req)
        {
        case IdentifierRequirement::None:
            return {};
        case IdentifierRequirement::Domain:
            if (domain.empty())
                return std::unexpected(RegistryError::invalid_input("Domain is required"));
            return {};
        case IdentifierRequirement::Did:
            if (did.empty())
                return std::unexpected(RegistryError::invalid_input("DID is required"));
            return {};
        case IdentifierRequirement::DomainOrDid:
            if (domain.empty() && did.empty())
                return std::unexpected(RegistryError::invalid_input("Domain or DID is required"));
            return {};
        }
        return {};
    }

    BurnFeePolicy::BurnFeePolicy(uint64_t amount) : amount_(amount) {}

    Result<void> BurnFeePolicy::check(const CallContext &ctx) const
    {
        if (ctx.value < amount_)
        {
            return fail(ErrorCode::InsufficientFee,
                        "Registration fee of " + std::to_string(amount_) + " required, got " +
                            std::to_string(ctx.value));
        }
        return {};
    }

    void BurnFeePolicy::settle(const CallContext &ctx)
    {
        burned_total_ += ctx.value;
    }

    std::unique_ptr<FeePolicy> make_fee_policy(uint64_t amount)
    {
        if (amount == 0)
            return std::make_unique<NoFeePolicy>();
        return std::make_unique<BurnFeePolicy>(amount);
    }

} // namespace agentreg
