#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agentreg
{

    /** Which identifying fields a deployment insists on. */
    enum class IdentifierRequirement
    {
        None,
        Domain,
        Did,
        DomainOrDid
    };

    std::string_view identifier_requirement_name(IdentifierRequirement req);

    Result<IdentifierRequirement> identifier_requirement_from_string(std::string_view s);

    /** InvalidInput when the supplied identifiers do not satisfy the requirement. */
    Result<void> check_identifiers(IdentifierRequirement req, std::string_view domain, std::string_view did);

    /**
     * Payment rule applied to registrations.
     * check() runs before any state change; settle() only after the
     * registration is committed.
     */
    class FeePolicy
    {
    public:
        virtual ~FeePolicy() = default;

        virtual Result<void> check(const CallContext &ctx) const = 0;

        virtual void settle(const CallContext &ctx) = 0;

        virtual uint64_t fee() const = 0;
    };

    class NoFeePolicy : public FeePolicy
    {
    public:
        Result<void> check(const CallContext &) const override { return {}; }
        void settle(const CallContext &) override {}
        uint64_t fee() const override { return 0; }
    };

    /**
     * Fixed fee destroyed on registration. Overpayment is burned as well.
     */
    class BurnFeePolicy : public FeePolicy
    {
    public:
        explicit BurnFeePolicy(uint64_t amount);

        Result<void> check(const CallContext &ctx) const override;
        void settle(const CallContext &ctx) override;
        uint64_t fee() const override { return amount_; }

        uint64_t burned_total() const { return burned_total_; }

    private:
        uint64_t amount_;
        uint64_t burned_total_{0};
    };

    /** NoFeePolicy for 0, BurnFeePolicy otherwise. */
    std::unique_ptr<FeePolicy> make_fee_policy(uint64_t amount);

} // namespace agentreg
