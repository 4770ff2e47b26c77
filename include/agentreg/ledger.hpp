#pragma once

#include "config.hpp"
#include "events.hpp"
#include "identity_registry.hpp"
#include "reputation_registry.hpp"
#include "types.hpp"
#include "validation_registry.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentreg
{

    /**
     * The three registries sharing one event log and one logical clock.
     *
     * apply() admits JSON transactions one at a time, in order, and turns
     * every outcome into a receipt:
     *
     *   {"op": "...", "ok": true,  "result": {...}}
     *   {"op": "...", "ok": false, "error": {"code": "...", "category": "...", "message": "..."}}
     */
    class Ledger
    {
    public:
        explicit Ledger(const RegistryConfig &cfg = RegistryConfig{});

        /** Ledger with the event sinks named in cfg.events attached. */
        static Result<std::unique_ptr<Ledger>> open(const RegistryConfig &cfg);

        nlohmann::json apply(const nlohmann::json &tx);

        /** Apply a JSON array of transactions, returning one receipt each. */
        Result<std::vector<nlohmann::json>> replay(const nlohmann::json &txs);

        IdentityRegistry &identity() { return *identity_; }
        ReputationRegistry &reputation() { return *reputation_; }
        ValidationRegistry &validation() { return *validation_; }
        EventLog &events() { return *events_; }

        uint64_t now() const;

    private:
        Result<CallContext> context_for(const nlohmann::json &tx);
        Result<nlohmann::json> dispatch(const std::string &op, const nlohmann::json &tx, const CallContext &ctx);

        std::shared_ptr<EventLog> events_;
        std::shared_ptr<IdentityRegistry> identity_;
        std::unique_ptr<ReputationRegistry> reputation_;
        std::unique_ptr<ValidationRegistry> validation_;

        mutable std::mutex mutex_;
        uint64_t clock_{0};
    };

} // namespace agentreg
