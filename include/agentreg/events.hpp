#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentreg
{

    /**
     * Event emitted by a committed state transition. Off-ledger indexers
     * consume these, so names and argument keys are a stable contract.
     */
    struct Event
    {
        std::string name;
        nlohmann::json args;
        uint64_t sequence{0};
        uint64_t timestamp{0};
        std::string chain_hash;

        nlohmann::json to_json() const;
        static Result<Event> from_json(const nlohmann::json &j);
    };

    namespace events
    {
        inline constexpr std::string_view kAgentRegistered = "AgentRegistered";
        inline constexpr std::string_view kAgentUpdated = "AgentUpdated";
        inline constexpr std::string_view kAgentDeveloperLinked = "AgentDeveloperLinked";
        inline constexpr std::string_view kFeedbackAuthorized = "FeedbackAuthorized";
        inline constexpr std::string_view kValidationRequested = "ValidationRequested";
        inline constexpr std::string_view kValidationResponded = "ValidationResponded";

        Event agent_registered(AgentId agent_id, const Address &owner, const std::string &domain,
                               const std::string &did);

        Event agent_updated(AgentId agent_id, const std::vector<std::string> &updated_fields,
                            const Address &owner, const std::string &domain, const std::string &did);

        Event agent_developer_linked(AgentId agent_id, const std::string &developer_did);

        Event feedback_authorized(AgentId client_agent_id, AgentId server_agent_id, const Hash32 &auth_token);

        Event validation_requested(AgentId validator_agent_id, AgentId server_agent_id, const Hash32 &data_hash);

        Event validation_responded(AgentId validator_agent_id, AgentId server_agent_id, const Hash32 &data_hash,
                                   uint8_t score);
    } // namespace events

    /**
     * Destination for emitted events (file, database, ...).
     */
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual Result<void> append(const Event &event) = 0;
    };

    /** Append-only JSON Lines file, one event per line. */
    class JsonlEventSink : public EventSink
    {
    public:
        explicit JsonlEventSink(std::string path);

        Result<void> append(const Event &event) override;

        static Result<std::vector<Event>> read_all(const std::string &path);

    private:
        std::string path_;
        std::mutex mutex_;
    };

    /**
     * EventLog sequences events and links them with hashes for tamper
     * detection: chain_hash = SHA256(previous chain hash || event JSON).
     */
    class EventLog
    {
    public:
        EventLog();

        /** Sequence, chain, log and fan out an event. Returns the stored copy. */
        Event emit(Event event, uint64_t timestamp);

        void add_sink(std::shared_ptr<EventSink> sink);

        std::vector<Event> events() const;

        std::vector<Event> events_named(std::string_view name) const;

        std::size_t size() const;

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        /** Recompute every link; false if any event was altered. */
        bool verify_chain() const;

        static std::string compute_chain_hash(const std::string &previous, const Event &event);

    private:
        mutable std::mutex mutex_;
        std::vector<Event> events_;
        std::vector<std::shared_ptr<EventSink>> sinks_;
    };

} // namespace agentreg
