#include "agentreg/events.hpp"
#include "agentreg/crypto.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace agentreg
{

    nlohmann::json Event::to_json() const
    {
        return nlohmann::json{{"name", name},
                              {"args", args},
                              {"sequence", sequence},
                              {"timestamp", timestamp},
                              {"chain_hash", chain_hash}};
    }

    Result<Event> Event::from_json(const nlohmann::json &j)
    {
        try
        {
            Event e;
            e.name = j.at("name").get<std::string>();
            e.args = j.at("args");
            e.sequence = j.at("sequence").get<uint64_t>();
            e.timestamp = j.at("timestamp").get<uint64_t>();
            e.chain_hash = j.value("chain_hash", "");
            return e;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(RegistryError::parsing(std::string("Malformed event: ") + e.what()));
        }
    }

    namespace events
    {
        Event agent_registered(AgentId agent_id, const Address &owner, const std::string &domain,
                               const std::string &did)
        {
            return Event{std::string(kAgentRegistered),
                         {{"agent_id", agent_id}, {"owner", to_hex(owner)}, {"domain", domain}, {"did", did}}};
        }

        Event agent_updated(AgentId agent_id, const std::vector<std::string> &updated_fields,
                            const Address &owner, const std::string &domain, const std::string &did)
        {
            return Event{std::string(kAgentUpdated),
                         {{"agent_id", agent_id},
                          {"updated_fields", updated_fields},
                          {"owner", to_hex(owner)},
                          {"domain", domain},
                          {"did", did}}};
        }

        Event agent_developer_linked(AgentId agent_id, const std::string &developer_did)
        {
            return Event{std::string(kAgentDeveloperLinked),
                         {{"agent_id", agent_id}, {"developer_did", developer_did}}};
        }

        Event feedback_authorized(AgentId client_agent_id, AgentId server_agent_id, const Hash32 &auth_token)
        {
            return Event{std::string(kFeedbackAuthorized),
                         {{"client_agent_id", client_agent_id},
                          {"server_agent_id", server_agent_id},
                          {"auth_token", to_hex(auth_token)}}};
        }

        Event validation_requested(AgentId validator_agent_id, AgentId server_agent_id, const Hash32 &data_hash)
        {
            return Event{std::string(kValidationRequested),
                         {{"validator_agent_id", validator_agent_id},
                          {"server_agent_id", server_agent_id},
                          {"data_hash", to_hex(data_hash)}}};
        }

        Event validation_responded(AgentId validator_agent_id, AgentId server_agent_id, const Hash32 &data_hash,
                                   uint8_t score)
        {
            return Event{std::string(kValidationResponded),
                         {{"validator_agent_id", validator_agent_id},
                          {"server_agent_id", server_agent_id},
                          {"data_hash", to_hex(data_hash)},
                          {"score", score}}};
        }
    } // namespace events

    // ============================================================================
    // JsonlEventSink
    // ============================================================================

    JsonlEventSink::JsonlEventSink(std::string path) : path_(std::move(path)) {}

    Result<void> JsonlEventSink::append(const Event &event)
    {
        std::lock_guard lock(mutex_);
        std::ofstream out(path_, std::ios::app);
        if (!out.is_open())
        {
            return std::unexpected(RegistryError::io("Unable to open event file: " + path_));
        }
        out << event.to_json().dump() << '\n';
        if (!out)
        {
            return std::unexpected(RegistryError::io("Failed writing event file: " + path_));
        }
        return {};
    }

    Result<std::vector<Event>> JsonlEventSink::read_all(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::unexpected(RegistryError::io("Unable to open event file: " + path));
        }

        std::vector<Event> out;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.empty())
                continue;
            auto parsed = nlohmann::json::parse(line, nullptr, false);
            if (parsed.is_discarded())
            {
                return std::unexpected(RegistryError::parsing("Invalid JSON line in " + path));
            }
            auto event = Event::from_json(parsed);
            if (!event)
                return std::unexpected(event.error());
            out.push_back(std::move(*event));
        }
        return out;
    }

    // ============================================================================
    // EventLog
    // ============================================================================

    EventLog::EventLog() = default;

    std::string EventLog::compute_chain_hash(const std::string &previous, const Event &event)
    {
        nlohmann::json body{{"name", event.name},
                            {"args", event.args},
                            {"sequence", event.sequence},
                            {"timestamp", event.timestamp}};
        return to_hex(crypto::SHA256::hash(previous + body.dump()));
    }

    Event EventLog::emit(Event event, uint64_t timestamp)
    {
        std::vector<std::shared_ptr<EventSink>> sinks;
        {
            std::lock_guard lock(mutex_);
            event.sequence = events_.size() + 1;
            event.timestamp = timestamp;
            event.chain_hash = compute_chain_hash(events_.empty() ? std::string() : events_.back().chain_hash, event);
            events_.push_back(event);
            sinks = sinks_;
        }

        spdlog::info("event {} #{} {}", event.name, event.sequence, event.args.dump());

        for (const auto &sink : sinks)
        {
            if (auto res = sink->append(event); !res)
            {
                spdlog::error("event sink rejected {} #{}: {}", event.name, event.sequence, res.error().what());
            }
        }
        return event;
    }

    void EventLog::add_sink(std::shared_ptr<EventSink> sink)
    {
        std::lock_guard lock(mutex_);
        sinks_.push_back(std::move(sink));
    }

    std::vector<Event> EventLog::events() const
    {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::vector<Event> EventLog::events_named(std::string_view name) const
    {
        std::lock_guard lock(mutex_);
        std::vector<Event> out;
        for (const auto &e : events_)
        {
            if (e.name == name)
                out.push_back(e);
        }
        return out;
    }

    std::size_t EventLog::size() const
    {
        std::lock_guard lock(mutex_);
        return events_.size();
    }

    std::optional<std::string> EventLog::head() const
    {
        std::lock_guard lock(mutex_);
        if (events_.empty())
            return std::nullopt;
        return events_.back().chain_hash;
    }

    bool EventLog::verify_chain() const
    {
        std::lock_guard lock(mutex_);
        std::string previous;
        for (const auto &e : events_)
        {
            if (compute_chain_hash(previous, e) != e.chain_hash)
                return false;
            previous = e.chain_hash;
        }
        return true;
    }

} // namespace agentreg
