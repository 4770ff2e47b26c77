#pragma once

#include "consent.hpp"
#include "identity_registry.hpp"
#include "registration_policy.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace agentreg
{

    struct IdentityConfig
    {
        IdentifierRequirement identifier_requirement{IdentifierRequirement::None};
        uint64_t registration_fee{0};
        NoncePolicy nonce_policy{NoncePolicy::ConsumeAfterExpiryCheck};
    };

    struct EventsConfig
    {
        std::string jsonl_path;   // empty: no file sink
        std::string rocksdb_path; // empty: no database sink
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct RegistryConfig
    {
        SigningDomain signing_domain{};
        IdentityConfig identity{};
        EventsConfig events{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides
     * (AGENTREG_* variables take precedence over file values).
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<RegistryConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<RegistryConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for debugging/inspection. */
        static nlohmann::json to_json(const RegistryConfig &cfg);

    private:
        static Result<void> apply_env_overrides(RegistryConfig &cfg);
    };

    /** Apply a level name ("trace" .. "off") to the default spdlog logger. */
    Result<void> apply_log_level(const std::string &level);

} // namespace agentreg
