#pragma once

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace agentreg
{

    /**
     * Error kinds surfaced by registry operations.
     * Every rejected precondition maps to exactly one of these.
     */
    enum class ErrorCode
    {
        // authorization
        UnauthorizedRegistration,
        UnauthorizedUpdate,
        UnauthorizedFeedback,
        UnauthorizedValidator,

        // not found
        AgentNotFound,
        ValidationRequestNotFound,
        DIDNotRegistered,

        // conflict
        DomainAlreadyRegistered,
        DIDAlreadyRegistered,
        AddressAlreadyRegistered,
        FeedbackAlreadyAuthorized,
        ValidationAlreadyResponded,

        // validation
        InvalidInput,
        InvalidAddress,
        InvalidDataHash,
        InvalidResponse,
        DIDAddressMismatch,
        InvalidDeveloperDID,
        InvalidAgentSignature,
        SignatureExpired,
        InsufficientFee,

        // temporal
        RequestExpired,

        // ambient
        ConfigError,
        CryptoError,
        StorageError,
        IOError,
        ParsingError
    };

    enum class ErrorCategory
    {
        Authorization,
        NotFound,
        Conflict,
        Validation,
        Temporal,
        Ambient
    };

    /** Stable PascalCase name of an error code, e.g. "AgentNotFound". */
    std::string_view error_code_name(ErrorCode code);

    ErrorCategory error_category(ErrorCode code);

    std::string_view error_category_name(ErrorCategory category);

    /**
     * Registry error with code and message
     */
    class RegistryError : public std::runtime_error
    {
    public:
        ErrorCode code;

        RegistryError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static RegistryError unauthorized_registration(const std::string &msg)
        {
            return RegistryError(ErrorCode::UnauthorizedRegistration, msg);
        }

        static RegistryError unauthorized_update(const std::string &msg)
        {
            return RegistryError(ErrorCode::UnauthorizedUpdate, msg);
        }

        static RegistryError unauthorized_feedback(const std::string &msg)
        {
            return RegistryError(ErrorCode::UnauthorizedFeedback, msg);
        }

        static RegistryError unauthorized_validator(const std::string &msg)
        {
            return RegistryError(ErrorCode::UnauthorizedValidator, msg);
        }

        static RegistryError agent_not_found(const std::string &msg)
        {
            return RegistryError(ErrorCode::AgentNotFound, msg);
        }

        static RegistryError invalid_input(const std::string &msg)
        {
            return RegistryError(ErrorCode::InvalidInput, msg);
        }

        static RegistryError invalid_address(const std::string &msg)
        {
            return RegistryError(ErrorCode::InvalidAddress, msg);
        }

        static RegistryError did_address_mismatch(const std::string &msg)
        {
            return RegistryError(ErrorCode::DIDAddressMismatch, msg);
        }

        static RegistryError config(const std::string &msg)
        {
            return RegistryError(ErrorCode::ConfigError, msg);
        }

        static RegistryError crypto(const std::string &msg)
        {
            return RegistryError(ErrorCode::CryptoError, msg);
        }

        static RegistryError storage(const std::string &msg)
        {
            return RegistryError(ErrorCode::StorageError, msg);
        }

        static RegistryError io(const std::string &msg)
        {
            return RegistryError(ErrorCode::IOError, msg);
        }

        static RegistryError parsing(const std::string &msg)
        {
            return RegistryError(ErrorCode::ParsingError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, RegistryError>;

    /** Shorthand for building the unexpected side of a Result. */
    inline std::unexpected<RegistryError> fail(ErrorCode code, const std::string &msg)
    {
        return std::unexpected(RegistryError(code, msg));
    }

} // namespace agentreg
