#include "agentreg/types.hpp"

namespace agentreg
{

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::UnauthorizedRegistration:
            return "UnauthorizedRegistration";
        case ErrorCode::UnauthorizedUpdate:
            return "UnauthorizedUpdate";
        case ErrorCode::UnauthorizedFeedback:
            return "UnauthorizedFeedback";
        case ErrorCode::UnauthorizedValidator:
            return "UnauthorizedValidator";
        case ErrorCode::AgentNotFound:
            return "AgentNotFound";
        case ErrorCode::ValidationRequestNotFound:
            return "ValidationRequestNotFound";
        case ErrorCode::DIDNotRegistered:
            return "DIDNotRegistered";
        case ErrorCode::DomainAlreadyRegistered:
            return "DomainAlreadyRegistered";
        case ErrorCode::DIDAlreadyRegistered:
            return "DIDAlreadyRegistered";
        case ErrorCode::AddressAlreadyRegistered:
            return "AddressAlreadyRegistered";
        case ErrorCode::FeedbackAlreadyAuthorized:
            return "FeedbackAlreadyAuthorized";
        case ErrorCode::ValidationAlreadyResponded:
            return "ValidationAlreadyResponded";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::InvalidAddress:
            return "InvalidAddress";
        case ErrorCode::InvalidDataHash:
            return "InvalidDataHash";
        case ErrorCode::InvalidResponse:
            return "InvalidResponse";
        case ErrorCode::DIDAddressMismatch:
            return "DIDAddressMismatch";
        case ErrorCode::InvalidDeveloperDID:
            return "InvalidDeveloperDID";
        case ErrorCode::InvalidAgentSignature:
            return "InvalidAgentSignature";
        case ErrorCode::SignatureExpired:
            return "SignatureExpired";
        case ErrorCode::InsufficientFee:
            return "InsufficientFee";
        case ErrorCode::RequestExpired:
            return "RequestExpired";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        }
        return "Unknown";
    }

    ErrorCategory error_category(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::UnauthorizedRegistration:
        case ErrorCode::UnauthorizedUpdate:
        case ErrorCode::UnauthorizedFeedback:
        case ErrorCode::UnauthorizedValidator:
            return ErrorCategory::Authorization;
        case ErrorCode::AgentNotFound:
        case ErrorCode::ValidationRequestNotFound:
        case ErrorCode::DIDNotRegistered:
            return ErrorCategory::NotFound;
        case ErrorCode::DomainAlreadyRegistered:
        case ErrorCode::DIDAlreadyRegistered:
        case ErrorCode::AddressAlreadyRegistered:
        case ErrorCode::FeedbackAlreadyAuthorized:
        case ErrorCode::ValidationAlreadyResponded:
            return ErrorCategory::Conflict;
        case ErrorCode::InvalidInput:
        case ErrorCode::InvalidAddress:
        case ErrorCode::InvalidDataHash:
        case ErrorCode::InvalidResponse:
        case ErrorCode::DIDAddressMismatch:
        case ErrorCode::InvalidDeveloperDID:
        case ErrorCode::InvalidAgentSignature:
        case ErrorCode::SignatureExpired:
        case ErrorCode::InsufficientFee:
            return ErrorCategory::Validation;
        case ErrorCode::RequestExpired:
            return ErrorCategory::Temporal;
        case ErrorCode::ConfigError:
        case ErrorCode::CryptoError:
        case ErrorCode::StorageError:
        case ErrorCode::IOError:
        case ErrorCode::ParsingError:
            return ErrorCategory::Ambient;
        }
        return ErrorCategory::Ambient;
    }

    std::string_view error_category_name(ErrorCategory category)
    {
        switch (category)
        {
        case ErrorCategory::Authorization:
            return "authorization";
        case ErrorCategory::NotFound:
            return "not_found";
        case ErrorCategory::Conflict:
            return "conflict";
        case ErrorCategory::Validation:
            return "validation";
        case ErrorCategory::Temporal:
            return "temporal";
        case ErrorCategory::Ambient:
            return "ambient";
        }
        return "unknown";
    }

} // namespace agentreg
