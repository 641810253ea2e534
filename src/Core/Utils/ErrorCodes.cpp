/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for GsaConf error codes
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/ErrorCodes.hpp>

namespace Gsa {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:             return "Success";

        case ErrorCode::SystemError:         return "System error";
        case ErrorCode::AllocationFailed:    return "Memory allocation failed";

        case ErrorCode::CryptoError:         return "Cryptographic operation failed";
        case ErrorCode::HashFailed:          return "Hash computation failed";
        case ErrorCode::InvalidKey:          return "Invalid key";

        case ErrorCode::ConfigError:         return "Configuration error";
        case ErrorCode::ConfigMissing:       return "Required setting missing";
        case ErrorCode::ConfigInvalid:       return "Invalid setting value";
        case ErrorCode::ConfigFileNotFound:  return "Settings file not found";
        case ErrorCode::ConfigParseFailed:   return "Settings file could not be parsed";

        case ErrorCode::IOError:             return "I/O error";
        case ErrorCode::FileNotFound:        return "File does not exist";
        case ErrorCode::FileAccessDenied:    return "File access denied";
        case ErrorCode::FileAlreadyExists:   return "Output file exists";
        case ErrorCode::FileReadError:       return "File read error";
        case ErrorCode::FileWriteError:      return "File write error";
        case ErrorCode::FileTooLarge:        return "File too large";
        case ErrorCode::InvalidPath:         return "Invalid file path";
        case ErrorCode::AccessDenied:        return "Access denied";

        case ErrorCode::ParseError:          return "Parse error";
        case ErrorCode::XmlParseFailed:      return "Document is not well-formed XML";

        case ErrorCode::DocumentError:       return "Not a valid appliance configuration document";
        case ErrorCode::ElementNotFound:     return "Required element missing from configuration document";
        case ErrorCode::DuplicateElement:    return "Required element occurs more than once in configuration document";
        case ErrorCode::UnexpectedNodeType:  return "Element holds an unexpected node type";
        case ErrorCode::SerializationFailed: return "Document serialization failed";

        case ErrorCode::InternalError:       return "Internal error";
        case ErrorCode::InvalidState:        return "Invalid state";
        case ErrorCode::NullPointer:         return "Null pointer";
        case ErrorCode::InvalidArgument:     return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Crypto:   return "Crypto";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Document: return "Document";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Gsa
