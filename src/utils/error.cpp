#include "shaderchain/error.hpp"
#include <sstream>

namespace shaderchain {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";

        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";

        case ErrorCode::ShaderUnknown: return "Unknown shader";
        case ErrorCode::ShaderSeedMissing: return "Missing shader seed";

        case ErrorCode::ChainImportFailed: return "Chain import failed";

        case ErrorCode::ProtocolInvalidMessage: return "Invalid protocol message";

        case ErrorCode::AccessTokenInvalid: return "Invalid access token";
        case ErrorCode::AccessTokenExpired: return "Access token expired";

        case ErrorCode::ConfigNotFound: return "Configuration not found";
        case ErrorCode::ConfigInvalid: return "Invalid configuration";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace shaderchain
