#pragma once

#include "shaderchain/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace shaderchain {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    OutOfRange,

    // Cryptography errors
    CryptoInitFailed,

    // Shader errors
    ShaderUnknown,
    ShaderSeedMissing,

    // Chain errors
    ChainImportFailed,

    // Protocol errors
    ProtocolInvalidMessage,

    // Access errors
    AccessTokenInvalid,
    AccessTokenExpired,

    // Configuration errors
    ConfigNotFound,
    ConfigInvalid
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for recoverable failures
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    // Check if result contains a value
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Unwrap or throw custom error
    T expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
        return value();
    }

    // Convert to optional
    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Custom exception classes
class ShaderChainException : public std::runtime_error {
public:
    ShaderChainException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class CryptoException : public ShaderChainException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : ShaderChainException(code, "Crypto error: " + message) {}
};

class ProtocolException : public ShaderChainException {
public:
    ProtocolException(ErrorCode code, const std::string& message)
        : ShaderChainException(code, "Protocol error: " + message) {}
};

/**
 * Raised when a shader id is not part of the registry.
 */
class UnknownShaderError : public ProtocolException {
public:
    explicit UnknownShaderError(const std::string& shader_id)
        : ProtocolException(ErrorCode::ShaderUnknown, "Unknown shader: " + shader_id),
          shader_id_(shader_id) {}

    const std::string& shader_id() const { return shader_id_; }

private:
    std::string shader_id_;
};

/**
 * Raised by the client solver when a challenge names a shader it has no
 * seed for or does not recognize. No response is produced.
 */
class MissingSeedError : public ProtocolException {
public:
    explicit MissingSeedError(const std::string& shader_id)
        : ProtocolException(ErrorCode::ShaderSeedMissing, "Missing seed for shader " + shader_id),
          shader_id_(shader_id) {}

    const std::string& shader_id() const { return shader_id_; }

private:
    std::string shader_id_;
};

class ChainImportError : public ProtocolException {
public:
    explicit ChainImportError(const std::string& message)
        : ProtocolException(ErrorCode::ChainImportFailed, "Chain import failed: " + message) {}
};

} // namespace shaderchain
