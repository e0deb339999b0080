#pragma once
/*
 * Errors
 *
 * Purpose: exceptions raised synchronously by construction and control calls.
 * Note: the tick loop itself never throws.
 */
#include <exception>
#include <string>

enum ErrorCode {
  ERR_NONE = 0,
  ERR_CONFIG,
  ERR_INVALID_TRANSITION,
  ERR_ALREADY_STARTED
};

class MinerException : public std::exception {
public:
  MinerException(const std::string& msg, ErrorCode code) : message_(msg), code_(code) {}
  const char* what() const noexcept override { return message_.c_str(); }
  ErrorCode code() const { return code_; }
private:
  std::string message_;
  ErrorCode code_;
};

class ConfigurationError : public MinerException {
public:
  explicit ConfigurationError(const std::string& msg) : MinerException(msg, ERR_CONFIG) {}
};

class InvalidTransitionError : public MinerException {
public:
  explicit InvalidTransitionError(const std::string& msg, ErrorCode code = ERR_INVALID_TRANSITION)
    : MinerException(msg, code) {}
};

class AlreadyStartedError : public InvalidTransitionError {
public:
  explicit AlreadyStartedError(const std::string& msg) : InvalidTransitionError(msg, ERR_ALREADY_STARTED) {}
};
