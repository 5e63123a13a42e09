#pragma once

#include <stdexcept>
#include <string>

namespace cen {

// Missing or malformed settings, unusable camera, no callback port.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Every candidate callback port was already taken.
class NoPortAvailableError : public ConfigError {
public:
    explicit NoPortAvailableError(const std::string& what) : ConfigError(what) {}
};

// Consent flow or token endpoint failure.
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& what) : std::runtime_error(what) {}
};

class AuthTimeoutError : public AuthError {
public:
    explicit AuthTimeoutError(const std::string& what) : AuthError(what) {}
};

// Mail transport rejected or never received the message.
class SendError : public std::runtime_error {
public:
    explicit SendError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace cen
