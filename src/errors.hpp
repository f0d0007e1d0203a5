#pragma once
#include <stdexcept>
#include <string>

namespace rembed {

// Base for every error the library raises on purpose. The execution bridge
// lets these through untouched and wraps anything else in BridgeError.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

enum class ConfigErrorKind { UnknownProvider, MalformedInput, MissingCredential };

inline const char* config_error_kind_to_string(ConfigErrorKind kind) {
    switch (kind) {
        case ConfigErrorKind::UnknownProvider: return "unknown provider";
        case ConfigErrorKind::MalformedInput: return "malformed input";
        case ConfigErrorKind::MissingCredential: return "missing credential";
    }
    return "config error";
}

class ConfigError : public Error {
public:
    ConfigError(ConfigErrorKind kind, const std::string& detail)
        : Error(std::string("Client configuration error (") +
                config_error_kind_to_string(kind) + "): " + detail)
        , kind_(kind) {}

    ConfigErrorKind kind() const { return kind_; }

private:
    ConfigErrorKind kind_;
};

class ClientNotFound : public Error {
public:
    explicit ClientNotFound(const std::string& name)
        : Error("Client with name " + name + " was not registered with rembed_clients.")
        , name_(name) {}

    const std::string& client_name() const { return name_; }

private:
    std::string name_;
};

// Transport, auth, quota or response-shape failure reported by a provider.
// client and stage are filled in by the operation layer when known.
class ProviderError : public Error {
public:
    explicit ProviderError(const std::string& message)
        : Error(message), detail_(message) {}

    ProviderError(const std::string& client, const std::string& stage,
                  const std::string& detail)
        : Error("Client '" + client + "' " + stage + " failed: " + detail)
        , client_(client), stage_(stage), detail_(detail) {}

    const std::string& client_name() const { return client_; }
    const std::string& stage() const { return stage_; }
    const std::string& detail() const { return detail_; }

private:
    std::string client_;
    std::string stage_;
    std::string detail_;
};

class BridgeError : public Error {
public:
    explicit BridgeError(const std::string& message)
        : Error("Execution bridge error: " + message) {}
};

class UnsupportedOperation : public Error {
public:
    UnsupportedOperation(const std::string& client, const std::string& operation)
        : Error("Client '" + client + "' does not support " + operation) {}
};

} // namespace rembed
