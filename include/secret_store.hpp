#pragma once

#include <optional>
#include <string>

#include "status.hpp"

namespace cen {

inline const std::string kKeyringService = "cen-gmail";
inline const std::string kKeyringAccount = "cen-user";

// OS secret store holding one string per (service, account) pair.
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual std::optional<std::string> get(const std::string& service, const std::string& account) = 0;
    virtual Status set(const std::string& service, const std::string& account, const std::string& secret) = 0;
};

// freedesktop Secret Service through libsecret's `secret-tool`. Fails with
// kUnavailable where no session keyring runs (containers, headless hosts).
class SecretToolStore final : public SecretStore {
public:
    explicit SecretToolStore(std::string tool = "secret-tool");

    std::optional<std::string> get(const std::string& service, const std::string& account) override;
    Status set(const std::string& service, const std::string& account, const std::string& secret) override;

private:
    std::string tool_;
};

}  // namespace cen
