#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "credential.hpp"
#include "oauth_client.hpp"
#include "secret_store.hpp"
#include "status.hpp"

namespace cen {

enum class Backend { kKeyring, kFile };

const char* backend_to_string(Backend b);
std::optional<Backend> backend_from_string(const std::string& s);

// Runs the interactive consent flow and returns a fresh credential.
using ReauthorizeFn = std::function<Credential()>;

struct CredentialStoreOptions {
    std::string token_path{"token.json"};
    std::vector<std::string> scopes{kGmailSendScope};
    // Checked in order; the first non-empty variable wins.
    std::vector<std::string> env_vars{"CEN_GMAIL_TOKEN_JSON", "GMAIL_AUTHORIZED_USER", "GMAIL_TOKEN_JSON"};
};

// Token cache across the process cache, an environment blob and the durable
// backends. Callers only ever see a valid credential.
class CredentialStore {
public:
    CredentialStore(OAuthProvider& oauth, SecretStore& keyring, CredentialStoreOptions opts = {});

    std::optional<Credential> load(Backend backend);
    Status save(Backend backend, const Credential& cred);

    // Cache, environment, durable backend, then `reauthorize` as last resort.
    // `force` goes straight to `reauthorize`.
    Credential ensure_valid(Backend backend, const ReauthorizeFn& reauthorize, bool force = false);

    // Like ensure_valid but ignores the environment blob, so the result is
    // always persisted in `backend`.
    Credential login(Backend backend, const ReauthorizeFn& reauthorize, bool force = false);

    std::optional<Credential> load_from_env();

    const CredentialStoreOptions& options() const { return opts_; }

private:
    std::optional<std::string> read_raw(Backend backend);
    Status write_file(const Credential& cred);
    // Parses a blob and refreshes it when expired; nullopt when unusable.
    std::optional<Credential> materialize(const std::string& raw, const std::string& origin,
                                          bool* refreshed = nullptr);
    std::optional<Credential> try_refresh(const Credential& cred, const std::string& origin);
    Credential authorize_and_save(Backend backend, const ReauthorizeFn& reauthorize);

    OAuthProvider& oauth_;
    SecretStore& keyring_;
    CredentialStoreOptions opts_;

    std::mutex cache_mu_;
    std::optional<Credential> cached_;
};

}  // namespace cen
