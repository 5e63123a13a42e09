#pragma once

#include <optional>
#include <string>
#include <vector>

#include "credential.hpp"

namespace cen {

struct OAuthClientConfig {
    std::string client_id;
    std::string client_secret;
    std::vector<std::string> scopes{kGmailSendScope};
    std::string auth_uri{"https://accounts.google.com/o/oauth2/auth"};
    std::string token_uri{kDefaultTokenUri};
};

// Installed-app OAuth2 endpoints. Failures throw AuthError.
class OAuthProvider {
public:
    virtual ~OAuthProvider() = default;

    virtual std::string authorization_url(const std::string& redirect_uri,
                                          const std::string& state,
                                          const std::optional<std::string>& login_hint) const = 0;
    virtual Credential exchange_code(const std::string& code, const std::string& redirect_uri) = 0;
    virtual Credential refresh(const Credential& cred) = 0;
};

class GoogleOAuthClient final : public OAuthProvider {
public:
    explicit GoogleOAuthClient(OAuthClientConfig cfg);

    const OAuthClientConfig& config() const { return cfg_; }

    std::string authorization_url(const std::string& redirect_uri,
                                  const std::string& state,
                                  const std::optional<std::string>& login_hint) const override;
    Credential exchange_code(const std::string& code, const std::string& redirect_uri) override;
    Credential refresh(const Credential& cred) override;

private:
    Credential post_token_request(const std::string& token_uri,
                                  const std::vector<std::pair<std::string, std::string>>& form,
                                  const Credential& base) const;

    OAuthClientConfig cfg_;
};

}  // namespace cen
