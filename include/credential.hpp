#pragma once

#include <optional>
#include <string>
#include <vector>

#include "status.hpp"
#include "utils.hpp"

namespace cen {

inline const std::string kDefaultTokenUri = "https://oauth2.googleapis.com/token";
inline const std::string kGmailSendScope = "https://www.googleapis.com/auth/gmail.send";

// OAuth "authorized user" token material.
struct Credential {
    std::string token;
    std::string refresh_token;
    std::string token_uri{kDefaultTokenUri};
    std::string client_id;
    std::string client_secret;
    std::vector<std::string> scopes;
    std::optional<Clock::time_point> expiry;  // none: never expires

    // Seconds before expiry at which the token is already treated as expired.
    static constexpr int kExpirySkewSeconds = 10;

    bool expired(Clock::time_point now = Clock::now()) const;
    bool valid(Clock::time_point now = Clock::now()) const;
    bool can_refresh() const { return !refresh_token.empty(); }

    std::string to_json() const;
};

// Parses the persisted JSON shape. `default_scopes` fills in when the blob
// carries none. refresh_token, client_id and client_secret are mandatory.
Status credential_from_json(const std::string& json,
                            const std::vector<std::string>& default_scopes,
                            Credential& out);

}  // namespace cen
