#include "oauth_client.hpp"

#include <sstream>
#include <stdexcept>

#include <httplib.h>

#include "errors.hpp"
#include "json_util.hpp"

namespace cen {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& form) {
    std::string out;
    for (const auto& kv : form) {
        if (!out.empty()) out += '&';
        out += url_encode(kv.first) + "=" + url_encode(kv.second);
    }
    return out;
}

// Whole, non-negative seconds no larger than ten years.
long parse_expires_in(const std::string& text) {
    long v = 0;
    try {
        size_t used = 0;
        v = std::stol(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
    } catch (const std::logic_error&) {
        throw AuthError("token endpoint reply has malformed expires_in: " + text);
    }
    if (v < 0 || v > 10L * 365 * 24 * 3600) {
        throw AuthError("token endpoint reply has out-of-range expires_in: " + text);
    }
    return v;
}

}  // namespace

GoogleOAuthClient::GoogleOAuthClient(OAuthClientConfig cfg) : cfg_(std::move(cfg)) {}

std::string GoogleOAuthClient::authorization_url(const std::string& redirect_uri,
                                                 const std::string& state,
                                                 const std::optional<std::string>& login_hint) const {
    std::vector<std::pair<std::string, std::string>> q = {
        {"response_type", "code"},
        {"client_id", cfg_.client_id},
        {"redirect_uri", redirect_uri},
        {"scope", join(cfg_.scopes, " ")},
        {"state", state},
        {"access_type", "offline"},
        {"prompt", "consent"},
    };
    if (login_hint && !login_hint->empty()) q.emplace_back("login_hint", *login_hint);
    return cfg_.auth_uri + "?" + form_encode(q);
}

Credential GoogleOAuthClient::exchange_code(const std::string& code, const std::string& redirect_uri) {
    Credential base;
    base.token_uri = cfg_.token_uri;
    base.client_id = cfg_.client_id;
    base.client_secret = cfg_.client_secret;
    base.scopes = cfg_.scopes;
    return post_token_request(cfg_.token_uri,
                              {{"code", code},
                               {"client_id", cfg_.client_id},
                               {"client_secret", cfg_.client_secret},
                               {"redirect_uri", redirect_uri},
                               {"grant_type", "authorization_code"}},
                              base);
}

Credential GoogleOAuthClient::refresh(const Credential& cred) {
    if (!cred.can_refresh()) throw AuthError("credential has no refresh token");
    return post_token_request(cred.token_uri.empty() ? cfg_.token_uri : cred.token_uri,
                              {{"refresh_token", cred.refresh_token},
                               {"client_id", cred.client_id},
                               {"client_secret", cred.client_secret},
                               {"grant_type", "refresh_token"}},
                              cred);
}

Credential GoogleOAuthClient::post_token_request(const std::string& token_uri,
                                                 const std::vector<std::pair<std::string, std::string>>& form,
                                                 const Credential& base) const {
    auto target = split_url(token_uri);
    httplib::Client cli(target.first);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(30);

    auto res = cli.Post(target.second, form_encode(form), "application/x-www-form-urlencoded");
    if (!res) {
        throw AuthError("token endpoint unreachable: " + httplib::to_string(res.error()));
    }

    JsonObject body;
    std::string err;
    if (!parse_json_object(res->body, body, &err)) {
        throw AuthError("token endpoint returned HTTP " + std::to_string(res->status) +
                        " with unparseable body: " + err);
    }
    if (res->status != 200) {
        std::ostringstream oss;
        oss << "token endpoint returned HTTP " << res->status;
        std::string code = json_string(body, "error");
        if (!code.empty()) oss << ": " << code;
        std::string desc = json_string(body, "error_description");
        if (!desc.empty()) oss << " (" << desc << ")";
        throw AuthError(oss.str());
    }

    Credential out = base;
    out.token = json_string(body, "access_token");
    if (out.token.empty()) throw AuthError("token endpoint reply has no access_token");

    std::string refresh = json_string(body, "refresh_token");
    if (!refresh.empty()) out.refresh_token = refresh;

    std::string scope = json_string(body, "scope");
    if (!scope.empty()) out.scopes = split_list(scope, ' ');

    auto expires = body.find("expires_in");
    if (expires != body.end() && expires->second.kind == JsonField::Kind::kNumber) {
        auto now = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
        out.expiry = now + std::chrono::seconds(parse_expires_in(expires->second.text));
    } else {
        out.expiry.reset();
    }
    return out;
}

}  // namespace cen
