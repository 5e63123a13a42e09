#include "credential.hpp"

#include <sstream>

#include "json_util.hpp"

namespace cen {

bool Credential::expired(Clock::time_point now) const {
    if (!expiry) return false;
    return now >= *expiry - std::chrono::seconds(kExpirySkewSeconds);
}

bool Credential::valid(Clock::time_point now) const {
    return !token.empty() && !expired(now);
}

std::string Credential::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"token\": \"" << json_escape(token) << "\", ";
    oss << "\"refresh_token\": \"" << json_escape(refresh_token) << "\", ";
    oss << "\"token_uri\": \"" << json_escape(token_uri) << "\", ";
    oss << "\"client_id\": \"" << json_escape(client_id) << "\", ";
    oss << "\"client_secret\": \"" << json_escape(client_secret) << "\", ";
    oss << "\"scopes\": [";
    for (size_t i = 0; i < scopes.size(); ++i) {
        if (i) oss << ", ";
        oss << '"' << json_escape(scopes[i]) << '"';
    }
    oss << "]";
    if (expiry) oss << ", \"expiry\": \"" << format_utc_iso(*expiry) << "\"";
    oss << "}";
    return oss.str();
}

Status credential_from_json(const std::string& json,
                            const std::vector<std::string>& default_scopes,
                            Credential& out) {
    JsonObject obj;
    std::string err;
    if (!parse_json_object(json, obj, &err)) {
        return Status::parse_error("token JSON: " + err);
    }

    Credential c;
    c.token = json_string(obj, "token");
    c.refresh_token = json_string(obj, "refresh_token");
    c.client_id = json_string(obj, "client_id");
    c.client_secret = json_string(obj, "client_secret");
    for (const char* required : {"refresh_token", "client_id", "client_secret"}) {
        if (json_string(obj, required).empty()) {
            return Status::parse_error(std::string("token JSON missing field: ") + required);
        }
    }

    std::string uri = json_string(obj, "token_uri");
    if (!uri.empty()) c.token_uri = uri;

    auto scopes = obj.find("scopes");
    if (scopes != obj.end() && scopes->second.kind == JsonField::Kind::kStringArray &&
        !scopes->second.items.empty()) {
        c.scopes = scopes->second.items;
    } else if (scopes != obj.end() && scopes->second.kind == JsonField::Kind::kString) {
        c.scopes = split_list(scopes->second.text, ' ');
    } else {
        c.scopes = default_scopes;
    }

    std::string expiry = json_string(obj, "expiry");
    if (!expiry.empty()) {
        c.expiry = parse_utc_iso(expiry);
        if (!c.expiry) return Status::parse_error("token JSON has malformed expiry: " + expiry);
    }

    out = std::move(c);
    return Status::ok_status();
}

}  // namespace cen
