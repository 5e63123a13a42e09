#include "mail_transport.hpp"

#include <sstream>

#include <httplib.h>

#include "errors.hpp"
#include "json_util.hpp"
#include "utils.hpp"

namespace cen {

namespace {

bool is_ascii(const std::string& s) {
    for (unsigned char c : s) {
        if (c >= 0x80) return false;
    }
    return true;
}

// RFC 2047 encoded-word for non-ASCII header values.
std::string encode_header(const std::string& value) {
    if (is_ascii(value)) return value;
    return "=?utf-8?b?" + base64_encode(value) + "?=";
}

std::string wrap76(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); i += 76) {
        out += s.substr(i, 76);
        out += "\r\n";
    }
    return out;
}

std::string normalize_newlines(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r') continue;
        if (s[i] == '\n') out += "\r\n";
        else out.push_back(s[i]);
    }
    return out;
}

}  // namespace

std::string build_mime(const MailMessage& msg, const std::string& boundary) {
    std::ostringstream oss;
    oss << "To: " << msg.to << "\r\n";
    if (!msg.from.empty()) oss << "From: " << msg.from << "\r\n";
    oss << "Subject: " << encode_header(msg.subject) << "\r\n";
    oss << "MIME-Version: 1.0\r\n";

    const std::string text_headers = "Content-Type: text/plain; charset=\"utf-8\"\r\n"
                                     "Content-Transfer-Encoding: base64\r\n";
    const std::string text_body = wrap76(base64_encode(normalize_newlines(msg.body)));

    if (!msg.attachment) {
        oss << text_headers << "\r\n" << text_body;
        return oss.str();
    }

    const Attachment& a = *msg.attachment;
    oss << "Content-Type: multipart/mixed; boundary=\"" << boundary << "\"\r\n\r\n";
    oss << "--" << boundary << "\r\n" << text_headers << "\r\n" << text_body;
    oss << "--" << boundary << "\r\n";
    oss << "Content-Type: " << a.mime_type << "\r\n";
    oss << "Content-Transfer-Encoding: base64\r\n";
    oss << "Content-Disposition: attachment; filename=\"" << a.filename << "\"\r\n\r\n";
    oss << wrap76(base64_encode(a.data.data(), a.data.size()));
    oss << "--" << boundary << "--\r\n";
    return oss.str();
}

GmailTransport::GmailTransport(TokenProvider token, std::string api_origin)
    : token_(std::move(token)), api_origin_(std::move(api_origin)) {}

std::string GmailTransport::send(const MailMessage& msg) {
    const std::string raw = base64url_encode(build_mime(msg, "cen-" + random_hex(12)));
    const std::string payload = "{\"raw\": \"" + raw + "\"}";

    httplib::Client cli(api_origin_);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(120);
    cli.set_bearer_token_auth(token_());

    auto res = cli.Post("/gmail/v1/users/me/messages/send", payload, "application/json");
    if (!res) {
        throw SendError("Gmail send failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw SendError("Gmail send failed: HTTP " + std::to_string(res->status) + ": " + res->body);
    }

    JsonObject body;
    if (!parse_json_object(res->body, body)) return "";
    return json_string(body, "id");
}

}  // namespace cen
