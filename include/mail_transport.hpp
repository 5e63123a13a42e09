#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cen {

struct Attachment {
    std::string filename;
    std::string mime_type;  // "image/jpeg"
    std::vector<unsigned char> data;
};

struct MailMessage {
    std::string to;
    std::string subject;
    std::string body;
    std::string from;  // empty: the authenticated account
    std::optional<Attachment> attachment;
};

// RFC 5322 message, multipart/mixed when an attachment is present.
std::string build_mime(const MailMessage& msg, const std::string& boundary);

class MailTransport {
public:
    virtual ~MailTransport() = default;

    // Returns the provider message id. Throws SendError.
    virtual std::string send(const MailMessage& msg) = 0;
};

// Gmail REST users.messages.send with a bearer token obtained per call.
class GmailTransport final : public MailTransport {
public:
    using TokenProvider = std::function<std::string()>;

    explicit GmailTransport(TokenProvider token, std::string api_origin = "https://gmail.googleapis.com");

    std::string send(const MailMessage& msg) override;

private:
    TokenProvider token_;
    std::string api_origin_;
};

}  // namespace cen
