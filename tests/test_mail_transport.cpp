#include <gtest/gtest.h>

#include <thread>

#include <httplib.h>

#include "errors.hpp"
#include "json_util.hpp"
#include "mail_transport.hpp"
#include "utils.hpp"

using namespace cen;

TEST(Base64, EncodesWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64, UrlVariantSwapsAlphabet) {
    EXPECT_EQ(base64_encode(std::string("\xfb\xff", 2)), "+/8=");
    EXPECT_EQ(base64url_encode(std::string("\xfb\xff", 2)), "-_8=");
}

TEST(BuildMime, PlainMessage) {
    MailMessage msg;
    msg.to = "owner@example.com";
    msg.subject = "Hi";
    msg.body = "Hello";
    std::string mime = build_mime(msg, "b1");

    EXPECT_NE(mime.find("To: owner@example.com\r\n"), std::string::npos);
    EXPECT_NE(mime.find("Subject: Hi\r\n"), std::string::npos);
    EXPECT_EQ(mime.find("From:"), std::string::npos);
    EXPECT_NE(mime.find("text/plain"), std::string::npos);
    EXPECT_NE(mime.find("\r\n\r\nSGVsbG8=\r\n"), std::string::npos);
    EXPECT_EQ(mime.find("multipart"), std::string::npos);
}

TEST(BuildMime, SenderAndEncodedSubject) {
    MailMessage msg;
    msg.to = "a@example.com";
    msg.from = "cam@example.com";
    msg.subject = "Bewegung erkannt \xC3\xBC";
    std::string mime = build_mime(msg, "b1");
    EXPECT_NE(mime.find("From: cam@example.com\r\n"), std::string::npos);
    EXPECT_NE(mime.find("Subject: =?utf-8?b?"), std::string::npos);
}

TEST(BuildMime, AttachmentMakesMultipart) {
    MailMessage msg;
    msg.to = "a@example.com";
    msg.subject = "Motion";
    msg.body = "see attached";
    msg.attachment = Attachment{"snapshot.jpg", "image/jpeg", {0xFF, 0xD8, 0xFF}};
    std::string mime = build_mime(msg, "BOUNDARY42");

    EXPECT_NE(mime.find("multipart/mixed; boundary=\"BOUNDARY42\""), std::string::npos);
    EXPECT_NE(mime.find("--BOUNDARY42\r\nContent-Type: image/jpeg"), std::string::npos);
    EXPECT_NE(mime.find("filename=\"snapshot.jpg\""), std::string::npos);
    EXPECT_NE(mime.find("/9j/\r\n"), std::string::npos);
    EXPECT_NE(mime.find("--BOUNDARY42--\r\n"), std::string::npos);
}

namespace {

class FakeGmail {
public:
    FakeGmail() {
        server_.Post("/gmail/v1/users/me/messages/send", [this](const httplib::Request& req, httplib::Response& res) {
            auth_header = req.get_header_value("Authorization");
            JsonObject body;
            if (parse_json_object(req.body, body)) raw = json_string(body, "raw");
            if (fail) {
                res.status = 503;
                res.set_content(R"({"error": {"code": 503}})", "application/json");
                return;
            }
            res.set_content(R"({"id": "18c2f", "threadId": "18c2f", "labelIds": ["SENT"]})", "application/json");
        });
        port = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeGmail() {
        server_.stop();
        thread_.join();
    }

    std::string origin() const { return "http://127.0.0.1:" + std::to_string(port); }

    int port{0};
    bool fail{false};
    std::string auth_header;
    std::string raw;

private:
    httplib::Server server_;
    std::thread thread_;
};

}  // namespace

TEST(GmailTransport, PostsRawMessageWithBearerToken) {
    FakeGmail gmail;
    int token_calls = 0;
    GmailTransport mail([&] { token_calls++; return std::string("ya29.tok"); }, gmail.origin());

    MailMessage msg;
    msg.to = "owner@example.com";
    msg.subject = "Hi";
    msg.body = "Hello";
    EXPECT_EQ(mail.send(msg), "18c2f");

    EXPECT_EQ(token_calls, 1);
    EXPECT_EQ(gmail.auth_header, "Bearer ya29.tok");
    EXPECT_FALSE(gmail.raw.empty());
    EXPECT_EQ(gmail.raw.find('+'), std::string::npos);
    EXPECT_EQ(gmail.raw.find('/'), std::string::npos);
}

TEST(GmailTransport, HttpErrorIsSendError) {
    FakeGmail gmail;
    gmail.fail = true;
    GmailTransport mail([] { return std::string("tok"); }, gmail.origin());
    MailMessage msg;
    msg.to = "owner@example.com";
    EXPECT_THROW(mail.send(msg), SendError);
}

TEST(GmailTransport, UnreachableServerIsSendError) {
    int port = 0;
    {
        FakeGmail gone;
        port = gone.port;
    }
    GmailTransport mail([] { return std::string("tok"); }, "http://127.0.0.1:" + std::to_string(port));
    MailMessage msg;
    msg.to = "owner@example.com";
    EXPECT_THROW(mail.send(msg), SendError);
}
