// ===================== include/smtp_sender.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "capabilities.hpp"
#include "clock.hpp"
#include "line_channel.hpp"

namespace mailhealth
{
    class DiagLogger;

    struct SmtpEndpoint
    {
        std::string host;
        int port = 465;
        bool use_tls = true; // implicit TLS on 465, STARTTLS elsewhere
        std::string username;
        std::string password;
        bool verify_tls = true;
        std::chrono::milliseconds timeout{30000};
    };

    struct SmtpReplyLine
    {
        int code = 0;
        bool last = true; // "250 " rather than "250-"
        std::string text;
    };

    // "250-PIPELINING" / "250 OK" / "354". False if the line is not a reply.
    bool parse_smtp_reply_line(const std::string &line, SmtpReplyLine &out);

    struct SmtpReply
    {
        int code = 0;
        std::vector<std::string> lines;

        std::string text() const; // lines joined with " | "
    };

    std::string base64_encode(const std::string &in);

    // CRLF line endings plus a leading '.' doubled on every line.
    std::string dot_stuff(const std::string &body);

    // "Sun, 19 Oct 2026 14:03:07 +0200"
    std::string rfc5322_date(WallTime t);

    // Header block, blank line and body, ready for dot-stuffing.
    std::string build_smtp_message(const ProbeMessage &msg, WallTime date, const std::string &message_id);

    class SmtpSender : public MailSender
    {
    public:
        explicit SmtpSender(SmtpEndpoint ep, ChannelFactory factory = default_channel_factory(),
                            DiagLogger *log = nullptr);

        // One session per message: greeting, EHLO, [STARTTLS], AUTH, MAIL,
        // RCPT, DATA, QUIT.
        void send(const ProbeMessage &msg) override;

        bool implicitTls() const { return ep_.use_tls && ep_.port == 465; }

    private:
        SmtpReply readReply(LineChannel &ch) const;
        SmtpReply command(LineChannel &ch, const std::string &cmd, int expect, const char *stage) const;
        void expectCode(const SmtpReply &r, int expect, const char *stage) const;
        std::vector<std::string> ehlo(LineChannel &ch) const;
        void authenticate(LineChannel &ch, const std::vector<std::string> &caps) const;

        SmtpEndpoint ep_;
        ChannelFactory factory_;
        DiagLogger *log_;
    };
} // namespace mailhealth
