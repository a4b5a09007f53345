// ===================== src/smtp_sender.cpp =====================
#include "smtp_sender.hpp"
#include "correlation_token.hpp"
#include "diag_logger.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>

#include <openssl/evp.h>
#include <unistd.h>

namespace mailhealth
{
    namespace
    {
        std::string upper(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        std::string domain_of(const std::string &address)
        {
            size_t at = address.rfind('@');
            if (at == std::string::npos || at + 1 >= address.size())
                return "localhost";
            return address.substr(at + 1);
        }

        std::string local_hostname()
        {
            char buf[256] = {0};
            if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0')
                return "localhost";
            return buf;
        }

        bool is_auth_failure(int code)
        {
            return code == 530 || code == 534 || code == 535;
        }

        // Mechanisms listed on the EHLO "AUTH" (or legacy "AUTH=") line.
        std::vector<std::string> auth_mechanisms(const std::vector<std::string> &caps)
        {
            std::vector<std::string> out;
            for (const auto &cap : caps)
            {
                const std::string u = upper(cap);
                if (u.rfind("AUTH", 0) != 0 || u.size() < 5 || (u[4] != ' ' && u[4] != '='))
                    continue;
                std::istringstream iss(u.substr(5));
                std::string mech;
                while (iss >> mech)
                    out.push_back(mech);
            }
            return out;
        }

        bool has_capability(const std::vector<std::string> &caps, const std::string &name)
        {
            for (const auto &cap : caps)
            {
                const std::string u = upper(cap);
                if (u == name || u.rfind(name + " ", 0) == 0)
                    return true;
            }
            return false;
        }
    } // namespace

    bool parse_smtp_reply_line(const std::string &line, SmtpReplyLine &out)
    {
        if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
            !std::isdigit(static_cast<unsigned char>(line[1])) ||
            !std::isdigit(static_cast<unsigned char>(line[2])))
            return false;
        if (line.size() > 3 && line[3] != ' ' && line[3] != '-')
            return false;
        out.code = std::stoi(line.substr(0, 3));
        out.last = line.size() == 3 || line[3] == ' ';
        out.text = line.size() > 4 ? line.substr(4) : std::string();
        return true;
    }

    std::string SmtpReply::text() const
    {
        std::string out;
        for (const auto &l : lines)
        {
            if (!out.empty())
                out += " | ";
            out += l;
        }
        return out;
    }

    std::string base64_encode(const std::string &in)
    {
        if (in.empty())
            return std::string();
        std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
        int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                reinterpret_cast<const unsigned char *>(in.data()),
                                static_cast<int>(in.size()));
        out.resize(n > 0 ? static_cast<size_t>(n) : 0);
        return out;
    }

    std::string dot_stuff(const std::string &body)
    {
        std::string out;
        out.reserve(body.size() + 64);
        bool line_start = true;
        for (size_t i = 0; i < body.size(); ++i)
        {
            char c = body[i];
            if (c == '\r')
            {
                if (i + 1 < body.size() && body[i + 1] == '\n')
                    ++i;
                out += "\r\n";
                line_start = true;
                continue;
            }
            if (c == '\n')
            {
                out += "\r\n";
                line_start = true;
                continue;
            }
            if (line_start && c == '.')
                out += '.';
            out += c;
            line_start = false;
        }
        return out;
    }

    std::string rfc5322_date(WallTime t)
    {
        const std::time_t tt = std::chrono::system_clock::to_time_t(t);
        std::tm tm{};
        localtime_r(&tt, &tm);
        char buf[64] = {0};
        std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S %z", &tm);
        return buf;
    }

    std::string build_smtp_message(const ProbeMessage &msg, WallTime date, const std::string &message_id)
    {
        std::string m;
        m += "From: " + msg.from + "\r\n";
        m += "To: " + msg.to + "\r\n";
        m += "Subject: " + msg.subject + "\r\n";
        m += "Date: " + rfc5322_date(date) + "\r\n";
        m += "Message-ID: " + message_id + "\r\n";
        m += "MIME-Version: 1.0\r\n";
        m += "Content-Type: text/plain; charset=utf-8\r\n";
        m += "Content-Transfer-Encoding: 8bit\r\n";
        m += "X-Mailer: mail_health_exporter\r\n";
        m += "\r\n";
        m += msg.body;
        return m;
    }

    SmtpSender::SmtpSender(SmtpEndpoint ep, ChannelFactory factory, DiagLogger *log)
        : ep_(std::move(ep)), factory_(std::move(factory)), log_(log) {}

    SmtpReply SmtpSender::readReply(LineChannel &ch) const
    {
        SmtpReply reply;
        for (;;)
        {
            const std::string line = ch.readLine();
            SmtpReplyLine rl;
            if (!parse_smtp_reply_line(line, rl))
                throw ProtocolError("malformed SMTP reply from " + ep_.host + ": " + line);
            if (reply.code != 0 && rl.code != reply.code)
                throw ProtocolError("inconsistent SMTP reply codes from " + ep_.host + ": " + line);
            reply.code = rl.code;
            reply.lines.push_back(rl.text);
            if (rl.last)
                return reply;
        }
    }

    void SmtpSender::expectCode(const SmtpReply &r, int expect, const char *stage) const
    {
        if (r.code == expect)
            return;
        const std::string what = std::string(stage) + " on " + ep_.host + " answered " +
                                 std::to_string(r.code) + " " + r.text();
        if (is_auth_failure(r.code))
            throw AuthenticationError(what);
        throw ProtocolError(what);
    }

    SmtpReply SmtpSender::command(LineChannel &ch, const std::string &cmd, int expect, const char *stage) const
    {
        if (log_)
            log_->debug(std::string("SMTP_CMD host=") + ep_.host + " stage=" + stage);
        ch.writeLine(cmd);
        SmtpReply r = readReply(ch);
        expectCode(r, expect, stage);
        return r;
    }

    std::vector<std::string> SmtpSender::ehlo(LineChannel &ch) const
    {
        SmtpReply r = command(ch, "EHLO " + local_hostname(), 250, "EHLO");
        // first line is the server greeting, the rest are capabilities
        return std::vector<std::string>(r.lines.begin() + (r.lines.empty() ? 0 : 1), r.lines.end());
    }

    void SmtpSender::authenticate(LineChannel &ch, const std::vector<std::string> &caps) const
    {
        if (ep_.username.empty() && ep_.password.empty())
            return;

        const std::vector<std::string> mechs = auth_mechanisms(caps);
        auto offers = [&](const char *m)
        { return std::find(mechs.begin(), mechs.end(), m) != mechs.end(); };

        if (offers("PLAIN") || mechs.empty())
        {
            std::string tok;
            tok += '\0';
            tok += ep_.username;
            tok += '\0';
            tok += ep_.password;
            command(ch, "AUTH PLAIN " + base64_encode(tok), 235, "AUTH PLAIN");
        }
        else if (offers("LOGIN"))
        {
            command(ch, "AUTH LOGIN", 334, "AUTH LOGIN");
            command(ch, base64_encode(ep_.username), 334, "AUTH LOGIN username");
            command(ch, base64_encode(ep_.password), 235, "AUTH LOGIN password");
        }
        else
        {
            throw AuthenticationError(ep_.host + " offers neither AUTH PLAIN nor AUTH LOGIN");
        }
    }

    void SmtpSender::send(const ProbeMessage &msg)
    {
        ChannelEndpoint cep;
        cep.host = ep_.host;
        cep.port = ep_.port;
        cep.implicit_tls = implicitTls();
        cep.verify_tls = ep_.verify_tls;
        cep.timeout = ep_.timeout;

        std::unique_ptr<LineChannel> ch = factory_(cep);

        SmtpReply greeting = readReply(*ch);
        if (greeting.code != 220)
            throw ConnectionError(ep_.host + " refused the session: " + std::to_string(greeting.code) +
                                  " " + greeting.text());

        std::vector<std::string> caps = ehlo(*ch);
        if (ep_.use_tls && !ch->isTls())
        {
            if (!has_capability(caps, "STARTTLS"))
                throw ProtocolError(ep_.host + " does not offer STARTTLS");
            command(*ch, "STARTTLS", 220, "STARTTLS");
            ch->startTls();
            caps = ehlo(*ch);
        }

        authenticate(*ch, caps);

        command(*ch, "MAIL FROM:<" + msg.from + ">", 250, "MAIL FROM");
        SmtpReply rcpt = [&]()
        {
            ch->writeLine("RCPT TO:<" + msg.to + ">");
            return readReply(*ch);
        }();
        if (rcpt.code != 250 && rcpt.code != 251)
            expectCode(rcpt, 250, "RCPT TO");

        command(*ch, "DATA", 354, "DATA");
        const std::string message_id = "<" + new_token().str() + "@" + domain_of(msg.from) + ">";
        std::string data = dot_stuff(build_smtp_message(msg, std::chrono::system_clock::now(), message_id));
        if (data.size() < 2 || data.compare(data.size() - 2, 2, "\r\n") != 0)
            data += "\r\n";
        ch->writeRaw(data + ".\r\n");
        SmtpReply accepted = readReply(*ch);
        expectCode(accepted, 250, "end of DATA");

        if (log_)
            log_->info("SMTP_SENT host=" + ep_.host + " from=" + msg.from + " to=" + msg.to +
                       " message_id=" + message_id);

        // The message is queued at this point; a failing QUIT does not undo that.
        try
        {
            ch->writeLine("QUIT");
            readReply(*ch);
        }
        catch (const ExporterError &e)
        {
            if (log_)
                log_->debug("SMTP_QUIT_FAILED host=" + ep_.host + " detail=\"" + e.what() + "\"");
        }
    }
} // namespace mailhealth
