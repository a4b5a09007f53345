// ===================== src/imap_mailbox.cpp =====================
#include "imap_mailbox.hpp"
#include "correlation_token.hpp"
#include "diag_logger.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace mailhealth
{
    namespace
    {
        bool iequals_prefix(const std::string &s, const std::string &prefix)
        {
            if (s.size() < prefix.size())
                return false;
            for (size_t i = 0; i < prefix.size(); ++i)
                if (std::tolower(static_cast<unsigned char>(s[i])) !=
                    std::tolower(static_cast<unsigned char>(prefix[i])))
                    return false;
            return true;
        }

        // Byte count of a trailing "{n}" (or "{n+}") literal marker, or -1.
        long trailing_literal(const std::string &line)
        {
            if (line.empty() || line.back() != '}')
                return -1;
            size_t open = line.rfind('{');
            if (open == std::string::npos)
                return -1;
            std::string n = line.substr(open + 1, line.size() - open - 2);
            if (!n.empty() && n.back() == '+')
                n.pop_back();
            if (n.empty() || n.size() > 9 ||
                !std::all_of(n.begin(), n.end(), [](unsigned char c)
                             { return std::isdigit(c) != 0; }))
                return -1;
            return std::stol(n);
        }

        bool is_number(const std::string &s)
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c)
                                             { return std::isdigit(c) != 0; });
        }
    } // namespace

    std::string quote_imap_string(const std::string &s)
    {
        std::string out = "\"";
        for (char c : s)
        {
            if (c == '\r' || c == '\n')
                throw ProtocolError("line break in IMAP quoted string");
            if (c == '"' || c == '\\')
                out += '\\';
            out += c;
        }
        out += '"';
        return out;
    }

    std::vector<std::string> parse_search_response(const std::vector<std::string> &untagged)
    {
        std::vector<std::string> uids;
        for (const auto &line : untagged)
        {
            if (!iequals_prefix(line, "SEARCH"))
                continue;
            std::istringstream iss(line.substr(6));
            std::string tok;
            while (iss >> tok)
            {
                if (tok.front() == '(')
                    break; // (MODSEQ ...) trailer
                if (is_number(tok))
                    uids.push_back(tok);
            }
        }
        return uids;
    }

    std::string extract_header_value(const std::string &headers, const std::string &name)
    {
        std::istringstream iss(headers);
        std::string line;
        std::string value;
        bool in_header = false;
        while (std::getline(iss, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (in_header)
            {
                if (!line.empty() && (line[0] == ' ' || line[0] == '\t'))
                {
                    size_t b = line.find_first_not_of(" \t");
                    value += " " + line.substr(b);
                    continue;
                }
                break;
            }
            if (iequals_prefix(line, name + ":"))
            {
                value = line.substr(name.size() + 1);
                size_t b = value.find_first_not_of(" \t");
                value = (b == std::string::npos) ? std::string() : value.substr(b);
                in_header = true;
            }
        }
        return value;
    }

    ImapMailbox::ImapMailbox(ImapEndpoint ep, ChannelFactory factory, DiagLogger *log)
        : ep_(std::move(ep)), factory_(std::move(factory)), log_(log) {}

    std::string ImapMailbox::readUntaggedLine(LineChannel &ch, std::string line)
    {
        for (long n = trailing_literal(line); n >= 0; n = trailing_literal(line))
        {
            line += "\r\n";
            line += ch.readExact(static_cast<size_t>(n));
            line += ch.readLine();
        }
        return line;
    }

    ImapResponse ImapMailbox::readResponse(LineChannel &ch, const std::string &tag)
    {
        ImapResponse res;
        for (;;)
        {
            std::string line = ch.readLine();
            if (line.rfind("* ", 0) == 0)
            {
                res.untagged.push_back(readUntaggedLine(ch, line.substr(2)));
                continue;
            }
            if (line.rfind("+", 0) == 0)
                throw ProtocolError("unexpected continuation request from " + ep_.host);
            if (line.rfind(tag + " ", 0) != 0)
                throw ProtocolError("unexpected IMAP line from " + ep_.host + ": " + line);

            std::string rest = line.substr(tag.size() + 1);
            size_t sp = rest.find(' ');
            res.status = rest.substr(0, sp);
            std::transform(res.status.begin(), res.status.end(), res.status.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            res.text = (sp == std::string::npos) ? std::string() : rest.substr(sp + 1);
            return res;
        }
    }

    ImapResponse ImapMailbox::command(LineChannel &ch, const std::string &cmd, const char *stage)
    {
        char tag[16];
        std::snprintf(tag, sizeof(tag), "A%03u", ++tag_seq_);
        if (log_)
            log_->debug(std::string("IMAP_CMD host=") + ep_.host + " tag=" + tag + " stage=" + stage);

        ch.writeLine(std::string(tag) + " " + cmd);
        ImapResponse res = readResponse(ch, tag);
        if (res.status == "OK")
            return res;

        const std::string what = std::string(stage) + " on " + ep_.host + " answered " + res.status + " " + res.text;
        if (res.status == "NO" && std::string(stage) == "LOGIN")
            throw AuthenticationError(what);
        throw ProtocolError(what);
    }

    bool ImapMailbox::searchAndDelete(LineChannel &ch, const std::string &from, const std::string &token)
    {
        command(ch, "SELECT INBOX", "SELECT");

        const std::string subject = probe_subject(token);
        ImapResponse found = command(ch, "UID SEARCH FROM " + quote_imap_string(from) +
                                             " SUBJECT " + quote_imap_string(subject),
                                     "SEARCH");
        const std::vector<std::string> candidates = parse_search_response(found.untagged);
        if (candidates.empty())
            return false;

        // SEARCH matches substrings; the token must show up in the Subject itself.
        std::vector<std::string> matched;
        for (const auto &uid : candidates)
        {
            ImapResponse hdr = command(ch, "UID FETCH " + uid + " (BODY.PEEK[HEADER.FIELDS (SUBJECT)])", "FETCH");
            for (const auto &u : hdr.untagged)
            {
                const std::string value = extract_header_value(u.substr(std::min(u.find("\r\n"), u.size())), "Subject");
                if (value.find(token) != std::string::npos)
                {
                    matched.push_back(uid);
                    break;
                }
            }
        }
        if (matched.empty())
            return false;

        std::string set;
        for (const auto &uid : matched)
            set += (set.empty() ? "" : ",") + uid;
        command(ch, "UID STORE " + set + " +FLAGS.SILENT (\\Deleted)", "STORE");
        command(ch, "EXPUNGE", "EXPUNGE");

        if (log_)
            log_->info("IMAP_DELETED host=" + ep_.host + " uids=" + set + " token=" + token);
        return true;
    }

    bool ImapMailbox::find_and_delete(const std::string &from, const std::string &token,
                                      std::chrono::milliseconds budget)
    {
        if (budget.count() <= 0)
            throw TimeoutError("no time left for an IMAP session with " + ep_.host);

        ChannelEndpoint cep;
        cep.host = ep_.host;
        cep.port = ep_.port;
        cep.implicit_tls = ep_.use_ssl;
        cep.verify_tls = ep_.verify_tls;
        cep.timeout = std::min(ep_.timeout, budget);
        cep.deadline = std::chrono::steady_clock::now() + budget;

        tag_seq_ = 0;
        std::unique_ptr<LineChannel> ch = factory_(cep);

        const std::string greeting = ch->readLine();
        if (greeting.rfind("* BYE", 0) == 0)
            throw ConnectionError(ep_.host + " refused the session: " + greeting);
        if (greeting.rfind("* OK", 0) != 0 && greeting.rfind("* PREAUTH", 0) != 0)
            throw ProtocolError("unexpected IMAP greeting from " + ep_.host + ": " + greeting);

        if (greeting.rfind("* PREAUTH", 0) != 0)
            command(*ch, "LOGIN " + quote_imap_string(ep_.username) + " " + quote_imap_string(ep_.password), "LOGIN");

        const bool found = searchAndDelete(*ch, from, token);

        try
        {
            command(*ch, "LOGOUT", "LOGOUT");
        }
        catch (const ExporterError &e)
        {
            if (log_)
                log_->debug("IMAP_LOGOUT_FAILED host=" + ep_.host + " detail=\"" + e.what() + "\"");
        }
        return found;
    }
} // namespace mailhealth
