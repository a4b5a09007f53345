// ===================== include/imap_mailbox.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "capabilities.hpp"
#include "line_channel.hpp"

namespace mailhealth
{
    class DiagLogger;

    struct ImapEndpoint
    {
        std::string host;
        int port = 993;
        bool use_ssl = true; // implicit TLS
        std::string username;
        std::string password;
        bool verify_tls = true;
        std::chrono::milliseconds timeout{30000};
    };

    struct ImapResponse
    {
        std::string status; // OK, NO or BAD
        std::string text;
        // Untagged lines without the leading "* ", literals spliced in as
        // CRLF + data, exactly as they came over the wire.
        std::vector<std::string> untagged;
    };

    // "quoted" string with \ and " escaped. Throws ProtocolError on CR/LF.
    std::string quote_imap_string(const std::string &s);

    // UIDs from every "SEARCH n n n" untagged line.
    std::vector<std::string> parse_search_response(const std::vector<std::string> &untagged);

    // Value of the first `name:` header in a header block, folded lines joined.
    // Empty when the header is absent.
    std::string extract_header_value(const std::string &headers, const std::string &name);

    class ImapMailbox : public MailboxProbe
    {
    public:
        explicit ImapMailbox(ImapEndpoint ep, ChannelFactory factory = default_channel_factory(),
                             DiagLogger *log = nullptr);

        // One session: LOGIN, SELECT INBOX, UID SEARCH, confirm the token in
        // each candidate's Subject, flag matches \Deleted and EXPUNGE. The
        // session ends with TimeoutError once `budget` has run out.
        bool find_and_delete(const std::string &from, const std::string &token,
                             std::chrono::milliseconds budget) override;

    private:
        ImapResponse command(LineChannel &ch, const std::string &cmd, const char *stage);
        ImapResponse readResponse(LineChannel &ch, const std::string &tag);
        std::string readUntaggedLine(LineChannel &ch, std::string line);
        bool searchAndDelete(LineChannel &ch, const std::string &from, const std::string &token);

        ImapEndpoint ep_;
        ChannelFactory factory_;
        DiagLogger *log_;
        unsigned tag_seq_ = 0;
    };
} // namespace mailhealth
