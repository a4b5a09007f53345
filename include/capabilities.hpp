#pragma once
#include <chrono>
#include <string>

namespace mailhealth {

struct ProbeMessage {
    std::string from;
    std::string to;
    std::string subject;
    std::string body;
};

// "Can deliver a message to an address." Throws ConnectionError,
// AuthenticationError or ProtocolError.
class MailSender {
public:
    virtual ~MailSender() = default;
    virtual void send(const ProbeMessage& msg) = 0;
};

// "Can find a message from `from` whose subject carries `token`, and delete
// it." Returns false when nothing matches yet; throws on session failures.
// The whole session must finish within `budget` or raise TimeoutError.
class MailboxProbe {
public:
    virtual ~MailboxProbe() = default;
    virtual bool find_and_delete(const std::string& from, const std::string& token,
                                 std::chrono::milliseconds budget) = 0;
};

// "Can fetch the rendered result page at a URL." Returns the body.
class ScoreFetcher {
public:
    virtual ~ScoreFetcher() = default;
    virtual std::string fetch(const std::string& url) = 0;
};

} // namespace mailhealth
