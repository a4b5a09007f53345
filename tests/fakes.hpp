#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "capabilities.hpp"
#include "clock.hpp"
#include "errors.hpp"
#include "line_channel.hpp"

namespace mailhealth::testing {

// Clock whose sleep_for only moves the reading forward.
class FakeClock : public Clock {
public:
    FakeClock()
        : steady_(SteadyTime(std::chrono::hours(1000))),
          wall_(WallTime(std::chrono::seconds(1700000000))) {}

    SteadyTime now() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return steady_;
    }
    WallTime wall_now() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return wall_;
    }
    void sleep_for(std::chrono::milliseconds d) override {
        advance(d);
        ++sleeps;
    }

    void advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mu_);
        steady_ += d;
        wall_ += d;
    }

    int sleeps = 0;

private:
    mutable std::mutex mu_;
    SteadyTime steady_;
    WallTime wall_;
};

// Mailbox that sees a delivered message once the fake clock reaches its
// delivery time.
class FakeMailbox : public MailboxProbe {
public:
    explicit FakeMailbox(FakeClock& clock) : clock_(clock) {}

    void deliver(const std::string& from, const std::string& subject, std::chrono::milliseconds delay) {
        inbox.push_back(Stored{from, subject, clock_.now() + delay});
    }

    bool find_and_delete(const std::string& from, const std::string& token,
                         std::chrono::milliseconds budget) override {
        ++polls;
        budgets.push_back(budget);
        if (before_poll) before_poll(polls);
        if (session_cost > budget) {
            clock_.advance(budget);
            throw TimeoutError("IMAP session ran out of time");
        }
        clock_.advance(session_cost);
        for (auto it = inbox.begin(); it != inbox.end(); ++it) {
            if (it->from == from && it->subject.find(token) != std::string::npos &&
                clock_.now() >= it->visible_at) {
                deleted.push_back(it->subject);
                inbox.erase(it);
                return true;
            }
        }
        return false;
    }

    struct Stored {
        std::string from;
        std::string subject;
        SteadyTime visible_at;
    };

    std::vector<Stored> inbox;
    std::vector<std::string> deleted;
    int polls = 0;
    std::vector<std::chrono::milliseconds> budgets;
    std::chrono::milliseconds session_cost{0}; // time one session takes on the fake clock
    std::function<void(int)> before_poll; // may throw to simulate a session failure

private:
    FakeClock& clock_;
};

class FakeSender : public MailSender {
public:
    void send(const ProbeMessage& msg) override {
        if (fail) fail(msg);
        sent.push_back(msg);
        if (deliver_to) deliver_to->deliver(msg.from, msg.subject, delivery_delay);
    }

    std::vector<ProbeMessage> sent;
    FakeMailbox* deliver_to = nullptr;
    std::chrono::milliseconds delivery_delay{0};
    std::function<void(const ProbeMessage&)> fail; // throw from here to fail the send
};

class FakeFetcher : public ScoreFetcher {
public:
    std::string fetch(const std::string& url) override {
        urls.push_back(url);
        if (fail) fail(url);
        return page;
    }

    std::string page;
    std::vector<std::string> urls;
    std::function<void(const std::string&)> fail;
};

// Server side of a scripted conversation: everything the client will read is
// queued up front, everything it writes is recorded line by line.
struct ScriptState {
    std::string incoming;
    std::vector<std::string> written;
    std::vector<ChannelEndpoint> opened;
    bool tls = false;
    int tls_upgrades = 0;
};

class ScriptedChannel : public LineChannel {
public:
    explicit ScriptedChannel(std::shared_ptr<ScriptState> st) : st_(std::move(st)) {}

    void writeLine(const std::string& line) override { st_->written.push_back(line); }
    void writeRaw(const std::string& data) override { st_->written.push_back(data); }

    std::string readLine() override {
        size_t nl = st_->incoming.find('\n');
        if (nl == std::string::npos) throw ConnectionError("connection closed by scripted peer");
        std::string line = st_->incoming.substr(0, nl);
        st_->incoming.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }

    std::string readExact(size_t n) override {
        if (st_->incoming.size() < n) throw ConnectionError("connection closed by scripted peer");
        std::string out = st_->incoming.substr(0, n);
        st_->incoming.erase(0, n);
        return out;
    }

    void startTls() override {
        st_->tls = true;
        ++st_->tls_upgrades;
    }
    bool isTls() const override { return st_->tls; }

private:
    std::shared_ptr<ScriptState> st_;
};

inline ChannelFactory scripted_factory(std::shared_ptr<ScriptState> st) {
    return [st](const ChannelEndpoint& ep) -> std::unique_ptr<LineChannel> {
        st->opened.push_back(ep);
        if (ep.implicit_tls) st->tls = true;
        return std::make_unique<ScriptedChannel>(st);
    };
}

} // namespace mailhealth::testing
