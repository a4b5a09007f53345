#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "capabilities.hpp"
#include "clock.hpp"
#include "errors.hpp"

namespace mailhealth {

class DiagLogger;

struct SpamScoreResult {
    double score = 0.0;
    std::string source; // result page URL
    WallTime checked_at{};
};

struct SpamCheckOutcome {
    enum class Status { Skipped, Scored, Failed };

    Status status = Status::Skipped;
    std::optional<SpamScoreResult> result; // set when Scored
    std::optional<ErrorKind> error_kind;   // set when Failed by a classified error
    std::string detail;

    bool skipped() const { return status == Status::Skipped; }
    bool scored() const { return status == Status::Scored; }
    bool performed_io() const { return status != Status::Skipped; }
};

struct SpamProbeOptions {
    std::string from_address;    // internal account
    std::string target_address;  // scoring service inbox
    std::string result_url;
    std::chrono::seconds min_interval{std::chrono::hours(8)};
};

// Parses "Your lovely total: 9.5/10" out of a rendered result page.
// Returns nullopt when the page carries no score.
std::optional<double> parse_spam_score(const std::string& html);

class SpamScoreProbe {
public:
    SpamScoreProbe(MailSender& sender, ScoreFetcher& fetcher, SpamProbeOptions opts,
                   DiagLogger* log = nullptr);

    // Skipped (no I/O at all) while now - last_checked_at < min_interval.
    // ExporterErrors become a Failed outcome; anything else propagates.
    SpamCheckOutcome attempt(std::optional<WallTime> last_checked_at, WallTime now);

    const SpamProbeOptions& options() const { return opts_; }

private:
    MailSender& sender_;
    ScoreFetcher& fetcher_;
    SpamProbeOptions opts_;
    DiagLogger* log_;
};

} // namespace mailhealth
