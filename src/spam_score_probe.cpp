#include "spam_score_probe.hpp"

#include "correlation_token.hpp"
#include "diag_logger.hpp"

#include <regex>

namespace mailhealth {

std::optional<double> parse_spam_score(const std::string& html) {
    std::string text = std::regex_replace(html, std::regex("<[^>]*>"), " ");
    text = std::regex_replace(text, std::regex("&nbsp;|&#160;", std::regex::icase), " ");
    text = std::regex_replace(text, std::regex("\\s+"), " ");

    static const std::regex score_re(R"(Your lovely total:\s*(\d+(?:\.\d+)?)\s*/\s*\d+)",
                                     std::regex::ECMAScript | std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, score_re)) return std::nullopt;
    try {
        return std::stod(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

SpamScoreProbe::SpamScoreProbe(MailSender& sender, ScoreFetcher& fetcher, SpamProbeOptions opts,
                               DiagLogger* log)
    : sender_(sender), fetcher_(fetcher), opts_(std::move(opts)), log_(log) {}

SpamCheckOutcome SpamScoreProbe::attempt(std::optional<WallTime> last_checked_at, WallTime now) {
    SpamCheckOutcome out;
    if (last_checked_at && now - *last_checked_at < opts_.min_interval) {
        if (log_) {
            const auto wait = std::chrono::duration_cast<std::chrono::seconds>(
                opts_.min_interval - (now - *last_checked_at));
            log_->info("SPAM_CHECK_SKIPPED next_in_s=" + std::to_string(wait.count()));
        }
        out.status = SpamCheckOutcome::Status::Skipped;
        return out;
    }

    const CorrelationToken token = new_token();
    try {
        ProbeMessage msg;
        msg.from = opts_.from_address;
        msg.to = opts_.target_address;
        msg.subject = probe_subject(token);
        msg.body =
            "Hello,\r\n"
            "\r\n"
            "this message checks how receiving mail servers rate mail sent from " + opts_.from_address + ".\r\n"
            "Test ID: " + token.str() + "\r\n"
            "Timestamp: " + to_iso8601(now) + "\r\n"
            "\r\n"
            "Regards,\r\n"
            "mail health exporter\r\n";

        if (log_) log_->info("SPAM_CHECK_SEND token=" + token.str() + " to=" + opts_.target_address);
        sender_.send(msg);

        if (log_) log_->info("SPAM_CHECK_FETCH url=" + opts_.result_url);
        const std::string page = fetcher_.fetch(opts_.result_url);

        const std::optional<double> score = parse_spam_score(page);
        if (!score)
            throw ScrapeError("no score found on " + opts_.result_url + " (" +
                              std::to_string(page.size()) + " bytes)");

        SpamScoreResult r;
        r.score = *score;
        r.source = opts_.result_url;
        r.checked_at = now;
        out.status = SpamCheckOutcome::Status::Scored;
        out.result = r;
        if (log_) log_->info("SPAM_CHECK_SCORED token=" + token.str() + " score=" + std::to_string(r.score));
    } catch (const ExporterError& e) {
        out.status = SpamCheckOutcome::Status::Failed;
        out.error_kind = e.kind();
        out.detail = e.what();
        if (log_)
            log_->error("SPAM_CHECK_FAILED token=" + token.str() + " kind=" + to_string(e.kind()) +
                        " detail=\"" + out.detail + "\"");
    }
    return out;
}

} // namespace mailhealth
