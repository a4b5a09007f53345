#pragma once
#include <string>
#include <utility>

namespace mailhealth {

// Unique marker placed in a probe's subject line. Never reused within the
// process; random bits keep it unique across restarts too.
class CorrelationToken {
public:
    CorrelationToken() = default;
    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }

    bool operator==(const CorrelationToken& o) const { return value_ == o.value_; }
    bool operator!=(const CorrelationToken& o) const { return value_ != o.value_; }

private:
    friend CorrelationToken new_token();
    explicit CorrelationToken(std::string v) : value_(std::move(v)) {}
    std::string value_;
};

CorrelationToken new_token();

// Subject line the receiver searches for.
std::string probe_subject(const std::string& token);
std::string probe_subject(const CorrelationToken& token);

} // namespace mailhealth
