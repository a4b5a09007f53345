// ===================== include/errors.hpp =====================
#pragma once
#include <stdexcept>
#include <string>

namespace mailhealth
{
    enum class ErrorKind
    {
        Authentication,
        Connection,
        Timeout,
        Scrape,
        Configuration,
        Protocol
    };

    const char *to_string(ErrorKind kind);

    // Base for every failure the exporter classifies. Anything that is not an
    // ExporterError reaching the scheduler is treated as an unexpected error.
    class ExporterError : public std::runtime_error
    {
    public:
        ExporterError(ErrorKind kind, const std::string &what);
        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    class AuthenticationError : public ExporterError
    {
    public:
        explicit AuthenticationError(const std::string &what) : ExporterError(ErrorKind::Authentication, what) {}
    };

    class ConnectionError : public ExporterError
    {
    public:
        explicit ConnectionError(const std::string &what) : ExporterError(ErrorKind::Connection, what) {}
    };

    class TimeoutError : public ExporterError
    {
    public:
        explicit TimeoutError(const std::string &what) : ExporterError(ErrorKind::Timeout, what) {}
    };

    class ScrapeError : public ExporterError
    {
    public:
        explicit ScrapeError(const std::string &what) : ExporterError(ErrorKind::Scrape, what) {}
    };

    class ConfigurationError : public ExporterError
    {
    public:
        explicit ConfigurationError(const std::string &what) : ExporterError(ErrorKind::Configuration, what) {}
    };

    // Server answered, but not with anything the client expected.
    class ProtocolError : public ExporterError
    {
    public:
        explicit ProtocolError(const std::string &what) : ExporterError(ErrorKind::Protocol, what) {}
    };
} // namespace mailhealth
