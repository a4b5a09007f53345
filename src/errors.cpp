#include "errors.hpp"

namespace mailhealth
{
    const char *to_string(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Authentication:
            return "authentication";
        case ErrorKind::Connection:
            return "connection";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::Scrape:
            return "scrape";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::Protocol:
            return "protocol";
        }
        return "unknown";
    }

    ExporterError::ExporterError(ErrorKind kind, const std::string &what)
        : std::runtime_error(what), kind_(kind) {}
} // namespace mailhealth
