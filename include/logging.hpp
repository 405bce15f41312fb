#pragma once
#include <ostream>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#define SERMONDL_LOG(severity, message) \
    BOOST_LOG_SEV(::logging::logger(), ::logging::Severity::severity) << message

namespace logging {

enum class Severity {
    ERROR,
    WARNING,
    INFO,
    DEBUG,
};

using Logger = boost::log::sources::severity_logger_mt<Severity>;

Logger& logger();

// Installs the console sink. Records below `min_severity` are dropped.
void init(Severity min_severity);

void setMinSeverity(Severity min_severity);

template <typename CharT, typename TraitsT>
inline std::basic_ostream<CharT, TraitsT>& operator<<(std::basic_ostream<CharT, TraitsT>& strm, Severity severity) {
    switch (severity) {
        case Severity::ERROR: strm << "[!] Error:"; break;
        case Severity::WARNING: strm << "[!]"; break;
        case Severity::INFO: strm << "[+]"; break;
        case Severity::DEBUG: strm << "[.]"; break;
    }
    return strm;
}

}
