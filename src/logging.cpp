#include "logging.hpp"
#include <iostream>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

namespace logging {

namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

Logger& logger() {
    static Logger instance;
    return instance;
}

void init(Severity min_severity) {
    using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;

    auto backend = boost::make_shared<sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::cerr, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<ConsoleSink>(backend);
    sink->set_formatter(expr::stream << expr::attr<Severity>("Severity") << " " << expr::smessage);

    boost::log::core::get()->add_sink(sink);
    setMinSeverity(min_severity);
}

void setMinSeverity(Severity min_severity) {
    boost::log::core::get()->set_filter(expr::attr<Severity>("Severity") <= min_severity);
}

}
