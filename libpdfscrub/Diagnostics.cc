#include <pdfscrub/Diagnostics.hh>

using namespace pdfscrub;

Diagnostics::Diagnostics(
    std::shared_ptr<QPDFLogger> log, bool verbose, std::string const& message_prefix) :
    log(log ? log : QPDFLogger::defaultLogger()),
    verbose(verbose),
    message_prefix(message_prefix)
{
}

std::shared_ptr<QPDFLogger>
Diagnostics::getLogger() const
{
    return log;
}

bool
Diagnostics::isVerbose() const
{
    return verbose;
}

std::string const&
Diagnostics::getMessagePrefix() const
{
    return message_prefix;
}

void
Diagnostics::doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn) const
{
    if (verbose) {
        fn(*log->getInfo(), message_prefix);
    }
}

void
Diagnostics::info(std::string const& message) const
{
    *log->getInfo() << message_prefix << ": " << message << "\n";
}

void
Diagnostics::warn(std::string const& message) const
{
    *log->getWarn() << message_prefix << ": " << message << "\n";
}

void
Diagnostics::error(std::string const& message) const
{
    *log->getError() << message_prefix << ": " << message << "\n";
}
