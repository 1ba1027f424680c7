#include <boost/format.hpp>

#include "log.hpp"

const char *levelName(LogLevel level)
{
    switch (level) {
    case LOG_INFO:
        return "info";
    case LOG_WARNING:
        return "warning";
    case LOG_ERROR:
        return "error";
    }
    return "unknown";
}

StreamLog::StreamLog(std::ostream &out)
    : m_out(out)
{
    // pass
}

void StreamLog::write(LogLevel level, const string &message)
{
    m_out << boost::format("[%s] %s") % levelName(level) % message << endl;
}
