#ifndef __LOG_HPP_Q8ZD1MRC
#define __LOG_HPP_Q8ZD1MRC

#include "utils.hpp"

enum LogLevel {
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR
};

const char *levelName(LogLevel level);

// Side channel for human readable diagnostics.  Nothing written here may
// change what a caller gets back.
class DiagnosticLog {
public:
    virtual ~DiagnosticLog() { }
    virtual void write(LogLevel level, const string &message) = 0;

    void info(const string &message) { write(LOG_INFO, message); }
    void warning(const string &message) { write(LOG_WARNING, message); }
    void error(const string &message) { write(LOG_ERROR, message); }
};

// Writes "[level] message" lines to a stream.
class StreamLog : public DiagnosticLog {
public:
    explicit StreamLog(std::ostream &out = std::cerr);
    void write(LogLevel level, const string &message) override;

private:
    std::ostream &m_out;
};

#endif /* end of include guard: __LOG_HPP_Q8ZD1MRC */
