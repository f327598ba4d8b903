#ifndef EDDY_LOG_HEADER
#define EDDY_LOG_HEADER

#include <string>

namespace eddy {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

/**
 * Each file's events go to their own log, keyed by the file's name, since files are
 * the unit most user actions (selecting, streaming) refer to.
 */
void log_file(const std::string& file, const std::string& header,
        const std::string& log, const priority priority = priority::normal);
/** Streams are identified by the file they read and a per-process serial number. */
void log_stream(const std::string& file, const int stream_id, const std::string& header,
        const std::string& log, const priority priority = priority::normal);
void log_store(const std::string& header, const std::string& log,
        const priority priority = priority::normal);

/**
 * Call this in a SIGABRT handler so that even when an assertion fires, everything
 * buffered is written to disk.
 */
void flush();

} // log
} // eddy

#endif // EDDY_LOG_HEADER
