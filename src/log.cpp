#include "log.hpp"

#include <cassert>
#include <fstream>
#include <map>
#ifdef EDDY_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // EDDY_ENABLE_STREAM_DEBUGGING

namespace eddy {
namespace log {
namespace detail {

#define EDDY_FLUSH(f)                                                                    \
    do                                                                                   \
        if(f.is_open())                                                                  \
            f.flush();                                                                   \
    while(0)

class store_logger
{
    std::ofstream file_;

public:
    void log(const std::string& header, const std::string& log,
            const priority priority = priority::normal);
    void flush() { EDDY_FLUSH(file_); }
};

class file_logger
{
    std::map<std::string, std::ofstream> files_;

public:
    void log(const std::string& file, const std::string& header, const std::string& log,
            const priority priority);
    void flush()
    {
        for(auto& e : files_) {
            EDDY_FLUSH(e.second);
        }
    }
};

// global logger instances

store_logger store_logger;
file_logger file_logger;

#ifndef EDDY_MIN_LOG_PRIORITY
#define EDDY_MIN_LOG_PRIORITY priority::low
#endif

constexpr auto g_open_mode = std::ios::app | std::ios::out;

std::string make_log_path(const std::string& name)
{
#ifdef EDDY_LOG_PATH
    return std::string(EDDY_LOG_PATH) + '/' + name + "-log.txt";
#else
    return name + "-log.txt";
#endif
}

#ifdef EDDY_ENABLE_LOGGING

#define EDDY_PRIORITY_CHAR(p)                                                            \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define EDDY_LOG(priority, stream, header, log)                                          \
    stream << '[' << EDDY_PRIORITY_CHAR(priority) << '|' << header << "] " << log << '\n';

#ifdef EDDY_ENABLE_STREAM_DEBUGGING
#define EDDY_STREAM std::clog
#define EDDY_CLOG(priority, file, header, log)                                           \
    do {                                                                                 \
        assert(file.is_open());                                                          \
        EDDY_LOG(priority, file, header, log);                                           \
        EDDY_LOG(priority, EDDY_STREAM, header, log);                                    \
    } while(0)
#else // EDDY_ENABLE_STREAM_DEBUGGING
#define EDDY_CLOG(p, f, h, l) EDDY_LOG(p, f, h, l)
#endif // EDDY_ENABLE_STREAM_DEBUGGING

#endif // EDDY_ENABLE_LOGGING

void store_logger::log(
        const std::string& header, const std::string& log, const priority priority)
{
#ifdef EDDY_ENABLE_LOGGING
    if(priority < EDDY_MIN_LOG_PRIORITY) {
        return;
    }
    if(!file_.is_open()) {
        file_.open(make_log_path("store"), g_open_mode);
    }
    EDDY_CLOG(priority, file_, header, log);
#endif // EDDY_ENABLE_LOGGING
}

void file_logger::log(const std::string& file, const std::string& header,
        const std::string& log, const priority priority)
{
#ifdef EDDY_ENABLE_LOGGING
    if(priority < EDDY_MIN_LOG_PRIORITY) {
        return;
    }
    auto it = files_.find(file);
    if(it == files_.end()) {
        const auto path = make_log_path("file(" + file + ")");
        it = files_.emplace(file, std::ofstream(path.c_str(), g_open_mode)).first;
    }
    EDDY_CLOG(priority, it->second, header, log);
#ifdef EDDY_MERGE_FILE_LOGS
    store_logger.log("(file:" + file + ')' + header, log, priority);
#endif // EDDY_MERGE_FILE_LOGS
#endif // EDDY_ENABLE_LOGGING
}

} // detail

void log_file(const std::string& file, const std::string& header,
        const std::string& log, const priority priority)
{
    detail::file_logger.log(file, header, log, priority);
}

void log_stream(const std::string& file, const int stream_id, const std::string& header,
        const std::string& log, const priority priority)
{
    // Streams are short-lived, so rather than a file per stream they share the log of
    // the file they read.
    detail::file_logger.log(
            file, "stream#" + std::to_string(stream_id) + '|' + header, log, priority);
}

void log_store(const std::string& header, const std::string& log, const priority priority)
{
    detail::store_logger.log(header, log, priority);
}

void flush()
{
    detail::file_logger.flush();
    detail::store_logger.flush();
}

} // log
} // eddy
