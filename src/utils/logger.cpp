#include <string>
#include <cstdarg>
#include <stdio.h>
#include <systemd/sd-journal.h>
#include <syslog.h>
#include <ctime>

#include "logger.hpp"


#define INFO_PREPEND  "[INFO]"
#define WARN_PREPEND  "[WARN]"
#define ERR_PREPEND   "[ERROR]"
#define DEBUG_PREPEND "[DEBUG]"


Logger* logInstance = nullptr;

Logger* Logger::getLoggerInst(void) {
    if (!logInstance) {
        logInstance = new Logger();
    }

    return logInstance;
}


void Logger::log(int logLvl, const char* format, ...) {
    if (logLvl == Logger::LOG_LVL_DEBUG && !debugEnabled) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, format);
    int len = vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    if (len < 0) {
        return;
    }

    std::time_t currentTime = std::time(nullptr);
    std::tm localTime{};
    localtime_r(&currentTime, &localTime);
    char tsBuf[32];
    std::string ts = asctime_r(&localTime, tsBuf);
    ts.pop_back();

    int level = LOG_INFO;
    const char* prepend = INFO_PREPEND;
    FILE* stream = stdout;

    switch (logLvl) {
        case Logger::LOG_LVL_INFO:
            level = LOG_INFO;
            prepend = INFO_PREPEND;
            break;

        case Logger::LOG_LVL_WARN:
            level = LOG_WARNING;
            prepend = WARN_PREPEND;
            break;

        case Logger::LOG_LVL_ERROR:
            level = LOG_ERR;
            prepend = ERR_PREPEND;
            stream = stderr;
            break;

        case Logger::LOG_LVL_DEBUG:
            level = LOG_DEBUG;
            prepend = DEBUG_PREPEND;
            break;

        default:
            break;
    }

    std::string message = ts + " " + prepend + " " + buffer;
    sd_journal_print(level, "%s", message.c_str());
    fprintf(stream, "%s", message.c_str());
    fflush(stream);
}
