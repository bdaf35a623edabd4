#include "log.hpp"
#include "TimeFormat.hpp"
#include <iostream>
#include <sstream>
#include <pthread.h>

// ワーカースレッドから同時に呼ばれるので1行ずつ排他する
static pthread_mutex_t g_logMutex = PTHREAD_MUTEX_INITIALIZER;
static LogLevel g_threshold = INFO;

static const char *levelName(LogLevel level) {
    switch (level) {
    case INFO:
        return "INFO";
    case WARNING:
        return "WARNING";
    case ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

void setLogLevel(LogLevel level) {
    pthread_mutex_lock(&g_logMutex);
    g_threshold = level;
    pthread_mutex_unlock(&g_logMutex);
}

bool parseLogLevel(const std::string &name, LogLevel &out) {
    if (name == "info")
        out = INFO;
    else if (name == "warning")
        out = WARNING;
    else if (name == "error")
        out = ERROR;
    else
        return false;
    return true;
}

// --- 通常ログ出力 ---
// INFO は stdout、WARNING / ERROR は stderr
void logMessage(LogLevel level, const std::string &msg) {
    std::ostringstream oss;
    oss << "[" << timefmt::logTimestamp() << "] "
        << levelName(level) << ": " << msg;

    pthread_mutex_lock(&g_logMutex);
    if (level >= g_threshold) {
        if (level == INFO)
            std::cout << oss.str() << std::endl;
        else
            std::cerr << oss.str() << std::endl;
    }
    pthread_mutex_unlock(&g_logMutex);
}

// --- エラーログ出力 ---
void logError(const std::string &func, const std::string &msg) {
    std::ostringstream oss;
    oss << "[" << timefmt::logTimestamp() << "] "
        << "ERROR (" << func << "): " << msg;

    pthread_mutex_lock(&g_logMutex);
    std::cerr << oss.str() << std::endl;
    pthread_mutex_unlock(&g_logMutex);
}
