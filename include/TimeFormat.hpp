#ifndef TIMEFORMAT_HPP
#define TIMEFORMAT_HPP

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timefmt {

// Date ヘッダ用 (RFC 1123, GMT)
// 例: "Sun, 09 Nov 2025 10:00:00 GMT"
inline std::string httpDate(std::time_t t) {
    struct std::tm tmGmt;
    gmtime_r(&t, &tmGmt);

    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tmGmt);
    return std::string(buf, n);
}

// テンプレートの {{cs371date}} 用 (ローカル時刻)
// 例: "2025-11-09 19:00:00"
inline std::string localDateTime(std::time_t t) {
    struct std::tm tmLocal;
    localtime_r(&t, &tmLocal);

    std::ostringstream oss;
    oss << (tmLocal.tm_year + 1900) << "-"
        << std::setw(2) << std::setfill('0') << (tmLocal.tm_mon + 1) << "-"
        << std::setw(2) << std::setfill('0') << tmLocal.tm_mday << " "
        << std::setw(2) << std::setfill('0') << tmLocal.tm_hour << ":"
        << std::setw(2) << std::setfill('0') << tmLocal.tm_min << ":"
        << std::setw(2) << std::setfill('0') << tmLocal.tm_sec;
    return oss.str();
}

inline std::string logTimestamp() {
    return localDateTime(std::time(NULL));
}

} // namespace timefmt

#endif
