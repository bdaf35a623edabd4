#pragma once
#include <map>
#include <sstream>
#include <string>

namespace http {

class Status {
private:
    static std::map<int, std::string> buildTable() {
        std::map<int, std::string> r;
        r[200] = "OK";
        r[400] = "Bad Request";
        r[404] = "Not Found";
        r[500] = "Internal Server Error";
        return r;
    }

public:
    // ステータスコードに対応する Reason-Phrase を返す
    static const std::string& reason(int code) {
        // ワーカースレッドから同時に呼ばれるので初期化は一度きり
        static const std::map<int, std::string> r = buildTable();

        std::map<int, std::string>::const_iterator it = r.find(code);
        static const std::string kUnknown("Unknown");
        return (it == r.end()) ? kUnknown : it->second;
    }

    // 登録済みコードかどうか
    static bool known(int code) {
        return reason(code) != "Unknown";
    }

    // "HTTP/1.1 404 Not Found"（改行なし）
    static std::string line(int code) {
        std::ostringstream oss;
        oss << "HTTP/1.1 " << code << " " << reason(code);
        return oss.str();
    }
};

} // namespace http
