#pragma once
#include <ctime>
#include <string>

namespace resp {

// ホームページテンプレートの置換値
struct TemplateValues {
    std::string date;   // {{cs371date}}
    std::string server; // {{cs371server}}
};

class Template {
public:
    static const char* const DATE_TOKEN;
    static const char* const SERVER_TOKEN;

    // 既知のトークンを全て置換する。知らない {{...}} はそのまま
    static std::string render(const std::string& text, const TemplateValues& values);

    // 現在時刻とサーバ識別子から置換値を作る
    static TemplateValues currentValues(std::time_t now);

    // "<user> on <hostname>/<address>"
    static std::string serverIdentity();
};

// 部分文字列を全て置き換える
std::string replaceAll(const std::string& text, const std::string& from, const std::string& to);

} // namespace resp
