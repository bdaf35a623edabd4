#pragma once
#include <string>

namespace resp {

class ErrorPages {
public:
    // 本文の途中でファイル読み込みに失敗したときに差し込む断片
    static const std::string& inlineErrorFragment();

    // notFound.html が読めないときなどに使うデフォルトHTML
    static std::string defaultHtml(int status);
};

// ファイル全体を読み込む（開けなければ false）
bool readFileToString(const std::string& path, std::string& out);

} // namespace resp
