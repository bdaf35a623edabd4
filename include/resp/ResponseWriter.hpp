#ifndef RESPONSE_WRITER_HPP
#define RESPONSE_WRITER_HPP

#include <ctime>
#include <string>
#include "ByteStream.hpp"
#include "ConfigParser.hpp"
#include "ResourceResolver.hpp"

namespace resp {

enum StreamResult {
    STREAM_OK,
    STREAM_OPEN_FAILED,
    STREAM_READ_FAILED,
    STREAM_WRITE_FAILED
};

class ResponseWriter {
public:
    explicit ResponseWriter(const ServerConfig &cfg);

    // ステータス行〜空行までのヘッダブロック
    std::string buildHeader(const Resolution &res, std::time_t now) const;

    // ヘッダを書いて flush。本文より先に必ず1回だけ呼ぶ
    bool writeHeader(ByteSink &out, const Resolution &res) const;

    // HOME / REGULAR_FILE / MISSING に応じた本文
    bool writeBody(ByteSink &out, const Resolution &res) const;

    // ファイルの中身をそのまま流す
    StreamResult streamFile(const std::string &path, ByteSink &out) const;

    // 置換済みテンプレートを outputFile に書き出す（失敗してもレスポンスは続行）
    bool materialize(const std::string &content) const;

    int statusFor(const Resolution &res) const;
    std::string contentTypeFor(const Resolution &res) const;

private:
    const ServerConfig &cfg;

    std::string rootPath(const std::string &name) const;
    bool writeHome(ByteSink &out) const;
    bool writeFile(ByteSink &out, const Resolution &res) const;
    bool writeNotFound(ByteSink &out) const;
};

} // namespace resp

#endif // RESPONSE_WRITER_HPP
