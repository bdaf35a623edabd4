#ifndef REQUESTREADER_HPP
#define REQUESTREADER_HPP

#include <string>
#include "ByteStream.hpp"

enum ReadStatus {
    READ_OK,       // 空行まで読めた
    READ_PARTIAL,  // リクエスト行は読めたが空行の前に EOF / エラー / 長すぎる行
    READ_EOF,      // リクエスト行の前に EOF
    READ_ERROR,    // リクエスト行の前に読み取りエラー
    READ_TOO_LONG  // リクエスト行が maxLineLength を超えた
};

struct RequestHead {
    std::string requestLine; // 末尾の改行なし。読めなければ空
    size_t headerCount;      // 読み捨てたヘッダ行の数
    ReadStatus status;

    RequestHead() : requestLine(), headerCount(0), status(READ_EOF) {}
};

class RequestReader {
private:
    ByteSource &source;
    size_t maxLineLength;
    std::string recvBuffer;
    bool eof;
    bool failed;

    bool fillBuffer();

public:
    static const size_t DEFAULT_MAX_LINE = 8192;

    RequestReader(ByteSource &src, size_t maxLine = DEFAULT_MAX_LINE);

    // 1行取り出す（\n で区切り、末尾の \r は落とす）
    // 行が取れなければ false（EOF / エラー / 長すぎ）
    bool readLine(std::string &line);

    // リクエスト行を読み、残りのヘッダは空行まで読み捨てる
    RequestHead readRequest();

    bool sawError() const { return failed; }
    bool lineTooLong() const;
};

#endif
