#ifndef BYTESTREAM_HPP
#define BYTESTREAM_HPP

#include <string>
#include <sys/types.h>

// 読み取り側（ソケット、テスト用の文字列など）
class ByteSource {
public:
    virtual ~ByteSource() {}

    // >0: 読めたバイト数 / 0: EOF / <0: エラー（タイムアウト含む）
    virtual ssize_t read(char *buf, size_t len) = 0;
};

// 書き込み側
class ByteSink {
public:
    virtual ~ByteSink() {}

    // 全量書けたら true
    virtual bool write(const char *data, size_t len) = 0;
    virtual bool flush() = 0;

    bool write(const std::string &data) {
        return write(data.data(), data.size());
    }
};

#endif
