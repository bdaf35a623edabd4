#ifndef CONNECTION_UTILS_HPP
#define CONNECTION_UTILS_HPP

#include <string>
#include "ByteStream.hpp"

// 接続済みソケット fd を ByteSource / ByteSink として扱う
// fd の所有権は持つ（close() かデストラクタで閉じる）
class SocketStream : public ByteSource, public ByteSink {
private:
    int fd;
    int readTimeoutMs; // 0 ならタイムアウトなし

    SocketStream(const SocketStream &);
    SocketStream &operator=(const SocketStream &);

public:
    SocketStream(int fd, int readTimeoutMs);
    ~SocketStream();

    ssize_t read(char *buf, size_t len);
    bool write(const char *data, size_t len);
    bool flush();
    using ByteSink::write;

    // 送信側を閉じてからソケットをクローズ
    void close();
    int getFd() const { return fd; }
};

// send() を全量送り切るまで繰り返す
bool sendAll(int fd, const char *buf, size_t len);

#endif
