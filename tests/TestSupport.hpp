#ifndef TESTSUPPORT_HPP
#define TESTSUPPORT_HPP

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <ftw.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "ByteStream.hpp"

// 文字列を chunkSize バイトずつ返す
class StringSource : public ByteSource {
private:
    std::string data;
    size_t pos;
    size_t chunkSize;
    bool failAtEnd; // 読み切ったら EOF ではなくエラーを返す

public:
    StringSource(const std::string &d, size_t chunk = 1024, bool fail = false)
        : data(d), pos(0), chunkSize(chunk), failAtEnd(fail) {}

    ssize_t read(char *buf, size_t len) {
        if (pos >= data.size())
            return failAtEnd ? -1 : 0;
        size_t n = data.size() - pos;
        if (n > len)
            n = len;
        if (n > chunkSize)
            n = chunkSize;
        std::memcpy(buf, data.data() + pos, n);
        pos += n;
        return static_cast<ssize_t>(n);
    }
};

// 書き込まれたものを全部ためる
class StringSink : public ByteSink {
private:
    std::string data;
    size_t limit;     // これを超える書き込みは失敗
    size_t flushes;
    std::vector<size_t> flushPoints;

public:
    explicit StringSink(size_t lim = std::string::npos)
        : data(), limit(lim), flushes(0) {}

    using ByteSink::write;

    bool write(const char *buf, size_t len) {
        if (limit != std::string::npos && data.size() + len > limit) {
            data.append(buf, limit - data.size());
            return false;
        }
        data.append(buf, len);
        return true;
    }

    bool flush() {
        flushes++;
        flushPoints.push_back(data.size());
        return true;
    }

    const std::string &str() const { return data; }
    size_t flushCount() const { return flushes; }
    const std::vector<size_t> &getFlushPoints() const { return flushPoints; }

    std::string header() const {
        std::string::size_type end = data.find("\n\n");
        return end == std::string::npos ? data : data.substr(0, end + 2);
    }

    std::string body() const {
        std::string::size_type end = data.find("\n\n");
        return end == std::string::npos ? "" : data.substr(end + 2);
    }

    std::string statusLine() const {
        return data.substr(0, data.find('\n'));
    }
};

// mkdtemp で作った一時ディレクトリ。デストラクタで中身ごと消す
class TempDir {
private:
    std::string path;

    static int removeEntry(const char *p, const struct stat *, int, struct FTW *) {
        return ::remove(p);
    }

public:
    TempDir() {
        char tmpl[] = "/tmp/webworker_test_XXXXXX";
        char *dir = mkdtemp(tmpl);
        if (!dir)
            throw std::runtime_error("mkdtemp failed");
        path = dir;
    }

    ~TempDir() {
        nftw(path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
    }

    const std::string &str() const { return path; }

    std::string file(const std::string &name) const { return path + "/" + name; }

    void write(const std::string &name, const std::string &content) const {
        std::ofstream ofs(file(name).c_str(), std::ios::out | std::ios::binary);
        ofs << content;
    }

    std::string read(const std::string &name) const {
        std::ifstream ifs(file(name).c_str(), std::ios::in | std::ios::binary);
        std::ostringstream oss;
        oss << ifs.rdbuf();
        return oss.str();
    }

    void mkdir(const std::string &name) const {
        ::mkdir(file(name).c_str(), 0755);
    }
};

#endif
