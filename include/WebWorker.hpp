#ifndef WEBWORKER_HPP
#define WEBWORKER_HPP

#include "ByteStream.hpp"
#include "ConfigParser.hpp"
#include "RequestReader.hpp"
#include "ResourceResolver.hpp"

// 1リクエストの処理結果（ログとテスト用）
struct WorkerResult {
    RequestHead head;
    Resolution resolution;
    bool headerSent;
    bool bodySent;

    WorkerResult() : head(), resolution(), headerSent(false), bodySent(false) {}
};

// 1接続につき1リクエストを処理する
// 読み取り -> 解決 -> ヘッダ -> 本文 -> flush の順で、例外は外に出さない
class WebWorker {
private:
    ServerConfig cfg;
    ResourceResolver resolver;

public:
    explicit WebWorker(const ServerConfig &cfg);

    WorkerResult handle(ByteSource &in, ByteSink &out);
};

#endif
