#include "RequestReader.hpp"
#include "log.hpp"

const size_t RequestReader::DEFAULT_MAX_LINE;

RequestReader::RequestReader(ByteSource &src, size_t maxLine)
    : source(src), maxLineLength(maxLine), recvBuffer(), eof(false), failed(false) {}

// recv 1回分をバッファに追加
bool RequestReader::fillBuffer() {
    if (eof || failed)
        return false;

    char buffer[1024];
    ssize_t bytes = source.read(buffer, sizeof(buffer));
    if (bytes == 0) {
        eof = true;
        return false;
    }
    if (bytes < 0) {
        failed = true;
        return false;
    }
    recvBuffer.append(buffer, static_cast<size_t>(bytes));
    return true;
}

bool RequestReader::lineTooLong() const {
    size_t pos = recvBuffer.find('\n');
    if (pos == std::string::npos)
        return recvBuffer.size() > maxLineLength;
    return pos > maxLineLength;
}

bool RequestReader::readLine(std::string &line) {
    while (true) {
        size_t pos = recvBuffer.find('\n');
        if (pos != std::string::npos) {
            if (pos > maxLineLength)
                return false;
            line = recvBuffer.substr(0, pos);
            recvBuffer.erase(0, pos + 1);
            if (!line.empty() && line[line.size() - 1] == '\r')
                line.erase(line.size() - 1);
            return true;
        }

        // 異常に長い（DoS防止）
        if (recvBuffer.size() > maxLineLength)
            return false;

        if (!fillBuffer()) {
            // 改行なしで閉じられた最後の行も1行として扱う
            if (eof && !recvBuffer.empty()) {
                line = recvBuffer;
                recvBuffer.clear();
                if (!line.empty() && line[line.size() - 1] == '\r')
                    line.erase(line.size() - 1);
                return true;
            }
            return false;
        }
    }
}

RequestHead RequestReader::readRequest() {
    RequestHead head;

    std::string line;
    if (!readLine(line)) {
        if (lineTooLong()) {
            head.status = READ_TOO_LONG;
            logMessage(WARNING, "Request line too long, discarded");
        } else if (failed) {
            head.status = READ_ERROR;
            logError("RequestReader::readRequest", "stream error before request line");
        } else {
            head.status = READ_EOF;
            logMessage(WARNING, "Connection closed before request line");
        }
        return head;
    }

    head.requestLine = line;
    logMessage(INFO, "Request Line: (" + head.requestLine + ")");

    // ヘッダは中身を見ずに空行まで読み捨てる
    while (true) {
        if (!readLine(line)) {
            // ヘッダは解決に使わないので、長すぎてもリクエスト行は残す
            head.status = READ_PARTIAL;
            if (lineTooLong())
                logMessage(WARNING, "Header line too long, remaining headers skipped");
            else if (failed)
                logError("RequestReader::readRequest", "stream error while reading headers");
            return head;
        }
        if (line.empty())
            break;
        head.headerCount++;
        logMessage(INFO, "Request line: (" + line + ")");
    }

    head.status = READ_OK;
    return head;
}
