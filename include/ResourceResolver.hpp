#ifndef RESOURCERESOLVER_HPP
#define RESOURCERESOLVER_HPP

#include <string>

// リクエストパスの分類結果
struct Resolution {
    enum Kind { HOME, REGULAR_FILE, MISSING };
    enum Reason {
        REASON_NONE,
        REASON_EMPTY_REQUEST, // リクエスト行が読めなかった
        REASON_MALFORMED,     // '/' または後続の ' ' がない
        REASON_NOT_FOUND,
        REASON_NOT_REGULAR,   // ディレクトリなど
        REASON_OUTSIDE_ROOT   // docRoot の外を指している
    };

    Kind kind;
    Reason reason;
    std::string requestPath; // リクエスト行から取り出したままのパス
    std::string filePath;    // REGULAR_FILE のときの実パス

    Resolution() : kind(MISSING), reason(REASON_EMPTY_REQUEST) {}

    bool found() const { return kind != MISSING; }
};

const char *reasonName(Resolution::Reason reason);

// "GET /a/b.html HTTP/1.1" -> "a/b.html"
// 最初の '/' の次から、その後の最初の ' ' の手前まで
// 形式が不正なら false
bool parseRequestPath(const std::string &requestLine, std::string &out);

class ResourceResolver {
private:
    std::string docRoot;

    std::string joinRoot(const std::string &relative) const;
    bool isInsideRoot(const std::string &canonicalRoot,
                      const std::string &canonicalPath) const;

public:
    explicit ResourceResolver(const std::string &documentRoot);

    // リクエスト行 -> HOME / FILE / MISSING
    Resolution resolve(const std::string &requestLine) const;

    // パス（先頭 '/' なし）だけを分類
    Resolution classify(const std::string &path) const;

    const std::string &getDocRoot() const { return docRoot; }
};

#endif
