#include "ResourceResolver.hpp"
#include "log.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

const char *reasonName(Resolution::Reason reason) {
    switch (reason) {
    case Resolution::REASON_NONE:
        return "none";
    case Resolution::REASON_EMPTY_REQUEST:
        return "empty request";
    case Resolution::REASON_MALFORMED:
        return "malformed request line";
    case Resolution::REASON_NOT_FOUND:
        return "not found";
    case Resolution::REASON_NOT_REGULAR:
        return "not a regular file";
    case Resolution::REASON_OUTSIDE_ROOT:
        return "outside document root";
    }
    return "unknown";
}

bool parseRequestPath(const std::string &requestLine, std::string &out) {
    std::string::size_type slash = requestLine.find('/');
    if (slash == std::string::npos)
        return false;

    std::string rest = requestLine.substr(slash + 1);
    std::string::size_type space = rest.find(' ');
    if (space == std::string::npos)
        return false;

    out = rest.substr(0, space);
    return true;
}

// realpath の薄いラッパ（失敗したら false）
static bool canonicalize(const std::string &path, std::string &out) {
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) == NULL)
        return false;
    out = resolved;
    return true;
}

ResourceResolver::ResourceResolver(const std::string &documentRoot)
    : docRoot(documentRoot.empty() ? "." : documentRoot) {}

std::string ResourceResolver::joinRoot(const std::string &relative) const {
    if (docRoot[docRoot.size() - 1] == '/')
        return docRoot + relative;
    return docRoot + "/" + relative;
}

bool ResourceResolver::isInsideRoot(const std::string &canonicalRoot,
                                    const std::string &canonicalPath) const {
    if (canonicalRoot == "/")
        return true;
    if (canonicalPath == canonicalRoot)
        return true;
    return canonicalPath.size() > canonicalRoot.size() &&
           canonicalPath.compare(0, canonicalRoot.size(), canonicalRoot) == 0 &&
           canonicalPath[canonicalRoot.size()] == '/';
}

Resolution ResourceResolver::classify(const std::string &path) const {
    Resolution r;
    r.requestPath = path;

    if (path.empty()) {
        r.kind = Resolution::HOME;
        r.reason = Resolution::REASON_NONE;
        return r;
    }

    r.kind = Resolution::MISSING;

    // c_str() だと NUL で名前が切れて別のファイルを指してしまう
    if (path.find('\0') != std::string::npos) {
        logMessage(WARNING, "NUL byte in request path");
        r.reason = Resolution::REASON_NOT_FOUND;
        return r;
    }

    std::string candidate = joinRoot(path);

    struct stat st;
    if (stat(candidate.c_str(), &st) != 0) {
        r.reason = Resolution::REASON_NOT_FOUND;
        return r;
    }

    // ".." やシンボリックリンクで docRoot の外に出ていないか
    std::string canonicalRoot;
    std::string canonicalPath;
    if (!canonicalize(docRoot, canonicalRoot) || !canonicalize(candidate, canonicalPath)) {
        logError("ResourceResolver::classify", std::strerror(errno));
        r.reason = Resolution::REASON_NOT_FOUND;
        return r;
    }
    if (!isInsideRoot(canonicalRoot, canonicalPath)) {
        logMessage(WARNING, "Path escapes document root: " + path);
        r.reason = Resolution::REASON_OUTSIDE_ROOT;
        return r;
    }

    if (!S_ISREG(st.st_mode)) {
        r.reason = Resolution::REASON_NOT_REGULAR;
        return r;
    }

    r.kind = Resolution::REGULAR_FILE;
    r.reason = Resolution::REASON_NONE;
    r.filePath = canonicalPath;
    return r;
}

Resolution ResourceResolver::resolve(const std::string &requestLine) const {
    if (requestLine.empty()) {
        Resolution r;
        r.reason = Resolution::REASON_EMPTY_REQUEST;
        return r;
    }

    std::string path;
    if (!parseRequestPath(requestLine, path)) {
        logMessage(WARNING, "Malformed request line: (" + requestLine + ")");
        Resolution r;
        r.reason = Resolution::REASON_MALFORMED;
        return r;
    }
    return classify(path);
}
