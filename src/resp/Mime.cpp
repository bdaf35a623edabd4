#include "resp/Mime.hpp"
#include <map>
#include <string>

static std::string extOf(const std::string& path) {
    std::string::size_type slash = path.rfind('/');
    std::string::size_type p = path.rfind('.');
    if (p == std::string::npos || (slash != std::string::npos && p < slash))
        return "";
    std::string ext = path.substr(p);
    for (size_t i = 0; i < ext.size(); ++i) {
        if ('A' <= ext[i] && ext[i] <= 'Z')
            ext[i] = char(ext[i] - 'A' + 'a');
    }
    return ext;
}

static std::map<std::string, std::string> buildMimeMap() {
    std::map<std::string, std::string> m;
    m.insert(std::make_pair(".html", "text/html"));
    m.insert(std::make_pair(".htm",  "text/html"));
    m.insert(std::make_pair(".css",  "text/css"));
    m.insert(std::make_pair(".js",   "application/javascript"));
    m.insert(std::make_pair(".json", "application/json"));
    m.insert(std::make_pair(".png",  "image/png"));
    m.insert(std::make_pair(".jpg",  "image/jpeg"));
    m.insert(std::make_pair(".jpeg", "image/jpeg"));
    m.insert(std::make_pair(".gif",  "image/gif"));
    m.insert(std::make_pair(".ico",  "image/x-icon"));
    m.insert(std::make_pair(".txt",  "text/plain"));
    return m;
}

static const std::map<std::string, std::string>& mimeMap() {
    static const std::map<std::string, std::string> m = buildMimeMap();
    return m;
}

std::string mime::fromPath(const std::string& path) {
    std::string ext = extOf(path);
    const std::map<std::string,std::string>& m = mimeMap();
    std::map<std::string,std::string>::const_iterator it = m.find(ext);
    return (it != m.end()) ? it->second : "application/octet-stream";
}
