#include "resp/ErrorPages.hpp"
#include "http/HttpStatus.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace resp {

bool readFileToString(const std::string& path, std::string& out) {
    std::ifstream ifs(path.c_str(), std::ios::in | std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad())
        return false;
    out = oss.str();
    return true;
}

const std::string& ErrorPages::inlineErrorFragment() {
    static const std::string kFragment("<html><head>Bad request</head></html>");
    return kFragment;
}

std::string ErrorPages::defaultHtml(int status) {
    if (!http::Status::known(status))
        status = 500;
    const std::string& reason = http::Status::reason(status);
    std::ostringstream oss;
    oss << "<!DOCTYPE html>"
           "<html><head><meta charset=\"utf-8\">"
           "<title>" << status << " " << reason << "</title>"
           "</head><body>"
           "<h1>" << status << " " << reason << "</h1>"
           "<p>The requested resource could not be served.</p>"
           "</body></html>";
    return oss.str();
}

} // namespace resp
