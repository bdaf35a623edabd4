#include "resp/Template.hpp"
#include "TimeFormat.hpp"
#include "log.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <netdb.h>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace {

std::string currentUser() {
    std::vector<char> buf(4096);
    struct passwd pw;
    struct passwd* result = NULL;
    if (getpwuid_r(geteuid(), &pw, &buf[0], buf.size(), &result) == 0 && result)
        return result->pw_name;

    const char* env = std::getenv("USER");
    if (env && *env)
        return env;
    return "unknown";
}

// "hostname/address"（アドレスが引けなければ hostname だけ）
std::string localHost() {
    char name[256];
    if (gethostname(name, sizeof(name)) != 0) {
        logError("localHost", std::strerror(errno));
        return "localhost";
    }
    name[sizeof(name) - 1] = '\0';
    std::string host(name);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    struct addrinfo* res = NULL;
    int rc = getaddrinfo(name, NULL, &hints, &res);
    if (rc != 0 || !res) {
        logMessage(WARNING, std::string("getaddrinfo failed: ") + gai_strerror(rc));
        return host;
    }

    char addr[INET_ADDRSTRLEN];
    const struct sockaddr_in* sin = reinterpret_cast<const struct sockaddr_in*>(res->ai_addr);
    if (inet_ntop(AF_INET, &sin->sin_addr, addr, sizeof(addr)) != NULL)
        host += std::string("/") + addr;
    freeaddrinfo(res);
    return host;
}

} // anonymous namespace

namespace resp {

const char* const Template::DATE_TOKEN = "{{cs371date}}";
const char* const Template::SERVER_TOKEN = "{{cs371server}}";

std::string replaceAll(const std::string& text, const std::string& from, const std::string& to) {
    if (from.empty())
        return text;

    std::string out;
    out.reserve(text.size());
    std::string::size_type pos = 0;
    while (true) {
        std::string::size_type hit = text.find(from, pos);
        if (hit == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, hit - pos);
        out += to;
        pos = hit + from.size();
    }
    return out;
}

std::string Template::render(const std::string& text, const TemplateValues& values) {
    std::string out = replaceAll(text, DATE_TOKEN, values.date);
    return replaceAll(out, SERVER_TOKEN, values.server);
}

TemplateValues Template::currentValues(std::time_t now) {
    TemplateValues v;
    v.date = timefmt::localDateTime(now);
    v.server = serverIdentity();
    return v;
}

std::string Template::serverIdentity() {
    return currentUser() + " on " + localHost();
}

} // namespace resp
