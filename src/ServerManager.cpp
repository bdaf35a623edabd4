#include "ServerManager.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <stdexcept>

volatile std::sig_atomic_t ServerManager::stopRequested = 0;

ServerManager::ServerManager() {}

ServerManager::~ServerManager() {
    for (size_t i = 0; i < servers.size(); i++) {
        delete servers[i];
    }
}

bool ServerManager::loadConfig(const std::string &path) {
    ConfigParser parser;
    try {
        configs = parser.getServerConfigs(path);
    } catch (const std::exception &e) {
        logError("ServerManager::loadConfig", e.what());
        return false;
    }

    // ログレベルは最初の server ブロックの指定を使う
    LogLevel level;
    if (parseLogLevel(configs[0].logLevel, level))
        setLogLevel(level);
    return true;
}

bool ServerManager::initAllServers() {
    for (size_t i = 0; i < configs.size(); ++i) {
        Server* srv = new Server(configs[i]);
        if (!srv->init()) {
            delete srv;
            return false;
        }
        servers.push_back(srv);
    }
    return true;
}

void ServerManager::requestStop() {
    stopRequested = 1;
}

bool ServerManager::isStopRequested() {
    return stopRequested != 0;
}

// ----------------------------
// 全Serverの listen FD を1つのpoll配列で監視する
// 接続の処理自体は Server が立てるワーカースレッドに任せる
// ----------------------------
bool ServerManager::runAllServers() {
    const int POLL_SLICE_MS = 100; // 停止要求を確認する間隔
    const int SHUTDOWN_DRAIN_MS = 2000;

    std::vector<pollfd> fds(servers.size());
    for (size_t i = 0; i < servers.size(); ++i) {
        fds[i].fd = servers[i]->getServerFd();
        fds[i].events = POLLIN;
        fds[i].revents = 0;
    }
    if (fds.empty())
        return false;

    bool ok = true;

    while (!isStopRequested()) {
        int ret = poll(&fds[0], fds.size(), POLL_SLICE_MS);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            // poll 自体が使えないなら待ち受けを続けられない
            logError("ServerManager::runAllServers", std::string("poll() failed: ") + std::strerror(errno));
            ok = false;
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents & POLLIN)
                servers[i]->handleNewConnection();
            fds[i].revents = 0;
        }
    }
    logMessage(INFO, "Shutting down");

    // 処理中の接続はレスポンスを書き終えるまで少し待つ
    if (!waitForWorkers(SHUTDOWN_DRAIN_MS)) {
        std::ostringstream oss;
        oss << activeWorkerCount() << " connection(s) still active at exit";
        logMessage(WARNING, oss.str());
    }
    return ok;
}
