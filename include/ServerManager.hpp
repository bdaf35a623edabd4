#ifndef SERVERMANAGER_HPP
#define SERVERMANAGER_HPP

#include <csignal>
#include <string>
#include <vector>

#include "ConfigParser.hpp"
#include "Server.hpp"

class ServerManager {
   private:
    std::vector<Server*> servers;
    std::vector<ServerConfig> configs;

    static volatile std::sig_atomic_t stopRequested;

    ServerManager(const ServerManager&);
    ServerManager& operator=(const ServerManager&);

   public:
    ServerManager();
    ~ServerManager();

    bool loadConfig(const std::string& path);
    bool initAllServers();
    // 停止要求で true、poll の失敗で false を返す
    bool runAllServers();

    // シグナルハンドラから呼んでよい
    static void requestStop();
    static bool isStopRequested();
};

#endif
