#include "ServerManager.hpp"
#include "log.hpp"
#include <csignal>
#include <iostream>

static void handleSignal(int sig) {
    (void)sig;
    ServerManager::requestStop();
}

int main(int argc, char *argv[]) {
	std::string conf_file_path = "./conf/webworker.conf";
	if (argc > 2)
	{
		std::cerr << "Usage: " << argv[0] << " [config_file]" << std::endl;
		return 1;
	}
	if (argc == 2)
	{
		conf_file_path = argv[1];
	}

	std::signal(SIGPIPE, SIG_IGN);
	std::signal(SIGINT, handleSignal);
	std::signal(SIGTERM, handleSignal);

    ServerManager manager;
    if (!manager.loadConfig(conf_file_path))
        return 1;
    if (!manager.initAllServers())
        return 1;
    if (!manager.runAllServers())
        return 1;
    return 0;
}
