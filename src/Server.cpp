#include "Server.hpp"
#include "WebWorker.hpp"
#include "connection_utils.hpp"
#include "log.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <pthread.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

// スレッドに渡す接続情報（スレッド側で delete する）
struct ConnectionTask
{
	int clientFd;
	ServerConfig cfg;
};

static pthread_mutex_t workersMutex = PTHREAD_MUTEX_INITIALIZER;
static int activeWorkers = 0;

static void addActiveWorkers(int delta)
{
	pthread_mutex_lock(&workersMutex);
	activeWorkers += delta;
	pthread_mutex_unlock(&workersMutex);
}

int activeWorkerCount()
{
	pthread_mutex_lock(&workersMutex);
	int n = activeWorkers;
	pthread_mutex_unlock(&workersMutex);
	return n;
}

bool waitForWorkers(int timeoutMs)
{
	const int SLICE_MS = 10;
	int waited = 0;
	while (activeWorkerCount() > 0)
	{
		if (waited >= timeoutMs)
			return false;
		usleep(SLICE_MS * 1000);
		waited += SLICE_MS;
	}
	return true;
}

// ----------------------------
// コンストラクタ・デストラクタ
// ----------------------------

Server::Server(const ServerConfig &c)
	: cfg(c), serverFd(-1), port(c.port), host(c.host) {}

// listen ソケットだけ閉じる（接続中のワーカーはそれぞれで閉じる）
Server::~Server()
{
	if (serverFd >= 0)
		close(serverFd);
}

// ----------------------------
// 初期化系関数
// ----------------------------

// サーバー全体の初期化（ソケット作成＋バインド＋リッスン）
bool Server::init()
{
	if (!createSocket())
		return false;

	if (!bindAndListen())
		return false;

	std::ostringstream oss;
	oss << "Server listening on " << host << ":" << port
		<< " (root=" << cfg.root << ")";
	logMessage(INFO, oss.str());
	return true;
}

// ソケット作成とオプション設定
bool Server::createSocket()
{
	serverFd = socket(AF_INET, SOCK_STREAM, 0);
	if (serverFd < 0)
	{
		logError("Server::createSocket", std::string("socket() failed: ") + std::strerror(errno));
		return false;
	}

	int opt = 1;
	if (setsockopt(serverFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
	{
		logError("Server::createSocket", std::string("setsockopt() failed: ") + std::strerror(errno));
		return false;
	}
	return true;
}

// bind & listen 設定
bool Server::bindAndListen()
{
	sockaddr_in addr;
	std::memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
	addr.sin_port = htons(port);

	if (host.empty() || inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
	{
		// "0.0.0.0" 以外で解釈できない場合も ANY に
		logMessage(WARNING, "host '" + host + "' not an IPv4 address, binding to any");
		addr.sin_addr.s_addr = htonl(INADDR_ANY);
	}

	if (bind(serverFd, (struct sockaddr *)&addr, sizeof(addr)) < 0)
	{
		logError("Server::bindAndListen", std::string("bind() failed: ") + std::strerror(errno));
		return false;
	}

	if (listen(serverFd, SOMAXCONN) < 0)
	{
		logError("Server::bindAndListen", std::string("listen() failed: ") + std::strerror(errno));
		return false;
	}

	return true;
}

// ----------------------------
// クライアント接続処理
// ----------------------------

// 新規接続ハンドラ（poll で POLLIN が来たときに呼ばれる）
void Server::handleNewConnection()
{
	int clientFd = acceptClient();
	if (clientFd < 0)
		return; // accept 失敗時は何もしない

	if (!spawnWorker(clientFd))
		close(clientFd);
}

int Server::acceptClient()
{
	int clientFd;
	do {
		clientFd = accept(serverFd, NULL, NULL);
	} while (clientFd < 0 && errno == EINTR);

	if (clientFd < 0)
	{
		logError("Server::acceptClient", std::string("accept() failed: ") + std::strerror(errno));
		return -1;
	}

	std::ostringstream oss;
	oss << "New client connected: fd=" << clientFd;
	logMessage(INFO, oss.str());
	return clientFd;
}

// 接続ごとに detach したスレッドを1本立てる
bool Server::spawnWorker(int clientFd)
{
	ConnectionTask *task = new ConnectionTask();
	task->clientFd = clientFd;
	task->cfg = cfg;

	// スレッド側の減算より先に数える
	addActiveWorkers(1);
	pthread_t thread;
	int rc = pthread_create(&thread, NULL, connectionThreadMain, task);
	if (rc != 0)
	{
		logError("Server::spawnWorker", std::string("pthread_create failed: ") + std::strerror(rc));
		addActiveWorkers(-1);
		delete task;
		return false;
	}
	pthread_detach(thread);
	return true;
}

void *connectionThreadMain(void *arg)
{
	ConnectionTask *task = static_cast<ConnectionTask *>(arg);

	{
		SocketStream stream(task->clientFd, task->cfg.readTimeoutMs);
		WebWorker worker(task->cfg);
		worker.handle(stream, stream);
		stream.close();
	}

	delete task;
	addActiveWorkers(-1);
	return NULL;
}

int Server::getServerFd() const
{
	return serverFd;
}

int Server::getPort() const
{
	return port;
}

const ServerConfig &Server::getConfig() const
{
	return cfg;
}
