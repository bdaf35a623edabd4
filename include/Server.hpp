#ifndef SERVER_HPP
#define SERVER_HPP

#include <string>

#include "ConfigParser.hpp"

// 1つの listen ソケットを持ち、接続ごとにスレッドを立てる
class Server
{
private:
	// -----------------------------
	// メンバ変数
	// -----------------------------
	ServerConfig cfg;	// サーバー設定
	int serverFd;		// listen用ソケット
	int port;			// 待ち受けポート番号
	std::string host;	// 待ち受けホストアドレス

	Server(const Server &);
	Server &operator=(const Server &);

	// -----------------------------
	// 初期化系
	// -----------------------------
	bool createSocket();
	bool bindAndListen();

	// -----------------------------
	// 接続処理
	// -----------------------------
	int acceptClient();
	bool spawnWorker(int clientFd);

public:
	// -----------------------------
	// コンストラクタ / デストラクタ
	// -----------------------------
	Server(const ServerConfig &cfg);
	~Server();

	// -----------------------------
	// 初期化 / 接続受付
	// -----------------------------
	bool init();
	void handleNewConnection();

	int getServerFd() const;
	int getPort() const;
	const ServerConfig &getConfig() const;
};

// ワーカースレッドの入口（接続 fd を受け取り、処理後に閉じる）
void *connectionThreadMain(void *arg);

// 処理中のワーカースレッド数
int activeWorkerCount();

// 全ワーカーが終わるまで最大 timeoutMs 待つ。時間内に終われば true
bool waitForWorkers(int timeoutMs);

#endif
