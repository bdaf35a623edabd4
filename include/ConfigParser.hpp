#pragma once
#include <istream>
#include <string>
#include <vector>

#define DEFAULT_SERVER_NAME "Michael's very own server"
#define DEFAULT_CONTENT_TYPE "text/html"
#define DEFAULT_TEMPLATE_FILE "TestBase.html"
#define DEFAULT_OUTPUT_FILE "Test.html"
#define DEFAULT_NOT_FOUND_FILE "notFound.html"

struct ServerConfig {
  int port;
  std::string host;
  std::string root;           // ドキュメントルート
  std::string serverName;     // Server ヘッダの値
  std::string contentType;    // 全レスポンス共通。"auto" なら拡張子から推測
  std::string templateFile;   // ホームページのテンプレート（root からの相対）
  std::string outputFile;     // 置換後テンプレートの書き出し先
  std::string notFoundFile;   // 404 の本文
  bool materialize;           // outputFile に書き出すか
  int readTimeoutMs;          // 0 ならタイムアウトなし
  size_t maxLineLength;
  std::string logLevel;

  ServerConfig();
};

class ConfigParser {
private:
  std::vector<ServerConfig> _serverConfigs;
  ServerConfig _cfg;
  bool _inside_server;

  std::string trim_first_last_space(const std::string &input);
  std::vector<std::string> parse_by_space(const std::string &str);
  void parse_server_inside(const std::string &str);
  void init_ServerConfig();
  bool is_necessary_item();
  bool parse_on_off(const std::string &value, const std::string &item);
  long parse_number(const std::string &value, const std::string &item);

public:
  std::vector<ServerConfig> getServerConfigs(const std::string &path);
  std::vector<ServerConfig> parse(std::istream &in);
};
