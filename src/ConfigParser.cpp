#include "../include/ConfigParser.hpp"
#include "log.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

ServerConfig::ServerConfig()
    : port(-1), host("0.0.0.0"), root(""), serverName(DEFAULT_SERVER_NAME),
      contentType(DEFAULT_CONTENT_TYPE), templateFile(DEFAULT_TEMPLATE_FILE),
      outputFile(DEFAULT_OUTPUT_FILE), notFoundFile(DEFAULT_NOT_FOUND_FILE),
      materialize(true), readTimeoutMs(0), maxLineLength(8192),
      logLevel("info") {}

std::vector<ServerConfig>
ConfigParser::getServerConfigs(const std::string &path) {
  std::ifstream file;
  file.open(path.c_str(), std::ios::in); // 読み込み専用で開く

  if (!file.is_open()) {
    logError("ConfigParser::getServerConfigs", "cannot open " + path);
    throw std::runtime_error("Failed to open configuration file");
  }
  std::vector<ServerConfig> configs = parse(file);
  file.close();
  return configs;
}

std::vector<ServerConfig> ConfigParser::parse(std::istream &in) {
  std::string line;
  _serverConfigs.clear();
  init_ServerConfig();
  _inside_server = false;
  while (std::getline(in, line)) {
    line = trim_first_last_space(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (_inside_server == false) {
      if (line.substr(0, 6) == "server") {
        line = trim_first_last_space(line.substr(6, line.length()));
        if (line.length() == 1 && line[0] == '{') {
          _inside_server = true;
          init_ServerConfig();
          continue;
        } else {
          throw std::runtime_error(
              "Invalid Configuration File - server format");
        }
      } else {
        throw std::runtime_error("Invalid Configuration File - not server");
      }
    }
    if (line.length() == 1 && line[0] == '}') {
      if (!is_necessary_item()) { // listen / root は必須
        throw std::runtime_error(
            "Invalid Configuration File - Necessary items don't exist");
      }
      _inside_server = false;
      _serverConfigs.push_back(_cfg);
      continue;
    }
    if (line[line.length() - 1] != ';') { //";"で終わってなかったらエラー
      throw std::runtime_error("Invalid Configuration File - not ;");
    }
    line = trim_first_last_space(line.substr(0, line.length() - 1));
    parse_server_inside(line);
  }
  if (_inside_server == true) {
    throw std::runtime_error("Invalid Configuration File - not close {}");
  }
  if (_serverConfigs.empty()) {
    throw std::runtime_error("Invalid Configuration File - no server");
  }
  return _serverConfigs;
}

bool ConfigParser::is_necessary_item() {
  if (_cfg.port == -1) {
    return false;
  }
  if (_cfg.root == "") {
    return false;
  }
  return true;
}

std::string ConfigParser::trim_first_last_space(const std::string &str) {
  std::string::size_type first = str.find_first_not_of(" \t\r");
  std::string::size_type last = str.find_last_not_of(" \t\r");
  if (first == std::string::npos) {
    return "";
  } else {
    return str.substr(first, last - first + 1);
  }
}

std::vector<std::string> ConfigParser::parse_by_space(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> words;
  std::string word;

  while (iss >> word) {
    words.push_back(word);
  }
  return words;
}

bool ConfigParser::parse_on_off(const std::string &value,
                                const std::string &item) {
  if (value == "on")
    return true;
  if (value == "off")
    return false;
  throw std::runtime_error("Invalid Configuration File - " + item);
}

long ConfigParser::parse_number(const std::string &value,
                                const std::string &item) {
  char *end = NULL;
  errno = 0;
  long n = std::strtol(value.c_str(), &end, 10);
  // 値はすべて int に収める
  if (value.empty() || *end != '\0' || errno == ERANGE || n < 0 || n > INT_MAX) {
    throw std::runtime_error("Invalid Configuration File - " + item);
  }
  return n;
}

void ConfigParser::parse_server_inside(const std::string &str) {
	std::vector<std::string> words;
	words = parse_by_space(str);
	if (words.empty()) {
		throw std::runtime_error("Invalid Configuration File - empty directive");
	}
	if (words[0] == "listen") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - listen");
		}
		long port = parse_number(words[1], "listen");
		if (port < 1 || port > 65535) {
			throw std::runtime_error("Invalid Configuration File - listen");
		}
		_cfg.port = static_cast<int>(port);
	} else if (words[0] == "host") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - host");
		}
		_cfg.host = words[1];
	} else if (words[0] == "root") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - root");
		}
		_cfg.root = words[1];
	} else if (words[0] == "server_name") {
		// 空白を含む名前もそのまま使う
		if (words.size() < 2) {
			throw std::runtime_error("Invalid Configuration File - server_name");
		}
		_cfg.serverName = trim_first_last_space(str.substr(words[0].size()));
	} else if (words[0] == "content_type") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - content_type");
		}
		_cfg.contentType = words[1];
	} else if (words[0] == "template") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - template");
		}
		_cfg.templateFile = words[1];
	} else if (words[0] == "output") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - output");
		}
		_cfg.outputFile = words[1];
	} else if (words[0] == "not_found") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - not_found");
		}
		_cfg.notFoundFile = words[1];
	} else if (words[0] == "materialize") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - materialize");
		}
		_cfg.materialize = parse_on_off(words[1], "materialize");
	} else if (words[0] == "read_timeout") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - read_timeout");
		}
		_cfg.readTimeoutMs = static_cast<int>(parse_number(words[1], "read_timeout"));
	} else if (words[0] == "max_line_length") {
		if (words.size() != 2) {
			throw std::runtime_error("Invalid Configuration File - max_line_length");
		}
		long n = parse_number(words[1], "max_line_length");
		if (n == 0) {
			throw std::runtime_error("Invalid Configuration File - max_line_length");
		}
		_cfg.maxLineLength = static_cast<size_t>(n);
	} else if (words[0] == "log_level") {
		LogLevel level;
		if (words.size() != 2 || !parseLogLevel(words[1], level)) {
			throw std::runtime_error("Invalid Configuration File - log_level");
		}
		_cfg.logLevel = words[1];
	} else {
		throw std::runtime_error("Invalid Configuration File - unknown directive " + words[0]);
	}
}

void ConfigParser::init_ServerConfig() {
  _cfg = ServerConfig();
}
