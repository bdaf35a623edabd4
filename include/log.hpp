#ifndef LOG_HPP
#define LOG_HPP

#include <string>

enum LogLevel { INFO, WARNING, ERROR };

// この閾値より低いレベルは出力しない
void setLogLevel(LogLevel level);

// "info" / "warning" / "error" を LogLevel に変換（不正なら false）
bool parseLogLevel(const std::string &name, LogLevel &out);

// タイムスタンプ付きメッセージ出力
void logMessage(LogLevel level, const std::string &msg);

// 関数名＋エラーメッセージを出力
void logError(const std::string &func, const std::string &msg);

#endif
