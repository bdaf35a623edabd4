#pragma once
#include <string>

namespace mime {

// 拡張子から Content-Type を推測（不明なら application/octet-stream）
std::string fromPath(const std::string& path);

} // namespace mime
