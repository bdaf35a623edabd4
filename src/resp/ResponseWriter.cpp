#include "resp/ResponseWriter.hpp"
#include "http/HttpStatus.hpp"
#include "resp/ErrorPages.hpp"
#include "resp/Mime.hpp"
#include "resp/Template.hpp"
#include "TimeFormat.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstdio>     // std::rename, std::remove
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#define STREAM_CHUNK_SIZE 4096

static std::string joinPath(const std::string &a, const std::string &b) {
  if (a.empty())
    return b;
  if (a[a.size() - 1] == '/' && b.size() && b[0] == '/')
    return a + b.substr(1);
  if (a[a.size() - 1] != '/' && b.size() && b[0] != '/')
    return a + "/" + b;
  return a + b;
}

namespace resp {

ResponseWriter::ResponseWriter(const ServerConfig &c) : cfg(c) {}

std::string ResponseWriter::rootPath(const std::string &name) const {
  return joinPath(cfg.root.empty() ? "." : cfg.root, name);
}

int ResponseWriter::statusFor(const Resolution &res) const {
  return res.found() ? 200 : 404;
}

// 設定値をそのまま使う。"auto" のときだけファイルの拡張子から推測
std::string ResponseWriter::contentTypeFor(const Resolution &res) const {
  if (cfg.contentType != "auto")
    return cfg.contentType;
  if (res.kind == Resolution::REGULAR_FILE)
    return mime::fromPath(res.filePath);
  return DEFAULT_CONTENT_TYPE;
}

std::string ResponseWriter::buildHeader(const Resolution &res,
                                        std::time_t now) const {
  std::ostringstream header;
  header << http::Status::line(statusFor(res)) << "\n"
         << "Date: " << timefmt::httpDate(now) << "\n"
         << "Server: " << cfg.serverName << "\n"
         << "Connection: close\n"
         << "Content-Type: " << contentTypeFor(res) << "\n"
         << "\n"; // ヘッダは空行で終わる
  return header.str();
}

bool ResponseWriter::writeHeader(ByteSink &out, const Resolution &res) const {
  std::string header = buildHeader(res, std::time(NULL));
  if (!out.write(header) || !out.flush()) {
    logError("ResponseWriter::writeHeader", "failed to send header");
    return false;
  }
  return true;
}

StreamResult ResponseWriter::streamFile(const std::string &path,
                                        ByteSink &out) const {
  std::ifstream ifs(path.c_str(), std::ios::in | std::ios::binary);
  if (!ifs.is_open())
    return STREAM_OPEN_FAILED;

  std::vector<char> buf(STREAM_CHUNK_SIZE);
  while (true) {
    ifs.read(&buf[0], buf.size());
    std::streamsize n = ifs.gcount();
    if (n > 0 && !out.write(&buf[0], static_cast<size_t>(n)))
      return STREAM_WRITE_FAILED;
    if (ifs.bad())
      return STREAM_READ_FAILED;
    if (ifs.eof())
      break;
  }
  return STREAM_OK;
}

// 一時ファイルに書いてから rename するので、読み手が途中の内容を見ることはない
bool ResponseWriter::materialize(const std::string &content) const {
  std::string target = rootPath(cfg.outputFile);
  std::string tmpl = target + ".XXXXXX";
  std::vector<char> tmpName(tmpl.begin(), tmpl.end());
  tmpName.push_back('\0');

  int fd = mkstemp(&tmpName[0]);
  if (fd < 0) {
    logError("ResponseWriter::materialize",
             target + ": " + std::strerror(errno));
    return false;
  }
  fchmod(fd, 0644);
  close(fd);

  std::ofstream ofs(&tmpName[0], std::ios::out | std::ios::binary | std::ios::trunc);
  ofs << content;
  ofs.close();
  if (!ofs) {
    logError("ResponseWriter::materialize", "write failed: " + target);
    std::remove(&tmpName[0]);
    return false;
  }

  if (std::rename(&tmpName[0], target.c_str()) != 0) {
    logError("ResponseWriter::materialize",
             target + ": " + std::strerror(errno));
    std::remove(&tmpName[0]);
    return false;
  }
  return true;
}

bool ResponseWriter::writeHome(ByteSink &out) const {
  std::string templatePath = rootPath(cfg.templateFile);
  std::string text;
  if (!readFileToString(templatePath, text)) {
    logError("ResponseWriter::writeHome", "cannot read template " + templatePath);
    return out.write(ErrorPages::inlineErrorFragment());
  }

  std::string page = Template::render(text, Template::currentValues(std::time(NULL)));

  if (cfg.materialize)
    materialize(page);

  // 書き出したファイルではなくメモリ上の内容を返す
  return out.write(page);
}

bool ResponseWriter::writeFile(ByteSink &out, const Resolution &res) const {
  StreamResult r = streamFile(res.filePath, out);
  switch (r) {
  case STREAM_OK:
    return true;
  case STREAM_WRITE_FAILED:
    logError("ResponseWriter::writeFile", "client write failed: " + res.filePath);
    return false;
  case STREAM_OPEN_FAILED:
  case STREAM_READ_FAILED:
    logError("ResponseWriter::writeFile", "read failed: " + res.filePath);
    break;
  }
  return out.write(ErrorPages::inlineErrorFragment());
}

bool ResponseWriter::writeNotFound(ByteSink &out) const {
  std::string path = rootPath(cfg.notFoundFile);
  StreamResult r = streamFile(path, out);
  switch (r) {
  case STREAM_OK:
    return true;
  case STREAM_WRITE_FAILED:
    logError("ResponseWriter::writeNotFound", "client write failed");
    return false;
  case STREAM_READ_FAILED:
    // 途中まで送ってしまっているのでここで打ち切る
    logError("ResponseWriter::writeNotFound", "read failed: " + path);
    return true;
  case STREAM_OPEN_FAILED:
    logError("ResponseWriter::writeNotFound", "cannot open " + path);
    break;
  }
  return out.write(ErrorPages::defaultHtml(404));
}

bool ResponseWriter::writeBody(ByteSink &out, const Resolution &res) const {
  bool ok = false;
  switch (res.kind) {
  case Resolution::HOME:
    ok = writeHome(out);
    break;
  case Resolution::REGULAR_FILE:
    ok = writeFile(out, res);
    break;
  case Resolution::MISSING:
    ok = writeNotFound(out);
    break;
  }
  return out.flush() && ok;
}

} // namespace resp
