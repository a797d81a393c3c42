#include "sys/file.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "sys/log.hpp"

bool isFile(const std::string &path) {
  std::ifstream f(path.c_str());
  return f.good();
}

bool isDir(const std::string &path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

// creates the parent directory of the given path
void ensureDir(const std::string &path) {
  auto index = path.find_last_of(FILE_SEP);
  if (index == std::string::npos) {
    Log::get().error("Error determining directory for " + path, true);
  }
  auto dir = path.substr(0, index);
  if (!isDir(dir)) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec && !isDir(dir)) {
      Log::get().error("Error creating directory " + dir, true);
    }
  }
}

void ensureTrailingFileSep(std::string &dir) {
  if (dir.empty() || dir.back() != FILE_SEP) {
    dir += FILE_SEP;
  }
}

std::string getHomeDir() {
  static std::string home;
  if (home.empty()) {
#ifdef _WIN64
    auto d = std::getenv("HOMEDRIVE");
    auto p = std::getenv("HOMEPATH");
    if (!d || !p) {
      Log::get().error("Cannot determine home directory!", true);
    }
    home = std::string(d) + std::string(p);
#else
    auto h = std::getenv("HOME");
    if (!h) {
      Log::get().error("Cannot determine home directory!", true);
    }
    home = std::string(h);
#endif
  }
  return home;
}

std::string getTmpDir() {
  static std::string tmp_dir;
  if (tmp_dir.empty()) {
    std::error_code ec;
    auto path = std::filesystem::temp_directory_path(ec);
    if (ec) {
      Log::get().error("Cannot determine temp directory", true);
    }
    tmp_dir = path.string();
    ensureTrailingFileSep(tmp_dir);
  }
  return tmp_dir;
}

std::vector<std::string> readLinesWithComments(const std::string &path) {
  std::ifstream in(path);
  if (!in.good()) {
    Log::get().error("File not found: " + path, true);
  }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    lines.push_back(line);
  }
  return lines;
}
