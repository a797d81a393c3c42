#pragma once

#include <string>
#include <vector>

#ifdef _WIN64
static constexpr char FILE_SEP = '\\';
#else
static constexpr char FILE_SEP = '/';
#endif

bool isFile(const std::string &path);

bool isDir(const std::string &path);

void ensureDir(const std::string &path);

void ensureTrailingFileSep(std::string &dir);

std::string getHomeDir();

std::string getTmpDir();

// non-empty lines that do not start with '#'
std::vector<std::string> readLinesWithComments(const std::string &path);
