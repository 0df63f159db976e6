#ifndef RUNBOX_UTILS_H_
#define RUNBOX_UTILS_H_

#include <filesystem>

#include <runbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm700 = fs::perms::owner_all;

// async-signal-safe when close_range is available
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

// last `max_len` bytes, for embedding tool output into error messages
std::string Tail(const std::string&, size_t max_len);

#endif  // RUNBOX_UTILS_H_
