#ifndef INCLUDE_RUNBOX_PATHS_H_
#define INCLUDE_RUNBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// every environment is created as a direct child of this directory
extern fs::path kBoxRoot;

#endif  // INCLUDE_RUNBOX_PATHS_H_
