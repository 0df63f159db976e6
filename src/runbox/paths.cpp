#include "paths.h"

fs::path kBoxRoot = "/tmp/runbox";

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

} // namespace

fs::path EnvironmentTemplate(long id) {
  return kBoxRoot / ("env-" + PadInt(id, 6) + "-XXXXXX");
}

fs::path EnvVenvPath(const fs::path& root) {
  return root / "venv";
}
fs::path EnvInterpreter(const fs::path& root) {
  return EnvVenvPath(root) / "bin" / "python";
}
fs::path EnvHome(const fs::path& root) {
  return root / "home";
}
fs::path EnvTmp(const fs::path& root) {
  return root / "tmp";
}
fs::path EnvWorkdir(const fs::path& root) {
  return root / "work";
}
fs::path EnvPipCache(const fs::path& root) {
  return root / "cache";
}
