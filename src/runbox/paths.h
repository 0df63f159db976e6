#ifndef RUNBOX_PATHS_H_
#define RUNBOX_PATHS_H_

#include <runbox/paths.h>

// mkdtemp template of a new environment root
fs::path EnvironmentTemplate(long id);

// layout of an environment; every path is inside `root`
fs::path EnvVenvPath(const fs::path& root);
fs::path EnvInterpreter(const fs::path& root);
fs::path EnvHome(const fs::path& root);
fs::path EnvTmp(const fs::path& root);
fs::path EnvWorkdir(const fs::path& root);
fs::path EnvPipCache(const fs::path& root);

#endif  // RUNBOX_PATHS_H_
