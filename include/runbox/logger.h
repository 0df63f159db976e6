#ifndef INCLUDE_RUNBOX_LOGGER_H_
#define INCLUDE_RUNBOX_LOGGER_H_

// Keep the console sinks usable in children created by fork().
// Call once from main before any thread is started.
void InitLogger();

#endif  // INCLUDE_RUNBOX_LOGGER_H_
