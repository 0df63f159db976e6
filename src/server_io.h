#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>

extern std::string kHost;
extern int kPort;
extern int kMaxParallel;

// Serve POST /run and GET /status until StopServer() or the listener fails.
// Returns false if the address cannot be bound.
bool ServerWorkLoop();
// Cancel every running request and make ServerWorkLoop return; thread-safe.
void StopServer();

#endif  // SERVER_IO_H_
