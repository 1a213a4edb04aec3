#ifndef SERVER_H_
#define SERVER_H_

#include <safeexec/config.h>
#include <safeexec/supervisor.h>

// Serve POST /run until SIGINT or SIGTERM.
// Returns false if the listening socket could not be set up.
bool ServeForever(const Supervisor&, const ServerOptions&);

#endif  // SERVER_H_
