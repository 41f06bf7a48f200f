#ifndef SERVER_H
#define SERVER_H

#include "config.h"

// Run the collaboration server until SIGINT/SIGTERM
int server_run(const ServerConfig& config);

#endif // SERVER_H
