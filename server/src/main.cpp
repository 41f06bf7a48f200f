#include "config.h"
#include "server.h"
#include <stdio.h>

int main(int argc, char* argv[]) {
    ServerConfig config;
    bool show_help = false;

    if (!parse_server_args(argc, argv, &config, &show_help)) {
        print_usage(argv[0]);
        return 1;
    }
    if (show_help) {
        print_usage(argv[0]);
        return 0;
    }

    printf("========================================\n");
    printf("Canvas Room Collaboration Server\n");
    printf("========================================\n");
    printf("Starting server on port %d...\n", config.port);

    int result = server_run(config);

    printf("========================================\n");
    return result;
}
