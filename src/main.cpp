#include "simple_vfsd/vfsd_app.hpp"
#include <csignal>
#include <iostream>
#include <memory>

std::unique_ptr<SimpleVfsd::VfsdApp> g_app;

void signal_handler(int signal) {
    (void)signal;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        // Set up signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Create and initialize the application
        g_app = std::make_unique<SimpleVfsd::VfsdApp>();

        if (!g_app->initialize(argc, argv)) {
            return 1;
        }

        // Run the application
        return g_app->run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
