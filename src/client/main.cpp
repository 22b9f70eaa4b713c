#include "client/mic_client.hpp"
#include "core/logging.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

static MicClient* g_client = nullptr;

static void onSignal(int) {
    if (g_client) g_client->requestStop();
}

int main(int argc, char** argv) {
    const std::string ip = argc > 1 ? argv[1] : "127.0.0.1";
    const int port = argc > 2 ? std::atoi(argv[2]) : 8765;

    logging::Level level = logging::Level::Info;
    if (const char* v = std::getenv("LOG_LEVEL")) logging::parseLevel(v, level);
    logging::setLevel(level);

    try {
        MicClient client(ip, port);
        g_client = &client;
        std::signal(SIGINT, onSignal);

        const int rc = client.run();
        g_client = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_client = nullptr;
        std::cerr << "[Mic Client] [ERROR] " << e.what() << std::endl;
        return 1;
    }
}
