#include <spdlog/spdlog.h>

#include "cli/modsync.hpp"

int main(int argc, char* argv[])
{
    try {
        return modsync::run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
