#include "dropcatch/config.hpp"
#include "dropcatch/game.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    dropcatch::AppConfig cfg;
    try
    {
        cfg = dropcatch::ParseArgs(argc, argv);
    }
    catch (const std::exception& ex)
    {
        spdlog::error("{}", ex.what());
        std::cerr << dropcatch::Usage(argv[0]);
        return 1;
    }

    if (cfg.showHelp)
    {
        std::cout << dropcatch::Usage(argv[0]);
        return 0;
    }

    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
    spdlog::info("Starting DropCatch {}x{} (gravity {:.2f}, {} sub-steps)", cfg.width, cfg.height, cfg.gravity, cfg.subSteps);

    try
    {
        dropcatch::RunGame(cfg);
    }
    catch (const std::exception& ex)
    {
        spdlog::critical("Error starting game: {}", ex.what());
        return 1;
    }
    return 0;
}
