#pragma once

#include <string>
#include <vector>

namespace dropcatch
{

enum class GameMode
{
    Physics, // Box2D bodies, production scoring
    Classic  // rectangle rules, production scoring
};

const char* ToString(GameMode mode);

struct AppConfig
{
    int width = 800;              // >= 320
    int height = 500;             // >= 240
    int seed = -1;                // -1 -> random_device
    float gravity = -9.8f;        // m/s^2, y-up
    int subSteps = 4;             // Box2D sub-steps per step
    float spawnInterval = 1.0f;   // seconds between droplets
    int lives = 3;                // 0 -> endless
    GameMode mode = GameMode::Physics;
    int fps = 60;
    std::string assetDir = "assets";
    bool mute = false;
    std::string logLevel = "info";
    bool showHelp = false;
};

std::string Usage(const std::string& program);

// Throws std::runtime_error naming the offending option.
AppConfig ParseArgs(int argc, const char* const* argv);
AppConfig ParseArgs(const std::vector<std::string>& args);

} // namespace dropcatch
