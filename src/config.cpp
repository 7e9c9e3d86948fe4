#include "dropcatch/config.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <sstream>
#include <stdexcept>

namespace dropcatch
{

namespace
{

bool ParseInt(const std::string& s, int& out, int minv, int maxv)
{
    try
    {
        size_t used = 0;
        long v = std::stol(s, &used);
        if (used != s.size() || v < minv || v > maxv) return false;
        out = static_cast<int>(v);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool ParseFloat(const std::string& s, float& out, float minv, float maxv)
{
    try
    {
        size_t used = 0;
        float v = std::stof(s, &used);
        if (used != s.size() || v < minv || v > maxv) return false;
        out = v;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool IsLogLevel(const std::string& name)
{
    // spdlog maps unknown names to "off"; only accept real ones.
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace

const char* ToString(GameMode mode)
{
    return (mode == GameMode::Classic) ? "classic" : "physics";
}

std::string Usage(const std::string& program)
{
    std::ostringstream oss;
    oss << "Usage: " << program
        << " [--width W] [--height H] [--seed S] [--gravity G] [--substeps N]"
           " [--spawn-interval T] [--lives N] [--mode {physics|classic}] [--fps N]"
           " [--assets DIR] [--mute]"
           " [--log-level {trace|debug|info|warn|error|critical|off}] [--help]\n";
    return oss.str();
}

AppConfig ParseArgs(int argc, const char* const* argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return ParseArgs(args);
}

AppConfig ParseArgs(const std::vector<std::string>& args)
{
    AppConfig cfg;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& a = args[i];
        auto need = [&](const std::string& name) -> const std::string& {
            if (i + 1 >= args.size()) throw std::runtime_error("Missing value for " + name);
            return args[++i];
        };

        if (a == "--width" || a == "-w")
        {
            if (!ParseInt(need(a), cfg.width, 320, 16384)) throw std::runtime_error("invalid width (>= 320)");
        }
        else if (a == "--height" || a == "-h")
        {
            if (!ParseInt(need(a), cfg.height, 240, 16384)) throw std::runtime_error("invalid height (>= 240)");
        }
        else if (a == "--seed")
        {
            if (!ParseInt(need(a), cfg.seed, -1, std::numeric_limits<int>::max())) throw std::runtime_error("invalid seed");
        }
        else if (a == "--gravity")
        {
            if (!ParseFloat(need(a), cfg.gravity, -100.0f, 100.0f)) throw std::runtime_error("invalid gravity (-100..100)");
        }
        else if (a == "--substeps")
        {
            if (!ParseInt(need(a), cfg.subSteps, 1, 16)) throw std::runtime_error("invalid substeps (1..16)");
        }
        else if (a == "--spawn-interval")
        {
            if (!ParseFloat(need(a), cfg.spawnInterval, 0.05f, 10.0f)) throw std::runtime_error("invalid spawn-interval (0.05..10)");
        }
        else if (a == "--lives")
        {
            if (!ParseInt(need(a), cfg.lives, 0, 99)) throw std::runtime_error("invalid lives (0..99, 0 = endless)");
        }
        else if (a == "--mode")
        {
            const std::string& mode = need(a);
            if (mode == "physics") cfg.mode = GameMode::Physics;
            else if (mode == "classic") cfg.mode = GameMode::Classic;
            else throw std::runtime_error("invalid mode: " + mode);
        }
        else if (a == "--fps")
        {
            if (!ParseInt(need(a), cfg.fps, 10, 500)) throw std::runtime_error("invalid fps (10..500)");
        }
        else if (a == "--assets")
        {
            cfg.assetDir = need(a);
        }
        else if (a == "--mute")
        {
            cfg.mute = true;
        }
        else if (a == "--log-level")
        {
            const std::string& level = need(a);
            if (!IsLogLevel(level)) throw std::runtime_error("invalid log-level: " + level);
            cfg.logLevel = level;
        }
        else if (a == "--help" || a == "-?")
        {
            cfg.showHelp = true;
        }
        else
        {
            throw std::runtime_error("Unknown argument: " + a);
        }
    }
    return cfg;
}

} // namespace dropcatch
