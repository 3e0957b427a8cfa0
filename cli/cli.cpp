// Corolla CLI
// Handles: corolla --help, corolla --version, and simulation options

#include "cli.h"
#include <corolla/corolla.h>
#include <CLI/CLI.hpp>
#include <string>

namespace corolla::cli {

int parseArgs(int argc, char** argv, AppConfig& config) {
    CLI::App app{"Corolla - headless petal ring simulation"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    int segments = 0;
    float radius = 0.0f;
    float speed = 0.0f;

    app.add_option("-c,--config", config.configPath, "JSON scene configuration")
        ->check(CLI::ExistingFile);
    app.add_option("-f,--frames", config.frames, "Number of frames to simulate")
        ->default_val(600)
        ->check(CLI::NonNegativeNumber);
    app.add_option("--dt", config.dt, "Seconds per frame")
        ->default_val(1.0 / 60.0)
        ->check(CLI::NonNegativeNumber);
    auto* segmentsOpt = app.add_option("-n,--segments", segments, "Number of petals (overrides config)")
        ->check(CLI::NonNegativeNumber);
    auto* radiusOpt = app.add_option("-r,--radius", radius, "Orbit radius (overrides config)");
    auto* speedOpt = app.add_option("-s,--speed", speed, "Orbit speed in rad/s (overrides config)");
    app.add_flag("--json", config.json, "Print one JSON object per frame");
    app.add_flag("-q,--quiet", config.quiet, "Suppress the summary");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (segmentsOpt->count() > 0) config.segments = segments;
    if (radiusOpt->count() > 0) config.radius = radius;
    if (speedOpt->count() > 0) config.speed = speed;

    return -1;
}

} // namespace corolla::cli
