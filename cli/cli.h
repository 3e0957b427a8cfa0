// Corolla CLI
// Handles: corolla --help, corolla --version, and simulation options

#pragma once

#include "app.h"

namespace corolla::cli {

// Parse command-line arguments into an AppConfig
// Returns: 0+ = handled (exit with this code), -1 = run the simulation
int parseArgs(int argc, char** argv, AppConfig& config);

} // namespace corolla::cli
