// Corolla - Entry Point
// Parses command-line arguments and runs the simulation

#include "app.h"
#include "cli.h"
#include <iostream>

int main(int argc, char** argv) {
    corolla::AppConfig config;

    int cliResult = corolla::cli::parseArgs(argc, argv, config);
    if (cliResult >= 0) {
        return cliResult;
    }

    corolla::Application app;

    int initResult = app.init(config);
    if (initResult != 0) {
        return initResult;
    }

    return app.run(std::cout);
}
