/**
 * @file test_app.cpp
 * @brief Integration tests for the headless Application host
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "app.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace corolla;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

// Redirects std::cout into a buffer for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : m_old(std::cout.rdbuf(m_buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(m_old); }

    std::string str() const { return m_buffer.str(); }

private:
    std::ostringstream m_buffer;
    std::streambuf* m_old;
};

std::filesystem::path writeScene(const std::string& name, const std::string& text) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << text;
    return path;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(line);
    }
    return out;
}

} // namespace

TEST_CASE("JSON mode writes one record per frame", "[integration][app]") {
    auto path = writeScene("corolla_app_json.json",
                           R"({ "ring": { "count": 8 }, "orbit": { "speed": 2.0 } })");

    AppConfig config;
    config.configPath = path.string();
    config.frames = 30;
    config.json = true;

    std::ostringstream out;
    std::string console;
    int initResult = 0;
    int runResult = 0;
    {
        CoutCapture capture;
        Application app;
        initResult = app.init(config);
        runResult = app.run(out);
        console = capture.str();
    }
    std::filesystem::remove(path);

    REQUIRE(initResult == 0);
    REQUIRE(runResult == 0);

    SECTION("nothing but records reaches stdout") {
        REQUIRE(console.empty());
    }

    SECTION("every line parses and carries the frame fields") {
        auto records = lines(out.str());
        REQUIRE(records.size() == 30);

        for (size_t i = 0; i < records.size(); ++i) {
            json frame = json::parse(records[i]);
            REQUIRE(frame["frame"].get<uint64_t>() == i);
            REQUIRE_THAT(frame["time"].get<double>(), WithinAbs((i + 1) / 60.0, 1e-9));

            const json& probe = frame["probe"];
            REQUIRE(probe["position"].size() == 3);
            REQUIRE_THAT(probe["angle"].get<float>(), WithinAbs(-2.0f * (i + 1) / 60.0f, 1e-4));
            REQUIRE(probe["spin"].is_number());

            REQUIRE((frame["active"].is_null() || frame["active"].is_number_unsigned()));
            REQUIRE(frame["intensity"].size() == 8);
            REQUIRE(frame["scale"].size() == 8);
            REQUIRE(frame["color"].size() == 8);
            REQUIRE(frame["color"][0].get<std::string>().front() == '#');
        }
    }
}

TEST_CASE("Summary mode reports coverage", "[integration][app]") {
    AppConfig config;
    config.frames = 120;

    std::ostringstream out;
    Application app;
    {
        CoutCapture capture;
        REQUIRE(app.init(config) == 0);
        REQUIRE(app.run(out) == 0);
    }

    REQUIRE(app.framesWithHit() > 0);
    REQUIRE(out.str().find("Segments hit:") != std::string::npos);
    REQUIRE(out.str().find("of 32") != std::string::npos);
}

TEST_CASE("Empty ring still produces records", "[integration][app]") {
    AppConfig config;
    config.frames = 3;
    config.json = true;
    config.segments = 0;

    std::ostringstream out;
    Application app;
    REQUIRE(app.init(config) == 0);
    REQUIRE(app.run(out) == 0);

    auto records = lines(out.str());
    REQUIRE(records.size() == 3);
    json frame = json::parse(records.back());
    REQUIRE(frame["active"].is_null());
    REQUIRE(frame["intensity"].empty());
}

TEST_CASE("Configuration errors fail init", "[integration][app]") {
    Application app;
    AppConfig config;

    SECTION("missing file") {
        config.configPath = (std::filesystem::temp_directory_path() / "corolla_missing.json").string();
        REQUIRE(app.init(config) == 1);
    }

    SECTION("malformed section") {
        auto path = writeScene("corolla_app_bad.json", R"({ "ring": 5 })");
        config.configPath = path.string();
        REQUIRE(app.init(config) == 1);
        std::filesystem::remove(path);
    }

    SECTION("negative segment override") {
        config.segments = -4;
        REQUIRE(app.init(config) == 1);
    }

    SECTION("run without init") {
        std::ostringstream out;
        REQUIRE(app.run(out) == 1);
        REQUIRE(out.str().empty());
    }
}
