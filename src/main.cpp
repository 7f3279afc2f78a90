/**
 * @file main.cpp
 * @brief codecell - Command-line interface
 *
 * Reads one execution request (JSON) from a file or stdin, runs it in a
 * sandboxed container and prints the result JSON on stdout. Logs go to
 * stderr so the output stays machine readable.
 *
 * **Exit Status**:
 * - 0: the code ran and exited with status 0
 * - 2: the request was executed (or rejected) but did not succeed
 * - 1: fatal CLI or environment error
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "codecell/core/execution_engine.hpp"
#include "codecell/utils/container_utils.hpp"

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

json ReadRequest(const std::string& source) {
    if (source == "-") {
        return json::parse(std::cin);
    }

    std::ifstream file(source);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open request file: " + source);
    }
    return json::parse(file);
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"codecell - sandboxed code execution engine"};

    std::string request_source = "-";
    std::string config_path;
    std::string image;
    int timeout = 0;
    std::size_t memory_mb = 0;
    long cpu_quota = 0;
    bool network = false;
    std::string uploads_dir;
    std::string downloads_dir;
    bool cleanup = false;
    bool verbose = false;

    app.add_option("request", request_source, "Request JSON file ('-' for stdin)")
        ->default_val("-");
    app.add_option("-c,--config", config_path, "Engine configuration JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("--image", image, "Sandbox image tag");
    app.add_option("--timeout", timeout, "Default execution timeout in seconds")
        ->check(CLI::Range(1, static_cast<int>(codecell::core::kMaxTimeout.count())));
    app.add_option("--memory", memory_mb, "Memory ceiling in MB (swap pinned to it)")
        ->check(CLI::PositiveNumber);
    app.add_option("--cpu-quota", cpu_quota, "CFS quota per 100000us period")
        ->check(CLI::PositiveNumber);
    app.add_flag("--network", network, "Give the sandbox a bridge network");
    app.add_option("--uploads-dir", uploads_dir, "Directory searched for upload references");
    app.add_option("--downloads-dir", downloads_dir, "Directory receiving retrieved artifacts");
    app.add_flag("--cleanup", cleanup, "Remove leftover managed containers and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("codecell"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        codecell::core::EngineConfig config;
        if (!config_path.empty()) {
            config = codecell::core::LoadEngineConfig(config_path);
        }

        // Command-line flags override the configuration file
        if (!image.empty()) config.image.image = image;
        if (timeout > 0) config.default_timeout = std::chrono::seconds(timeout);
        if (memory_mb > 0) config.limits.memory_limit_mb = memory_mb;
        if (cpu_quota > 0) config.limits.cpu_quota = cpu_quota;
        if (network) config.limits.network_enabled = true;
        if (!uploads_dir.empty()) config.uploads_directory = uploads_dir;
        if (!downloads_dir.empty()) config.downloads_directory = std::filesystem::path(downloads_dir);

        if (!codecell::utils::DockerRuntime::IsRuntimeAvailable(config.docker.binary)) {
            spdlog::error("Container runtime '{}' is not available", config.docker.binary);
            return 1;
        }
        spdlog::debug("Container runtime: {}",
                      codecell::utils::DockerRuntime::GetRuntimeVersion(config.docker.binary));

        codecell::core::ExecutionEngine engine(config);

        if (cleanup) {
            engine.CleanupOrphans();
            return 0;
        }

        json request = ReadRequest(request_source);
        json response = engine.ExecuteJson(request);

        std::cout << response.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;

        return response.value("success", false) ? 0 : 2;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const json::parse_error& e) {
        spdlog::error("Malformed JSON: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("Unknown error occurred");
        return 1;
    }
}
