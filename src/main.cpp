/**
 * @file main.cpp
 * @brief Algoscope - Command-line interface
 *
 * Entry point for the sandboxed execution, trace and benchmark engine.
 * Every subcommand prints one JSON document on stdout; logs go to stderr.
 *
 * **Subcommands**:
 * - `execute`   run a program (request file, stdin, or --code-file)
 * - `benchmark` time a cataloged routine over input sizes
 * - `info`      engine metadata and catalogs
 * - `health`    runtime availability checks
 * - `serve`     line-delimited `{id, route, body}` requests on stdin
 *
 * Exit code is 0 when the response status is 200, 1 otherwise.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "algoscope/api/api_service.hpp"
#include "algoscope/core/config_loader.hpp"
#include "algoscope/core/request_orchestrator.hpp"
#include "algoscope/utils/string_utils.hpp"
#include "algoscope/utils/worker_pool.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::string ReadAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string ReadTextFile(const std::string& path) {
    if (path == "-") {
        return ReadAll(std::cin);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + path);
    }
    return ReadAll(file);
}

int Emit(const algoscope::api::ApiResponse& response) {
    std::cout << response.body.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return response.status == 200 ? 0 : 1;
}

void ConfigureLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("algoscope");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

int Serve(const algoscope::api::ApiService& service, std::size_t workers) {
    spdlog::info("Serving line-delimited requests on stdin with {} worker(s)", workers);

    algoscope::utils::WorkerPool pool(workers);
    std::mutex output_mutex;
    std::size_t handled = 0;

    std::string line;
    while (std::getline(std::cin, line)) {
        if (algoscope::utils::StringUtils::Trim(line).empty()) {
            continue;
        }
        ++handled;
        pool.Submit([&service, &output_mutex, line]() {
            auto reply = service.HandleEnvelopeLine(line);
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << reply << '\n' << std::flush;
        });
    }

    pool.Shutdown();
    spdlog::info("Input closed after {} request(s)", handled);
    return 0;
}

} // namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Algoscope - sandboxed execution, trace and benchmark engine"};
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;
    int timeout_ms = 0;
    std::string node_binary;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--timeout-ms", timeout_ms, "Execution timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--node", node_binary, "Path to the node interpreter");

    // execute
    auto* execute = app.add_subcommand("execute", "Run a program in the sandbox");
    std::string request_path;
    std::string code_path;
    std::string language = "javascript";
    std::string algorithm;
    std::string input_text;

    auto* request_opt = execute->add_option("-r,--request", request_path,
                                            "Execute request body (JSON file, '-' for stdin)");
    auto* code_opt = execute->add_option("-f,--code-file", code_path, "Program source file")
        ->check(CLI::ExistingFile);
    request_opt->excludes(code_opt);
    auto* language_opt = execute->add_option("-l,--language", language, "Program language")
        ->default_val("javascript");
    auto* algorithm_opt = execute->add_option("-a,--algorithm", algorithm,
                                              "Algorithm id selecting a reference trace");
    auto* input_opt = execute->add_option("-i,--input", input_text, "Input value (JSON)");
    language_opt->excludes(request_opt);
    algorithm_opt->excludes(request_opt);
    input_opt->excludes(request_opt);

    // benchmark
    auto* bench = app.add_subcommand("benchmark", "Benchmark a cataloged routine");
    std::string bench_algorithm;
    std::string bench_language = "javascript";
    std::vector<std::size_t> sizes;
    std::size_t warmup = 0;
    double min_duration_ms = 0.0;
    std::size_t max_iterations = 0;

    bench->add_option("-a,--algorithm", bench_algorithm, "Routine id")->required();
    bench->add_option("-l,--language", bench_language, "Language")->default_val("javascript");
    auto* sizes_opt = bench->add_option("--sizes", sizes, "Input sizes, e.g. 8,16,32")->delimiter(',');
    auto* warmup_opt = bench->add_option("--warmup", warmup, "Warmup iterations per size");
    auto* min_duration_opt = bench->add_option("--min-duration-ms", min_duration_ms,
                                               "Target measured time per size");
    auto* max_iterations_opt = bench->add_option("--max-iterations", max_iterations,
                                                 "Iteration cap per size");

    // info / health / serve
    auto* info = app.add_subcommand("info", "Show engine metadata");
    auto* health = app.add_subcommand("health", "Show runtime health checks");
    auto* serve = app.add_subcommand("serve", "Process line-delimited requests from stdin");
    std::size_t workers = 4;
    serve->add_option("-w,--workers", workers, "Concurrent requests")
        ->default_val(4)
        ->check(CLI::Range(1, 256));

    CLI11_PARSE(app, argc, argv);

    ConfigureLogging(verbose);

    try {
        algoscope::core::RequestOrchestrator::Config config;
        if (!config_path.empty()) {
            config = algoscope::core::ConfigLoader::LoadFromFile(config_path);
        }
        if (verbose) {
            config.verbose_logging = true;
        } else if (config.verbose_logging) {
            spdlog::set_level(spdlog::level::debug);
        }
        if (timeout_ms > 0) {
            config.sandbox.timeout = std::chrono::milliseconds(timeout_ms);
        }
        if (!node_binary.empty()) {
            config.sandbox.node_binary = node_binary;
        }

        algoscope::core::RequestOrchestrator orchestrator(config);
        if (!orchestrator.Initialize()) {
            spdlog::error("Failed to initialize engine");
            return 1;
        }

        algoscope::api::ApiService service(orchestrator);

        if (*execute) {
            if (!request_path.empty()) {
                return Emit(service.DispatchRaw("execute", ReadTextFile(request_path)));
            }
            if (code_path.empty()) {
                spdlog::error("execute needs --request or --code-file");
                return 1;
            }

            json body = {
                {"language", language},
                {"code", ReadTextFile(code_path)}
            };
            if (!algorithm.empty()) {
                body["algorithmId"] = algorithm;
            }
            if (!input_text.empty()) {
                auto input = json::parse(input_text, nullptr, false);
                if (input.is_discarded()) {
                    return Emit({400, algoscope::api::ErrorBody(
                        algoscope::core::ErrorKind::VALIDATION_ERROR, "Invalid JSON in --input.")});
                }
                body["input"] = std::move(input);
            }
            return Emit(service.HandleExecute(body));
        }

        if (*bench) {
            json body = {
                {"algorithmId", bench_algorithm},
                {"language", bench_language}
            };
            if (sizes_opt->count() > 0) {
                body["sizes"] = sizes;
            }
            if (warmup_opt->count() > 0) {
                body["warmupIterations"] = warmup;
            }
            if (min_duration_opt->count() > 0) {
                body["minDurationMs"] = min_duration_ms;
            }
            if (max_iterations_opt->count() > 0) {
                body["maxIterations"] = max_iterations;
            }
            return Emit(service.HandleBenchmark(body));
        }

        if (*info) {
            return Emit(service.HandleInfo());
        }

        if (*health) {
            return Emit(service.HandleHealth());
        }

        if (*serve) {
            return Serve(service, workers);
        }

        return 1;

    } catch (const algoscope::core::EngineError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
