#include "massing/Errors.h"
#include "massing/io/JobReader.h"
#include "massing/io/ResultWriter.h"
#include "massing/params/ParameterLoader.h"
#include "massing/pipeline/BatchRunner.h"
#include "massing/utils/ParallelProgress.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <SDL3/SDL.h>

using json = nlohmann::json;

void printUsage(const char* programName) {
    SDL_Log("Usage: %s [options] <job.json>", programName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --config <path>     Default parameters (default: job \"defaults\" or config/default.json)");
    SDL_Log("  --output <dir>      Output directory (default: output)");
    SDL_Log("  --threads <int>     Worker threads (default: hardware concurrency)");
    SDL_Log("  --objective <name>  maximize_far_within_height, maximize_units or maximize_efficiency");
    SDL_Log("  --mode <name>       basic or advanced");
    SDL_Log("  --verbose           Debug logging");
    SDL_Log("  --help              Show this help message");
    SDL_Log("");
    SDL_Log("Examples:");
    SDL_Log("  %s data/sample_job.json", programName);
    SDL_Log("  %s --mode basic --objective maximize_units --output out data/sample_job.json", programName);
}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string outputDir = "output";
    std::string jobPath;
    json overrides = json::object();

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --config requires a value");
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--output") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --output requires a value");
                return 1;
            }
            outputDir = argv[++i];
        } else if (arg == "--threads") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --threads requires a value");
                return 1;
            }
            int threads = std::atoi(argv[++i]);
            if (threads < 1 || threads > 256) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: threads must be between 1 and 256");
                return 1;
            }
            massing::parallel::setThreadCount(static_cast<unsigned int>(threads));
        } else if (arg == "--objective") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --objective requires a value");
                return 1;
            }
            std::string name = argv[++i];
            if (!massing::params::parseObjective(name)) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: Unknown objective '%s'", name.c_str());
                return 1;
            }
            overrides["modeling_strategy"]["optimization_objective"] = name;
        } else if (arg == "--mode") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --mode requires a value");
                return 1;
            }
            std::string name = argv[++i];
            if (!massing::params::parseModelingMode(name)) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: Unknown mode '%s'. Use basic or advanced.", name.c_str());
                return 1;
            }
            overrides["modeling_strategy"]["modeling_mode"] = name;
        } else if (arg == "--verbose" || arg == "-v") {
            SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
        } else if (arg[0] == '-') {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: Unknown option '%s'", arg.c_str());
            printUsage(argv[0]);
            return 1;
        } else {
            jobPath = arg;
        }
    }

    if (jobPath.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: No job file specified");
        printUsage(argv[0]);
        return 1;
    }

    std::vector<massing::pipeline::LotJob> jobs;
    try {
        json job = massing::params::ParameterLoader::loadDocument(jobPath);

        if (configPath.empty()) {
            std::string jobDir = std::filesystem::path(jobPath).parent_path().string();
            configPath = massing::io::JobReader::defaultsPath(job, jobDir).value_or("config/default.json");
        }
        SDL_Log("Defaults: %s", configPath.c_str());
        json defaults = massing::params::ParameterLoader::loadDocument(configPath);

        jobs = massing::io::JobReader::fromJson(job, defaults, overrides);
    } catch (const massing::ConfigError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: %s", e.what());
        return 1;
    }

    SDL_Log("Evaluating %zu lots on %u threads", jobs.size(), massing::parallel::getThreadCount());

    massing::pipeline::ResultCollector collector;
    massing::pipeline::BatchRunner runner;
    runner.run(jobs, collector);

    std::vector<massing::pipeline::LotResult> results = collector.results();
    massing::io::ResultWriter writer(outputDir);

    bool ok = true;
    size_t feasible = 0;
    for (const auto& result : results) {
        ok = writer.writeLot(result) && ok;
        if (result.status == massing::pipeline::LotStatus::Ok) ++feasible;
    }
    ok = writer.writeSummary(results) && ok;

    SDL_Log("Done: %zu of %zu lots produced a massing", feasible, results.size());
    return ok ? 0 : 1;
}
