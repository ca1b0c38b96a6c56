// Rule debugger CLI
// Runs a business rule step by step and prints the recorded trace as JSON

#include "RuleDebugger.h"
#include "common/Constants.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

void printUsage(const char *programName) {
    std::cerr << "Usage: " << programName << " [options] <rule.py | ->\n";
    std::cerr << "   or: " << programName << " --request <request.json | ->\n\n";
    std::cerr << "Execute a business rule and print its step trace as JSON on stdout.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --instrument         Run through the step-marker rewrite instead of the tree walker\n";
    std::cerr << "  --control-steps      Also record if/elif tests and loop iterations (tree walk)\n";
    std::cerr << "  --source             Include the instrumented source in the result\n";
    std::cerr << "  --step N             Pause after step N (implies --instrument)\n";
    std::cerr << "  --continue N         Resume after step N and pause at the next breakpoint\n";
    std::cerr << "  --breakpoint L       Breakpoint on rule line L (repeatable)\n";
    std::cerr << "  --max-steps N        Step budget (default " << RSE::Constants::DEFAULT_MAX_STEPS << ")\n";
    std::cerr << "  --max-iterations N   Loop iteration budget (default "
              << RSE::Constants::DEFAULT_MAX_LOOP_ITERATIONS << ")\n";
    std::cerr << "  --request FILE       Answer an interactive stepping request (JSON)\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << programName << " discount_rule.py\n";
    std::cerr << "  " << programName << " --step 3 discount_rule.py\n";
    std::cerr << "  echo 'x = 1' | " << programName << " -\n";
}

std::string readInput(const std::string &path) {
    if (path == "-") {
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    fs::path filePath(path);
    if (!fs::exists(filePath)) {
        throw std::runtime_error("File does not exist: " + filePath.string());
    }

    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

size_t parseCount(const std::string &flag, const std::string &value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < 0) {
            throw std::invalid_argument(value);
        }
        return static_cast<size_t>(parsed);
    } catch (const std::logic_error &) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
    }
}

void printFatal(const std::string &error, const std::string &traceback) {
    RSE::json payload = {{"error", error}, {"traceback", traceback}};
    std::cout << RSE::Constants::ERROR_SENTINEL << "\n" << RSE::JsonUtils::toPrettyString(payload) << std::endl;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    RSE::Logger::initialize();

    RSE::DebugOptions options;
    std::string inputPath;
    std::string requestPath;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto nextValue = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(arg + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--instrument") {
                options.mode = RSE::ExecutionMode::Instrumented;
            } else if (arg == "--control-steps") {
                options.recordControlSteps = true;
            } else if (arg == "--source") {
                options.includeSource = true;
            } else if (arg == "--step") {
                options.mode = RSE::ExecutionMode::Instrumented;
                options.stepMode = RSE::StepMode::RunToTarget;
                options.targetStep = parseCount(arg, nextValue());
            } else if (arg == "--continue") {
                options.mode = RSE::ExecutionMode::Instrumented;
                options.stepMode = RSE::StepMode::Continue;
                options.resumeAfter = parseCount(arg, nextValue());
            } else if (arg == "--breakpoint") {
                options.breakpoints.insert(static_cast<int>(parseCount(arg, nextValue())));
            } else if (arg == "--max-steps") {
                options.maxSteps = parseCount(arg, nextValue());
            } else if (arg == "--max-iterations") {
                options.maxLoopIterations = parseCount(arg, nextValue());
            } else if (arg == "--request") {
                requestPath = nextValue();
            } else if (arg.size() > 1 && arg[0] == '-') {
                throw std::invalid_argument("Unknown option: " + arg);
            } else {
                inputPath = arg;
            }
        }
    } catch (const std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    if (inputPath.empty() == requestPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        if (!requestPath.empty()) {
            std::string parseError;
            auto requestJson = RSE::JsonUtils::parseJson(readInput(requestPath), &parseError);
            if (!requestJson) {
                printFatal("Invalid request JSON: " + parseError, "");
                return 1;
            }
            auto request = RSE::StepDebugRequest::fromJson(*requestJson, &parseError);
            if (!request) {
                printFatal("Invalid request: " + parseError, "");
                return 1;
            }
            RSE::RuleDebugger debugger(options);
            std::cout << RSE::JsonUtils::toPrettyString(debugger.debugStep(*request).toJson()) << std::endl;
            return 0;
        }

        std::string source = readInput(inputPath);
        RSE::DebugResult result = RSE::debugBusinessRule(source, options);
        std::cout << RSE::JsonUtils::toPrettyString(result.toJson()) << std::endl;
        return 0;

    } catch (const std::exception &e) {
        LOG_ERROR("rule-debugger failed: {}", e.what());
        printFatal(e.what(), std::string(RSE::Constants::TRACEBACK_HEADER) + "\n" + e.what());
        return 1;
    }
}
