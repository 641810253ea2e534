/**
 * @file main.cpp
 * @brief gsaconf entry point
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * Offline signing and verification of appliance configuration exports.
 */

#include "CommandLine.hpp"

#include <Gsa/Core/Config.hpp>
#include <Gsa/Core/Logger.hpp>

#include <iostream>

using namespace Gsa;

namespace {

/**
 * @brief Switch the logger to the configured level and outputs
 */
void configureLogging(const Tools::Options& options) {
    auto& logger = Core::Logger::Instance();
    Core::LogLevel level = Tools::effectiveLogLevel(options);

    if (options.logFile.empty()) {
        logger.SetMinLevel(level);
        return;
    }

    logger.Shutdown();
    if (!logger.Initialize(level, options.logFile)) {
        // Keep console logging if the file cannot be opened
        logger.Initialize(level);
        GSA_LOG_WARNING_F("Cannot log to %s", options.logFile.c_str());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Core::Logger::Instance();
    logger.Initialize(Core::LogLevel::Warning);

    auto parsed = Tools::parseCommandLine(argc, argv);
    if (parsed.isFailure()) {
        Tools::printUsage(std::cerr, argv[0]);
        return Tools::ExitCode::UsageError;
    }
    Tools::Options options = std::move(parsed).value();

    if (options.showHelp) {
        Tools::printUsage(std::cout, argv[0]);
        return Tools::ExitCode::Success;
    }
    if (options.showVersion) {
        std::cout << VERSION_STRING << std::endl;
        return Tools::ExitCode::Success;
    }

    if (!options.configFile.empty()) {
        Config::SecureConfigLoader loader;
        auto settings = loader.load(options.configFile);
        if (settings.isFailure()) {
            GSA_LOG_ERROR_F("Cannot load settings %s: %s", options.configFile.c_str(),
                            std::string(getErrorMessage(settings.error())).c_str());
            return Tools::ExitCode::UsageError;
        }
        if (Tools::applySettings(options, settings.value()).isFailure()) {
            return Tools::ExitCode::UsageError;
        }
    }

    configureLogging(options);

    if (Tools::validateOptions(options).isFailure()) {
        return Tools::ExitCode::UsageError;
    }

    int exitCode = Tools::runAction(options, std::cout);
    logger.Shutdown();
    return exitCode;
}
