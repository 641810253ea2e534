/**
 * @file CommandLine.hpp
 * @brief Command-line handling for the gsaconf tool
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#pragma once

#ifndef GSA_TOOLS_COMMAND_LINE_HPP
#define GSA_TOOLS_COMMAND_LINE_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <Gsa/Core/Config.hpp>
#include <Gsa/Core/FileIO.hpp>
#include <Gsa/Core/Logger.hpp>

#include <optional>
#include <ostream>
#include <string>

namespace Gsa::Tools {

enum class Action {
    None,
    Sign,       ///< Sign the input file into a new output file
    Verify,     ///< Check the input file's signature
    Canonical   ///< Print the bytes the signature covers
};

/// Process exit codes, kept compatible with the scripts built around the tool
namespace ExitCode {
    constexpr int Success = 0;
    constexpr int Failure = 1;      ///< Mismatch, unreadable or invalid document
    constexpr int UsageError = 3;   ///< Bad or missing arguments
}

/// The appliance rejects shorter signing passwords
constexpr size_t MIN_PASSWORD_LENGTH = 8;

struct Options {
    Action action = Action::None;
    std::string inputFile;
    std::string outputFile;
    std::optional<std::string> password;
    std::string configFile;
    int verbosity = 0;
    bool showHelp = false;
    bool showVersion = false;

    // Settings file only
    std::optional<Core::LogLevel> logLevel;
    std::string logFile;
    size_t maxDocumentSize = IO::DEFAULT_MAX_FILE_SIZE;
};

/**
 * @brief Parse argv
 * @return Options, or ErrorCode::InvalidArgument for unknown options,
 *         missing option arguments, stray operands or more than one action
 */
Result<Options> parseCommandLine(int argc, char* argv[]);

/**
 * @brief Fill in what the command line left open from a settings file
 *
 * The command line wins: `sign_password` is used only without `-g`, and
 * `log_level` only without `-v`.
 *
 * @return ErrorCode::ConfigInvalid for an unknown level or a bad size
 */
Result<void> applySettings(Options& options, const Config::ConfigMap& settings);

/**
 * @brief Check that the chosen action has everything it needs
 * @return ErrorCode::InvalidArgument (the reason is logged)
 */
Result<void> validateOptions(const Options& options);

/// Log level from `-v` count, settings file, or the default (warning)
Core::LogLevel effectiveLogLevel(const Options& options);

/**
 * @brief Run the selected action
 * @param out Destination for document output (canonical view without -o)
 * @return Process exit code
 */
int runAction(const Options& options, std::ostream& out);

/// Print the help text
void printUsage(std::ostream& out, const char* program);

} // namespace Gsa::Tools

#endif // GSA_TOOLS_COMMAND_LINE_HPP
