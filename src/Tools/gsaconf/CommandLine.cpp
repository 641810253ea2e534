/**
 * @file CommandLine.cpp
 * @brief Command-line handling for the gsaconf tool
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include "CommandLine.hpp"

#include <Gsa/Core/CanonicalView.hpp>
#include <Gsa/Core/ConfigDocument.hpp>

#include <getopt.h>

namespace Gsa::Tools {

namespace {

// Long-only options; -c stays free for the appliance tool's collection report
constexpr int OPT_CONFIG = 256;
constexpr int OPT_CANONICAL = 257;

const char* actionName(Action action) {
    switch (action) {
        case Action::Sign:      return "sign";
        case Action::Verify:    return "verify";
        case Action::Canonical: return "canonical";
        case Action::None:      break;
    }
    return "none";
}

void logFailure(const char* what, const std::string& path, ErrorCode error) {
    GSA_LOG_ERROR_F("%s %s: %s", what, path.c_str(),
                    std::string(getErrorMessage(error)).c_str());
    if (isDocumentError(error)) {
        GSA_LOG_INFO("Expected an appliance configuration export with <config>, "
                     "<uar_data> and <signature> elements");
    }
}

Result<Appliance::ConfigDocument> openInput(const Options& options) {
    auto document = Appliance::ConfigDocument::openFile(options.inputFile,
                                                        options.maxDocumentSize);
    if (document.isFailure()) {
        if (document.error() == ErrorCode::FileNotFound) {
            GSA_LOG_ERROR_F("Input file does not exist: %s", options.inputFile.c_str());
        } else {
            logFailure("Cannot read", options.inputFile, document.error());
        }
    }
    return document;
}

int runSign(const Options& options) {
    GSA_LOG_INFO_F("Signing %s", options.inputFile.c_str());

    auto document = openInput(options);
    if (document.isFailure()) {
        return ExitCode::Failure;
    }

    auto signResult = document.value().sign(*options.password);
    if (signResult.isFailure()) {
        logFailure("Cannot sign", options.inputFile, signResult.error());
        return ExitCode::Failure;
    }

    GSA_LOG_INFO_F("Writing signed file to %s", options.outputFile.c_str());
    auto writeResult = document.value().writeFile(options.outputFile);
    if (writeResult.isFailure()) {
        logFailure("Cannot write", options.outputFile, writeResult.error());
        return ExitCode::Failure;
    }
    return ExitCode::Success;
}

int runVerify(const Options& options) {
    auto document = openInput(options);
    if (document.isFailure()) {
        return ExitCode::Failure;
    }

    auto verified = document.value().verifySignature(*options.password);
    if (verified.isFailure()) {
        logFailure("Cannot verify", options.inputFile, verified.error());
        return ExitCode::Failure;
    }

    if (!verified.value()) {
        GSA_LOG_WARNING("XML Signature/HMAC does NOT match supplied password");
        return ExitCode::Failure;
    }

    GSA_LOG_INFO("XML Signature/HMAC matches supplied password");
    return ExitCode::Success;
}

int runCanonical(const Options& options, std::ostream& out) {
    auto document = openInput(options);
    if (document.isFailure()) {
        return ExitCode::Failure;
    }

    auto view = Appliance::buildCanonicalView(asBytes(document.value().contents()),
                                              asBytes(*options.password));
    if (view.isFailure()) {
        logFailure("Cannot canonicalize", options.inputFile, view.error());
        return ExitCode::Failure;
    }

    if (options.outputFile.empty()) {
        out << view.value();
        out.flush();
        return out ? ExitCode::Success : ExitCode::Failure;
    }

    auto writeResult = IO::writeFileExclusive(options.outputFile, asBytes(view.value()));
    if (writeResult.isFailure()) {
        logFailure("Cannot write", options.outputFile, writeResult.error());
        return ExitCode::Failure;
    }
    return ExitCode::Success;
}

} // namespace

Result<Options> parseCommandLine(int argc, char* argv[]) {
    static const struct option longOptions[] = {
        {"sign",          no_argument,       nullptr, 's'},
        {"verify",        no_argument,       nullptr, 'r'},
        {"canonical",     no_argument,       nullptr, OPT_CANONICAL},
        {"input-file",    required_argument, nullptr, 'f'},
        {"output",        required_argument, nullptr, 'o'},
        {"sign-password", required_argument, nullptr, 'g'},
        {"config",        required_argument, nullptr, OPT_CONFIG},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"help",          no_argument,       nullptr, 'h'},
        {"version",       no_argument,       nullptr, 'V'},
        {nullptr, 0, nullptr, 0}
    };

    Options options;

    // Full rescan on every call; errors are reported through the logger
    optind = 0;
    opterr = 0;

    int c;
    while ((c = getopt_long(argc, argv, ":srf:o:g:vhV", longOptions, nullptr)) != -1) {
        Action requested = Action::None;

        switch (c) {
            case 's': requested = Action::Sign; break;
            case 'r': requested = Action::Verify; break;
            case OPT_CANONICAL: requested = Action::Canonical; break;
            case 'f': options.inputFile = optarg; break;
            case 'o': options.outputFile = optarg; break;
            case 'g': options.password = std::string(optarg); break;
            case OPT_CONFIG: options.configFile = optarg; break;
            case 'v': options.verbosity++; break;
            case 'h': options.showHelp = true; break;
            case 'V': options.showVersion = true; break;

            case ':':
                GSA_LOG_ERROR_F("Option %s requires an argument", argv[optind - 1]);
                return ErrorCode::InvalidArgument;

            case '?':
            default:
                if (optopt != 0) {
                    GSA_LOG_ERROR_F("Unknown option -%c", optopt);
                } else {
                    GSA_LOG_ERROR_F("Unknown option %s", argv[optind - 1]);
                }
                return ErrorCode::InvalidArgument;
        }

        if (requested != Action::None) {
            if (options.action != Action::None && options.action != requested) {
                GSA_LOG_ERROR("Specify only one action");
                return ErrorCode::InvalidArgument;
            }
            options.action = requested;
        }
    }

    if (optind < argc) {
        GSA_LOG_ERROR_F("Unexpected argument %s", argv[optind]);
        return ErrorCode::InvalidArgument;
    }

    return options;
}

Result<void> applySettings(Options& options, const Config::ConfigMap& settings) {
    if (!options.password) {
        options.password = Config::getString(settings, Config::Keys::SIGN_PASSWORD);
    }

    if (auto level = Config::getString(settings, Config::Keys::LOG_LEVEL)) {
        auto parsed = Core::Logger::ParseLevel(*level);
        if (!parsed) {
            GSA_LOG_ERROR_F("Unknown log level '%s'", level->c_str());
            return ErrorCode::ConfigInvalid;
        }
        options.logLevel = parsed;
    }

    if (auto logFile = Config::getString(settings, Config::Keys::LOG_FILE)) {
        options.logFile = *logFile;
    }

    auto maxSize = Config::getUnsigned(settings, Config::Keys::MAX_DOCUMENT_SIZE);
    if (maxSize.isFailure()) {
        GSA_LOG_ERROR_F("%s must be a byte count", Config::Keys::MAX_DOCUMENT_SIZE);
        return maxSize.error();
    }
    if (maxSize.value()) {
        if (*maxSize.value() == 0) {
            GSA_LOG_ERROR_F("%s must not be zero", Config::Keys::MAX_DOCUMENT_SIZE);
            return ErrorCode::ConfigInvalid;
        }
        options.maxDocumentSize = static_cast<size_t>(*maxSize.value());
    }

    return Result<void>::Success();
}

Result<void> validateOptions(const Options& options) {
    if (options.action == Action::None) {
        GSA_LOG_ERROR("No action given, use one of --sign, --verify or --canonical");
        return ErrorCode::InvalidArgument;
    }

    if (options.inputFile.empty()) {
        GSA_LOG_ERROR("Input file not given");
        return ErrorCode::InvalidArgument;
    }

    if (options.action == Action::Sign && options.outputFile.empty()) {
        GSA_LOG_ERROR("Output file not given");
        return ErrorCode::InvalidArgument;
    }

    // The uar_data placeholder depends on the password, so every action needs one
    if (!options.password || options.password->empty()) {
        GSA_LOG_ERROR("Signing password not given");
        return ErrorCode::InvalidArgument;
    }

    if (options.password->size() < MIN_PASSWORD_LENGTH) {
        GSA_LOG_ERROR_F("Signing password must be %zu characters or longer",
                        MIN_PASSWORD_LENGTH);
        return ErrorCode::InvalidArgument;
    }

    return Result<void>::Success();
}

Core::LogLevel effectiveLogLevel(const Options& options) {
    switch (options.verbosity) {
        case 0:  return options.logLevel.value_or(Core::LogLevel::Warning);
        case 1:  return Core::LogLevel::Info;
        case 2:  return Core::LogLevel::Debug;
        default: return Core::LogLevel::Trace;
    }
}

int runAction(const Options& options, std::ostream& out) {
    GSA_LOG_DEBUG_F("Running action %s", actionName(options.action));

    switch (options.action) {
        case Action::Sign:      return runSign(options);
        case Action::Verify:    return runVerify(options);
        case Action::Canonical: return runCanonical(options, out);
        case Action::None:      break;
    }
    return ExitCode::UsageError;
}

void printUsage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " ACTION -f FILE [options]\n"
        << "\n"
        << "Actions (exactly one):\n"
        << "  -s, --sign               :: Sign FILE into the --output file\n"
        << "  -r, --verify             :: Verify the signature/HMAC in FILE\n"
        << "      --canonical          :: Write the bytes the signature covers\n"
        << "\n"
        << "Options:\n"
        << "  -f, --input-file FILE    :: Input XML file\n"
        << "  -o, --output FILE        :: Output file name (never overwritten)\n"
        << "  -g, --sign-password PW   :: Sign password, 8 characters or longer\n"
        << "      --config FILE        :: Settings file (key=value)\n"
        << "  -v, --verbose            :: Specify multiple times to increase verbosity\n"
        << "  -h, --help               :: This help\n"
        << "  -V, --version            :: Print the version\n"
        << "\n"
        << "Settings file keys: " << Config::Keys::SIGN_PASSWORD << ", "
        << Config::Keys::LOG_LEVEL << ", " << Config::Keys::LOG_FILE << ", "
        << Config::Keys::MAX_DOCUMENT_SIZE << "\n";
}

} // namespace Gsa::Tools
