/**
 * @file SecureConfigLoader.cpp
 * @brief Implementation of secure settings loading
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/Config.hpp>
#include <Gsa/Core/FileIO.hpp>
#include <Gsa/Core/Logger.hpp>

#include <charconv>
#include <sstream>

namespace Gsa::Config {

class SecureConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<ConfigMap> parseConfig(ByteSpan data) {
        ConfigMap config;

        std::istringstream stream(toString(data));
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(stream, line)) {
            ++lineNumber;

            // Leading whitespace does not count toward comment detection
            line.erase(0, line.find_first_not_of(" \t"));

            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';' || line == "\r") {
                continue;
            }

            // Find key=value separator
            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                GSA_LOG_ERROR_F("Settings line %zu has no '=' separator", lineNumber);
                return ErrorCode::ConfigParseFailed;
            }

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            // Trim whitespace
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);

            if (key.empty()) {
                GSA_LOG_ERROR_F("Settings line %zu has an empty key", lineNumber);
                return ErrorCode::ConfigParseFailed;
            }

            // A double-quoted value is taken verbatim, surrounding spaces included
            if (!value.empty() && value.front() == '"') {
                if (value.size() < 2 || value.back() != '"') {
                    GSA_LOG_ERROR_F("Settings line %zu has an unterminated quote", lineNumber);
                    return ErrorCode::ConfigParseFailed;
                }
                value = value.substr(1, value.size() - 2);
            }

            config[key] = value;
        }

        return config;
    }
};

SecureConfigLoader::SecureConfigLoader()
    : SecureConfigLoader(Options{}) {}

SecureConfigLoader::SecureConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

SecureConfigLoader::~SecureConfigLoader() = default;

Result<ConfigMap> SecureConfigLoader::load(const std::string& path) {
    auto dataResult = IO::readFileSecurely(path,
                                           m_impl->options.max_file_size,
                                           m_impl->options.allowed_directory);
    if (dataResult.isFailure()) {
        if (dataResult.error() == ErrorCode::FileNotFound) {
            return ErrorCode::ConfigFileNotFound;
        }
        return dataResult.error();
    }

    GSA_LOG_DEBUG_F("Loaded settings file %s", path.c_str());
    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> SecureConfigLoader::loadFromMemory(ByteSpan data) {
    return m_impl->parseConfig(data);
}

std::optional<std::string> getString(const ConfigMap& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::optional<uint64_t>> getUnsigned(const ConfigMap& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) {
        return std::optional<uint64_t>{};
    }

    const std::string& text = it->second;
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || text.empty()) {
        return ErrorCode::ConfigInvalid;
    }
    return std::optional<uint64_t>{value};
}

} // namespace Gsa::Config
