/**
 * @file Config.hpp
 * @brief Secure settings file loading for the gsaconf tools
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * Settings files are plain key=value text; wrap a value in double quotes to
 * keep leading or trailing spaces. Loading protects against:
 * - TOCTOU (Time-Of-Check-To-Time-Of-Use) attacks
 * - Path traversal attacks
 * - Symlink attacks
 * - File size DoS attacks
 */

#pragma once

#ifndef GSA_CORE_CONFIG_HPP
#define GSA_CORE_CONFIG_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <string>
#include <map>
#include <optional>
#include <memory>

namespace Gsa::Config {

using ConfigMap = std::map<std::string, std::string>;

/// Settings keys understood by the command-line tool
namespace Keys {
    constexpr const char* SIGN_PASSWORD = "sign_password";
    constexpr const char* LOG_LEVEL = "log_level";
    constexpr const char* LOG_FILE = "log_file";
    constexpr const char* MAX_DOCUMENT_SIZE = "max_document_size";
}

/**
 * @brief Secure settings loader
 *
 * Security features:
 * - Atomic file operations (no TOCTOU)
 * - Path canonicalization
 * - Size limits
 */
class SecureConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;  // 1MB default
        std::string allowed_directory;       // Restrict to directory
    };

    SecureConfigLoader();
    explicit SecureConfigLoader(const Options& options);
    ~SecureConfigLoader();

    /**
     * @brief Load settings from file
     * @param path Path to settings file
     * @return Parsed settings or error
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Load settings from memory
     * @param data Settings text
     * @return Parsed settings or error
     */
    Result<ConfigMap> loadFromMemory(ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Look up a string setting
 */
std::optional<std::string> getString(const ConfigMap& config, const std::string& key);

/**
 * @brief Look up an unsigned integer setting
 * @return std::nullopt when absent, ErrorCode::ConfigInvalid when not a number
 */
Result<std::optional<uint64_t>> getUnsigned(const ConfigMap& config, const std::string& key);

} // namespace Gsa::Config

#endif // GSA_CORE_CONFIG_HPP
