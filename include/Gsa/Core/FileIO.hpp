/**
 * @file FileIO.hpp
 * @brief Safe file reading and exclusive file creation
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * File access used by the settings loader and the configuration document
 * facade:
 * - Reads are bounded in size, refuse symlinks and take the size from the
 *   open descriptor (no TOCTOU window between check and read)
 * - Writes never overwrite: the target is created with O_EXCL
 */

#pragma once

#ifndef GSA_CORE_FILE_IO_HPP
#define GSA_CORE_FILE_IO_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <string>

namespace Gsa::IO {

/// Default upper bound for files read into memory (64 MiB)
constexpr size_t DEFAULT_MAX_FILE_SIZE = 64 * 1024 * 1024;

/**
 * @brief Resolve a path to its canonical absolute form
 * @return Canonical path, or ErrorCode::FileNotFound if it does not exist
 */
Result<std::string> canonicalizePath(const std::string& path);

/**
 * @brief Check whether a canonical path lies inside a directory
 * @param canonicalPath Path already passed through canonicalizePath()
 * @param allowedDirectory Directory restriction; empty means unrestricted
 */
Result<bool> isPathWithin(const std::string& canonicalPath,
                          const std::string& allowedDirectory);

/**
 * @brief Read a whole file into memory
 * @param path File to read
 * @param maxSize Refuse files larger than this (ErrorCode::FileTooLarge)
 * @param allowedDirectory Optional directory restriction (ErrorCode::AccessDenied)
 * @return File contents or error
 */
Result<ByteBuffer> readFileSecurely(const std::string& path,
                                    size_t maxSize = DEFAULT_MAX_FILE_SIZE,
                                    const std::string& allowedDirectory = "");

/**
 * @brief Create a new file and write data to it
 *
 * Fails with ErrorCode::FileAlreadyExists when anything exists at the path;
 * the existing file is left untouched. A partially written file is removed.
 */
Result<void> writeFileExclusive(const std::string& path, ByteSpan data);

} // namespace Gsa::IO

#endif // GSA_CORE_FILE_IO_HPP
