/**
 * @file Types.hpp
 * @brief Core type definitions for the GsaConf appliance configuration tool
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the GsaConf codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef GSA_CORE_TYPES_HPP
#define GSA_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <memory>

namespace Gsa {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw buffers
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

// ============================================================================
// Hash Types
// ============================================================================

/// Length of a lowercase hex encoded SHA-1 digest
constexpr size_t SHA1_HEX_LENGTH = 40;

// ============================================================================
// Byte/String Conversion
// ============================================================================

/**
 * @brief View the UTF-8 bytes of a string without copying
 */
inline ByteSpan asBytes(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

/**
 * @brief Copy a byte buffer into a UTF-8 string
 */
inline std::string toString(ByteSpan data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace Gsa

#endif // GSA_CORE_TYPES_HPP
