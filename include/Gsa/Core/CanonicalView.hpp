/**
 * @file CanonicalView.hpp
 * @brief Canonical byte form of an appliance configuration for signing
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * The appliance signs the serialized `<config>` element after two
 * version-dependent rewrites:
 * - `<uam_dir>` is removed together with its line layout
 * - non-blank `<uar_data>` is replaced by a placeholder carrying the
 *   HMAC-SHA1 of its trimmed content
 */

#pragma once

#ifndef GSA_CORE_CANONICAL_VIEW_HPP
#define GSA_CORE_CANONICAL_VIEW_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <Gsa/Core/XmlDocument.hpp>
#include <string>
#include <string_view>

namespace Gsa::Appliance {

/// Element names of the appliance export schema
namespace Element {
    constexpr std::string_view ROOT = "eef";
    constexpr std::string_view CONFIG = "config";
    constexpr std::string_view SIGNATURE = "signature";
    constexpr std::string_view UAM_DIR = "uam_dir";
    constexpr std::string_view UAR_DATA = "uar_data";
}

/// Text the appliance hashes in place of non-blank uar_data
constexpr std::string_view UAR_DATA_PREFIX = "\n/tmp/tmp_uar_data_dir,";
constexpr std::string_view UAR_DATA_SUFFIX = "\n          ";

/**
 * @brief Remove the `<uam_dir>` element together with its line layout
 *
 * Signed documents no longer carry the element, so its absence is not an
 * error. An empty `<uam_dir/>` leaves its indentation behind.
 *
 * @return true if an element was removed; ErrorCode::DuplicateElement for a
 *         repeated `<uam_dir>`
 */
Result<bool> removeUamDir(Xml::Document& document);

/**
 * @brief Replace non-blank `<uar_data>` content with its digest placeholder
 *
 * The first child's content is trimmed and terminated with a newline; when
 * anything is left it becomes UAR_DATA_PREFIX + hex(HMAC-SHA1(password,
 * content)) + UAR_DATA_SUFFIX. Blank content is left untouched.
 *
 * @return true if the content was replaced;
 *         ErrorCode::ElementNotFound / DuplicateElement for a missing or
 *         repeated `<uar_data>`, ErrorCode::UnexpectedNodeType when its first
 *         child is an element
 */
Result<bool> substituteUarData(Xml::Document& document, ByteSpan password);

/**
 * @brief Produce the exact bytes the configuration signature covers
 *
 * Parses its own copy of the document; the caller's bytes are not modified.
 * A `<signature>` element nested inside `<config>` contributes an empty
 * element, so embedding a signature does not change the digest.
 *
 * @param document Full exported document
 * @param password Signing password (UTF-8 bytes)
 * @return Serialized `<config>` subtree, or
 *         ErrorCode::XmlParseFailed, ElementNotFound (missing `<uar_data>`
 *         or `<config>`), DuplicateElement,
 *         UnexpectedNodeType
 */
Result<std::string> buildCanonicalView(ByteSpan document, ByteSpan password);

} // namespace Gsa::Appliance

#endif // GSA_CORE_CANONICAL_VIEW_HPP
