/**
 * @file ConfigDocument.hpp
 * @brief Appliance configuration document facade
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * What the import/export layer works with: raw exported bytes in, signed
 * bytes out. The parsed tree is never cached; every operation parses the
 * current bytes, and a mutation replaces the bytes with the re-serialized
 * tree, so bytes and tree cannot drift apart.
 */

#pragma once

#ifndef GSA_CORE_CONFIG_DOCUMENT_HPP
#define GSA_CORE_CONFIG_DOCUMENT_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <Gsa/Core/FileIO.hpp>
#include <string>
#include <string_view>

namespace Gsa::Appliance {

/**
 * @brief An appliance configuration export
 *
 * @example
 * ```cpp
 * auto doc = ConfigDocument::openFile("export.xml");
 * if (doc.isSuccess() && doc.value().sign(password).isSuccess()) {
 *     doc.value().writeFile("signed.xml");
 * }
 * ```
 */
class ConfigDocument {
public:
    /**
     * @brief Read a document from disk
     * @param path File to read
     * @param maxSize Refuse larger files with ErrorCode::FileTooLarge
     * @return Document; ErrorCode::FileNotFound when the path does not exist
     */
    static Result<ConfigDocument> openFile(const std::string& path,
                                           size_t maxSize = IO::DEFAULT_MAX_FILE_SIZE);

    /// Wrap bytes received from the appliance (UTF-8)
    static ConfigDocument fromString(std::string contents);

    /// Current document bytes (UTF-8)
    [[nodiscard]] const std::string& contents() const noexcept { return m_contents; }

    /// Replace the document bytes
    void setContents(std::string contents) { m_contents = std::move(contents); }

    /// hex(HMAC-SHA1) of the canonical view under `password`
    [[nodiscard]] Result<std::string> computeSignature(std::string_view password) const;

    /**
     * @brief Sign in place
     *
     * On failure the document bytes are left unchanged.
     */
    Result<void> sign(std::string_view password);

    /// Whether the embedded signature matches `password`
    [[nodiscard]] Result<bool> verifySignature(std::string_view password) const;

    /**
     * @brief Write the document to a new file
     *
     * The bytes are re-parsed and serialized with the `<eef>` root on its
     * own line, as the appliance import expects.
     *
     * @return ErrorCode::FileAlreadyExists if anything exists at `path`
     *         (left untouched), ErrorCode::XmlParseFailed for invalid XML
     */
    Result<void> writeFile(const std::string& path) const;

private:
    explicit ConfigDocument(std::string contents);

    std::string m_contents;
};

} // namespace Gsa::Appliance

#endif // GSA_CORE_CONFIG_DOCUMENT_HPP
