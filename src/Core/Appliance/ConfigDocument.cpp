/**
 * @file ConfigDocument.cpp
 * @brief Appliance configuration document facade implementation
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/ConfigDocument.hpp>
#include <Gsa/Core/CanonicalView.hpp>
#include <Gsa/Core/SignatureEngine.hpp>
#include <Gsa/Core/XmlDocument.hpp>
#include <Gsa/Core/Logger.hpp>

namespace Gsa::Appliance {

ConfigDocument::ConfigDocument(std::string contents)
    : m_contents(std::move(contents)) {}

Result<ConfigDocument> ConfigDocument::openFile(const std::string& path, size_t maxSize) {
    auto data = IO::readFileSecurely(path, maxSize);
    if (data.isFailure()) {
        GSA_LOG_DEBUG_F("Cannot read %s: %s", path.c_str(),
                        std::string(getErrorMessage(data.error())).c_str());
        return data.error();
    }

    GSA_LOG_DEBUG_F("Read %zu bytes from %s", data.value().size(), path.c_str());
    return ConfigDocument(toString(data.value()));
}

ConfigDocument ConfigDocument::fromString(std::string contents) {
    return ConfigDocument(std::move(contents));
}

Result<std::string> ConfigDocument::computeSignature(std::string_view password) const {
    SignatureEngine engine(asBytes(password));
    return engine.computeSignature(asBytes(m_contents));
}

Result<void> ConfigDocument::sign(std::string_view password) {
    SignatureEngine engine(asBytes(password));
    auto signedContents = engine.sign(asBytes(m_contents));
    if (signedContents.isFailure()) {
        return signedContents.error();
    }

    m_contents = std::move(signedContents).value();
    return Result<void>::Success();
}

Result<bool> ConfigDocument::verifySignature(std::string_view password) const {
    SignatureEngine engine(asBytes(password));
    return engine.verifySignature(asBytes(m_contents));
}

Result<void> ConfigDocument::writeFile(const std::string& path) const {
    auto loaded = Xml::Document::load(m_contents);
    if (loaded.isFailure()) {
        return loaded.error();
    }

    Xml::SerializeOptions options;
    options.rootOnOwnLine = std::string(Element::ROOT);
    std::string output = loaded.value().serialize(options);

    GSA_LOG_DEBUG_F("Writing XML to %s", path.c_str());
    return IO::writeFileExclusive(path, asBytes(output));
}

} // namespace Gsa::Appliance
