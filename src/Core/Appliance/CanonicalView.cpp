/**
 * @file CanonicalView.cpp
 * @brief Canonicalization of appliance configuration exports
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/CanonicalView.hpp>
#include <Gsa/Core/Crypto.hpp>
#include <Gsa/Core/Logger.hpp>

namespace Gsa::Appliance {

namespace {

// ASCII only: uar_data carries base64, so no other whitespace can surround it
constexpr const char* UAR_DATA_WHITESPACE = " \t\n\r\v\f";

std::string trimmedPayload(const std::string& value) {
    size_t first = value.find_first_not_of(UAR_DATA_WHITESPACE);
    if (first == std::string::npos) {
        return "\n";
    }
    size_t last = value.find_last_not_of(UAR_DATA_WHITESPACE);
    return value.substr(first, last - first + 1) + '\n';
}

} // namespace

Result<bool> removeUamDir(Xml::Document& document) {
    auto uamDir = document.findSingle(Element::UAM_DIR);
    if (uamDir.isFailure()) {
        if (uamDir.error() == ErrorCode::ElementNotFound) {
            return false;
        }
        return uamDir.error();
    }

    // An empty uam_dir is written as <uam_dir/> by the appliance, whose exporter
    // only strips the indentation around the open/close tag form
    auto fixup = Xml::hasChildren(uamDir.value()) ? Xml::WhitespaceFixup::ElementLine
                                                  : Xml::WhitespaceFixup::None;
    Xml::removeFromParent(uamDir.value(), fixup);
    return true;
}

Result<bool> substituteUarData(Xml::Document& document, ByteSpan password) {
    Xml::Node uarData = nullptr;
    GSA_TRY_ASSIGN(uarData, document.findSingle(Element::UAR_DATA));

    std::string value;
    GSA_TRY_ASSIGN(value, Xml::firstChildText(uarData));

    std::string payload = trimmedPayload(value);
    if (payload == "\n") {
        return false;
    }

    GSA_LOG_DEBUG("UAR data contains data, replacing it with its digest");

    Crypto::HMAC hmac(password);
    std::string digest;
    GSA_TRY_ASSIGN(digest, hmac.computeHex(asBytes(payload)));

    std::string placeholder;
    placeholder.reserve(UAR_DATA_PREFIX.size() + digest.size() + UAR_DATA_SUFFIX.size());
    placeholder += UAR_DATA_PREFIX;
    placeholder += digest;
    placeholder += UAR_DATA_SUFFIX;

    GSA_TRY(Xml::setText(uarData, placeholder));
    GSA_LOG_TRACE_F("uar_data replaced by %s", Xml::serialize(uarData).c_str());
    return true;
}

Result<std::string> buildCanonicalView(ByteSpan document, ByteSpan password) {
    auto loaded = Xml::Document::load(document);
    if (loaded.isFailure()) {
        return loaded.error();
    }
    Xml::Document doc = std::move(loaded).value();

    GSA_TRY(removeUamDir(doc));
    GSA_TRY(substituteUarData(doc, password));

    Xml::Node config = nullptr;
    GSA_TRY_ASSIGN(config, doc.findSingle(Element::CONFIG));

    // A signature stored inside <config> must not feed back into its own digest
    Xml::Node signature = doc.findFirst(Element::SIGNATURE);
    if (signature != nullptr && Xml::isWithin(signature, config)) {
        Xml::removeChildren(signature);
    }

    return Xml::serialize(config);
}

} // namespace Gsa::Appliance
