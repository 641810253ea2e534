/**
 * @file test_signature_engine.cpp
 * @brief Unit tests for configuration signing and verification
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/SignatureEngine.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace Gsa;
using namespace Gsa::Appliance;
using namespace Gsa::Testing;

namespace {

/// SAMPLE_EXPORT after signing with SAMPLE_PASSWORD
const std::string SIGNED_SAMPLE =
    "<?xml version=\"1.0\" ?>\n"
    "<eef>\n"
    "  <config Schema=\"2.0\">\n"
    "          <uar_data><![CDATA[\n"
    "AAAAAAAAAA==\n"
    "          ]]></uar_data>\n"
    "    <globalparams>\n"
    "      <var name=\"ADMIN_EMAIL\">admin@example.com</var>\n"
    "    </globalparams>\n"
    "  </config>\n"
    "  <signature><![CDATA[a560aaad78096cfb9d476b5c6ad6de1ae33767b8]]></signature>\n"
    "</eef>";

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    for (size_t pos = text.find(from); pos != std::string::npos;
         pos = text.find(from, pos + to.size())) {
        text.replace(pos, from.size(), to);
    }
    return text;
}

} // namespace

class SignatureEngineTest : public ::testing::Test {
protected:
    SignatureEngine engine{asBytes(SAMPLE_PASSWORD)};
};

// ============================================================================
// Digest
// ============================================================================

TEST_F(SignatureEngineTest, ComputeSignature_KnownDigest) {
    auto digest = engine.computeSignature(asBytes(SAMPLE_EXPORT));

    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(digest.value(), SAMPLE_SIGNATURE);
}

TEST_F(SignatureEngineTest, ComputeSignature_BlankUarData) {
    auto digest = engine.computeSignature(asBytes(SAMPLE_EXPORT_BLANK_UAR));

    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(digest.value(), SAMPLE_BLANK_UAR_SIGNATURE);
}

TEST_F(SignatureEngineTest, ComputeSignature_Deterministic) {
    auto first = engine.computeSignature(asBytes(SAMPLE_EXPORT));
    auto second = engine.computeSignature(asBytes(SAMPLE_EXPORT));
    SignatureEngine other(asBytes(SAMPLE_PASSWORD));
    auto third = other.computeSignature(asBytes(SAMPLE_EXPORT));

    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    ASSERT_TRUE(third.isSuccess());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value(), third.value());
}

TEST_F(SignatureEngineTest, ComputeSignature_PasswordNotTrimmed) {
    SignatureEngine padded(asBytes(std::string(SAMPLE_PASSWORD) + " "));

    auto digest = padded.computeSignature(asBytes(SAMPLE_EXPORT));

    ASSERT_TRUE(digest.isSuccess());
    EXPECT_NE(digest.value(), SAMPLE_SIGNATURE);
}

// ============================================================================
// Signing
// ============================================================================

TEST_F(SignatureEngineTest, Sign_SampleExport) {
    auto signedDoc = engine.sign(asBytes(SAMPLE_EXPORT));

    ASSERT_TRUE(signedDoc.isSuccess());
    EXPECT_EQ(signedDoc.value(), SIGNED_SAMPLE);
}

TEST_F(SignatureEngineTest, Sign_IsIdempotent) {
    auto once = engine.sign(asBytes(SAMPLE_EXPORT));
    ASSERT_TRUE(once.isSuccess());

    auto twice = engine.sign(asBytes(once.value()));
    ASSERT_TRUE(twice.isSuccess());
    EXPECT_EQ(twice.value(), once.value());
}

TEST_F(SignatureEngineTest, Sign_MinimalDocument) {
    auto signedDoc = engine.sign(asBytes(MINIMAL_EXPORT));

    ASSERT_TRUE(signedDoc.isSuccess());
    EXPECT_EQ(signedDoc.value(),
              "<?xml version=\"1.0\" ?>\n"
              "<eef><config><uar_data/>"
              "<signature>08bdaaf8357b71afa8de80c670d3d8f910f8b3fa</signature>"
              "</config></eef>");
    EXPECT_EQ(signedDoc.value().find("uam_dir"), std::string::npos);
}

TEST_F(SignatureEngineTest, Sign_MissingSignature) {
    auto result = engine.sign(asBytes("<eef><config><uam_dir/><uar_data/></config></eef>"));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ElementNotFound);
}

TEST_F(SignatureEngineTest, Sign_SignatureWithElementChild) {
    auto result = engine.sign(asBytes(
        "<eef><config><uam_dir/><uar_data/></config><signature><x/></signature></eef>"));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::UnexpectedNodeType);
}

TEST_F(SignatureEngineTest, Sign_MalformedDocument) {
    auto result = engine.sign(asBytes("not xml at all"));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::XmlParseFailed);
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(SignatureEngineTest, Verify_RoundTrip) {
    for (const char* document : {SAMPLE_EXPORT, SAMPLE_EXPORT_BLANK_UAR, MINIMAL_EXPORT}) {
        auto signedDoc = engine.sign(asBytes(document));
        ASSERT_TRUE(signedDoc.isSuccess()) << document;

        auto verified = engine.verifySignature(asBytes(signedDoc.value()));

        ASSERT_TRUE(verified.isSuccess()) << document;
        EXPECT_TRUE(verified.value()) << document;
    }
}

TEST_F(SignatureEngineTest, Verify_StoredWithSurroundingWhitespace) {
    std::string document = replaceAll(SAMPLE_EXPORT,
                                      "<signature><![CDATA[\n  ]]>",
                                      std::string("<signature><![CDATA[\n  ") +
                                          SAMPLE_SIGNATURE + "\n  ]]>");

    auto verified = engine.verifySignature(asBytes(document));

    ASSERT_TRUE(verified.isSuccess());
    EXPECT_TRUE(verified.value());
}

TEST_F(SignatureEngineTest, Verify_EmbeddedSignatureInsideConfig) {
    auto signedDoc = engine.sign(asBytes(MINIMAL_EXPORT));
    ASSERT_TRUE(signedDoc.isSuccess());

    // Put uam_dir back the way a fresh export carries it
    std::string reexported = replaceAll(signedDoc.value(), "<config>", "<config><uam_dir/>");

    auto verified = engine.verifySignature(asBytes(reexported));

    ASSERT_TRUE(verified.isSuccess());
    EXPECT_TRUE(verified.value());
}

TEST_F(SignatureEngineTest, Verify_UnsignedDocument_ReturnsFalse) {
    auto verified = engine.verifySignature(asBytes(SAMPLE_EXPORT));

    ASSERT_TRUE(verified.isSuccess()) << "A mismatch is not an error";
    EXPECT_FALSE(verified.value());
}

TEST_F(SignatureEngineTest, Verify_TamperedConfig_ReturnsFalse) {
    std::string signedDocument = replaceAll(SAMPLE_EXPORT,
                                            "<signature><![CDATA[\n  ]]>",
                                            std::string("<signature><![CDATA[") +
                                                SAMPLE_SIGNATURE + "]]>");
    std::string tampered = replaceAll(signedDocument, "admin@example.com", "root@example.com");

    auto original = engine.verifySignature(asBytes(signedDocument));
    ASSERT_TRUE(original.isSuccess());
    EXPECT_TRUE(original.value());

    auto verified = engine.verifySignature(asBytes(tampered));
    ASSERT_TRUE(verified.isSuccess());
    EXPECT_FALSE(verified.value());

    auto digest = engine.computeSignature(asBytes(tampered));
    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(digest.value(), "b162c5c33034fe0428d327b293b89ef1eee4a8d1");
}

TEST_F(SignatureEngineTest, Verify_WrongPassword_ReturnsFalse) {
    std::string signedDocument = replaceAll(SAMPLE_EXPORT,
                                            "<signature><![CDATA[\n  ]]>",
                                            std::string("<signature><![CDATA[") +
                                                SAMPLE_SIGNATURE + "]]>");
    SignatureEngine wrong(asBytes("otherpassword"));

    auto verified = wrong.verifySignature(asBytes(signedDocument));
    ASSERT_TRUE(verified.isSuccess());
    EXPECT_FALSE(verified.value());

    auto digest = wrong.computeSignature(asBytes(SAMPLE_EXPORT));
    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(digest.value(), "82f8652aed912efeb9c96f118f013ba1553d4898");
}

TEST_F(SignatureEngineTest, Verify_TruncatedStoredValue_ReturnsFalse) {
    std::string document = replaceAll(SAMPLE_EXPORT,
                                      "<signature><![CDATA[\n  ]]>",
                                      std::string("<signature><![CDATA[") +
                                          std::string(SAMPLE_SIGNATURE).substr(0, 39) + "]]>");

    auto verified = engine.verifySignature(asBytes(document));

    ASSERT_TRUE(verified.isSuccess());
    EXPECT_FALSE(verified.value());
}

TEST_F(SignatureEngineTest, Verify_MissingSignature) {
    auto result = engine.verifySignature(
        asBytes("<eef><config><uam_dir/><uar_data/></config></eef>"));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ElementNotFound);
}

TEST_F(SignatureEngineTest, Verify_MalformedDocument) {
    auto result = engine.verifySignature(asBytes("<eef>"));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::XmlParseFailed);
}
