#include <gtest/gtest.h>

#include "artifact_reader.hpp"
#include "test_support.hpp"

using namespace texharvest;
using namespace texharvest::test_support;

TEST(QpdfArtifactReader, ReadsTextAndInfo) {
    const QpdfArtifactReader reader;
    const auto outcome = reader.read(make_pdf("A Study of Things", "Hello from the rendered page"));
    ASSERT_TRUE(is_ok(outcome)) << std::get<PipelineError>(outcome).message;

    const auto& doc = std::get<RenderedDocument>(outcome);
    EXPECT_NE(doc.text.find("Hello from the rendered page"), std::string::npos);
    EXPECT_EQ(doc.metadata.at("title"), "A Study of Things");
    EXPECT_EQ(doc.metadata.at("pages"), "1");
    EXPECT_EQ(doc.metadata.count("author"), 0u);
}

TEST(QpdfArtifactReader, GarbageIsAProcessingError) {
    ScopedLogCapture logs;
    const QpdfArtifactReader reader;
    const auto outcome = reader.read(to_bytes("%PDF-1.4 this is not really a pdf"));
    ASSERT_FALSE(is_ok(outcome));
    const auto& err = std::get<PipelineError>(outcome);
    EXPECT_EQ(err.kind, ErrorKind::Processing);
    EXPECT_EQ(err.message.rfind("Failed to read rendered PDF", 0), 0u);
}

TEST(QpdfArtifactReader, EmptyInputFails) {
    ScopedLogCapture logs;
    const QpdfArtifactReader reader;
    EXPECT_FALSE(is_ok(reader.read({})));
}

TEST(NullArtifactReader, ReturnsSentinel) {
    const NullArtifactReader reader;
    const auto outcome = reader.read(to_bytes("anything"));
    ASSERT_TRUE(is_ok(outcome));
    EXPECT_EQ(std::get<RenderedDocument>(outcome).text, NullArtifactReader::kUnavailableText);
    EXPECT_TRUE(std::get<RenderedDocument>(outcome).metadata.empty());
}

TEST(ArtifactReaderFactory, SelectsByConfiguration) {
    EXPECT_EQ(make_artifact_reader(true)->name(), "qpdf");
    EXPECT_EQ(make_artifact_reader(false)->name(), "null");
}
