#include <gtest/gtest.h>
#include "test_support.h"
#include "core/folder_exporter.h"

namespace fs = std::filesystem;

namespace {

size_t countErrors(const std::vector<ExportError>& errors, ErrorKind kind) {
    size_t n = 0;
    for (const auto& e : errors) {
        if (e.kind == kind) n++;
    }
    return n;
}

} // namespace

class FolderExporterTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        source_.addDeck("P1", "", {makeSlide("s1"), makeSlide("s2")});
        source_.addDeck("P2", "Second", {makeSlide("s1")});
        source_.addDeck("P3", "Third", {makeSlide("s1")});
        // A -> B -> A is a cycle; C is a sibling of B
        source_.addFolder("A", "Alpha", {"P1"}, {"B", "C"});
        source_.addFolder("B", "Beta", {"P2"}, {"A"});
        source_.addFolder("C", "Gamma", {"P3"});
        source_.addFolder("root", "", {}, {"A"});

        config_.fetch_workers = 2;
        config_.render_workers = 2;
        config_.retry.base_delay = std::chrono::milliseconds(1);
        exporter_ = std::make_unique<PresentationExporter>(source_, cache_, config_);
        folders_ = std::make_unique<FolderExporter>(*exporter_, 2);
        options_.width = 320;
        options_.height = 180;
    }

    FolderExportSpec spec() {
        FolderExportSpec s;
        s.output_root = dir_ / "out";
        return s;
    }

    FakeRemoteSource source_;
    JsonCacheStore cache_;
    ExporterConfig config_;
    RenderOptions options_;
    std::unique_ptr<PresentationExporter> exporter_;
    std::unique_ptr<FolderExporter> folders_;
};

TEST_F(FolderExporterTest, CycleIsReportedAndSiblingsStillExport) {
    FolderExportSpec s = spec();
    s.folder_ids = {"A"};
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kPng}, options_);

    ASSERT_EQ(countErrors(result.errors, ErrorKind::kCyclicContainer), 1u);
    ASSERT_EQ(result.presentations.size(), 3u);
    for (const auto& p : result.presentations) {
        ASSERT_TRUE(p.success()) << p.presentation_id;
    }
    ASSERT_EQ(result.artifactCount(), 4u);
    ASSERT_FALSE(result.success());

    const fs::path out = dir_ / "out";
    ASSERT_TRUE(fs::exists(out / "Alpha" / "P1" / "0.png"));
    ASSERT_TRUE(fs::exists(out / "Alpha" / "P1" / "1.png"));
    ASSERT_TRUE(fs::exists(out / "Alpha" / "Beta" / "Second" / "0.png"));
    ASSERT_TRUE(fs::exists(out / "Alpha" / "Gamma" / "Third" / "0.png"));
    // Each container is listed once per run
    ASSERT_EQ(source_.listCalls(), 3);
}

TEST_F(FolderExporterTest, RootSentinelAddsNoDirectory) {
    source_.addFolder("B", "Beta", {"P2"});
    FolderExportSpec s = spec();
    s.include_root = true;
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kPng}, options_);
    ASSERT_TRUE(result.success()) << describeError(result.allErrors().front());
    ASSERT_EQ(result.presentations.size(), 3u);
    ASSERT_TRUE(fs::exists(dir_ / "out" / "Alpha" / "P1" / "0.png"));
    ASSERT_FALSE(fs::exists(dir_ / "out" / "root"));
}

TEST_F(FolderExporterTest, ExplicitAndDirectPresentations) {
    FolderExportSpec s = spec();
    s.presentation_ids = {"P3"};
    s.presentations.push_back(Presentation::explicitSlides("batch", "", {}, {{"P1", "s2", {}}, {"P2", "s1", {}}}));
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kSvg}, options_);
    ASSERT_TRUE(result.success()) << describeError(result.allErrors().front());
    ASSERT_EQ(result.presentations.size(), 2u);
    ASSERT_TRUE(fs::exists(dir_ / "out" / "Third" / "0.svg"));
    ASSERT_TRUE(fs::exists(dir_ / "out" / "batch" / "0.svg"));
    ASSERT_TRUE(fs::exists(dir_ / "out" / "batch" / "1.svg"));
    ASSERT_EQ(source_.listCalls(), 0);
}

TEST_F(FolderExporterTest, FailuresAreRecordedPerItem) {
    source_.addDeck("P5", "Bad", {makeSlide("")});
    source_.addFolder("D", "Delta", {"P5", "P404", "P3"}, {"X"});
    source_.addFolder("X", "Denied", {"P1"});
    source_.deny("X");

    FolderExportSpec s = spec();
    s.folder_ids = {"D", "missing-folder"};
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kPng}, options_);

    ASSERT_EQ(countErrors(result.errors, ErrorKind::kPermissionDenied), 1u);
    ASSERT_EQ(countErrors(result.errors, ErrorKind::kNotFound), 2u);       // folder and P404
    ASSERT_EQ(countErrors(result.errors, ErrorKind::kInvalidRequest), 1u); // P5 has an empty slide id
    ASSERT_EQ(result.presentations.size(), 1u);
    ASSERT_EQ(result.presentations[0].presentation_id, "P3");
    ASSERT_TRUE(fs::exists(dir_ / "out" / "Delta" / "Third" / "0.png"));
}

TEST_F(FolderExporterTest, DepthLimitStopsDescent) {
    source_.addFolder("L0", "L0", {}, {"L1"});
    source_.addFolder("L1", "L1", {"P2"}, {"L2"});
    source_.addFolder("L2", "L2", {"P3"});
    FolderExportSpec s = spec();
    s.folder_ids = {"L0"};
    s.max_depth = 1;
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kPng}, options_);
    ASSERT_EQ(countErrors(result.errors, ErrorKind::kInvalidRequest), 1u);
    ASSERT_EQ(result.presentations.size(), 1u);
    ASSERT_EQ(result.presentations[0].presentation_id, "P2");
    ASSERT_TRUE(fs::exists(dir_ / "out" / "L0" / "L1" / "Second" / "0.png"));
}

TEST_F(FolderExporterTest, DuplicateListingsExportOnce) {
    FolderExportSpec s = spec();
    s.folder_ids = {"C", "C"};
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kPng}, options_);
    ASSERT_TRUE(result.success());
    ASSERT_EQ(result.presentations.size(), 1u);
    ASSERT_EQ(source_.listCalls(), 1);
}

TEST_F(FolderExporterTest, RequestLevelProblemsThrowBeforeAnyCall) {
    FolderExportSpec s = spec();
    s.folder_ids = {"A"};
    ASSERT_THROW(folders_->exportTree(s, {}, options_), InvalidRequestError);

    RenderOptions bad = options_;
    bad.fps = 0.0;
    ASSERT_THROW(folders_->exportTree(s, {ExportFormat::kPng}, bad), InvalidRequestError);

    FolderExportSpec nothing = spec();
    ASSERT_THROW(folders_->exportTree(nothing, {ExportFormat::kPng}, options_), InvalidRequestError);

    FolderExportSpec noRoot;
    noRoot.folder_ids = {"A"};
    ASSERT_THROW(folders_->exportTree(noRoot, {ExportFormat::kPng}, options_), InvalidRequestError);

    ASSERT_EQ(source_.listCalls(), 0);
    ASSERT_EQ(source_.fetchCalls(), 0);
}

TEST_F(FolderExporterTest, CancelledTreeExportsNothing) {
    CancellationToken cancel;
    cancel.cancel();
    FolderExportSpec s = spec();
    s.presentation_ids = {"P1", "P2"};
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kPng}, options_, &cancel);
    ASSERT_EQ(countErrors(result.errors, ErrorKind::kCancelled), 2u);
    ASSERT_EQ(source_.fetchCalls(), 0);
}

TEST_F(FolderExporterTest, SameNamedDecksGetSeparateDirectories) {
    source_.addDeck("Pa", "Untitled", {makeSlide("a1", 0xFFFF0000)});
    source_.addDeck("Pb", "Untitled", {makeSlide("b1", 0xFF00FF00), makeSlide("b2")});
    source_.addFolder("D", "Drive", {"Pa", "Pb"});
    FolderExportSpec s = spec();
    s.folder_ids = {"D"};

    TreeExportResult first = folders_->exportTree(s, {ExportFormat::kPng}, options_);
    ASSERT_TRUE(first.success()) << describeError(first.allErrors().front());
    ASSERT_EQ(first.presentations.size(), 2u);
    ASSERT_EQ(first.artifactCount(), 3u);

    const fs::path out = dir_ / "out" / "Drive";
    ASSERT_TRUE(fs::exists(out / "Untitled" / "0.png"));
    ASSERT_FALSE(fs::exists(out / "Untitled" / "1.png"));
    ASSERT_TRUE(fs::exists(out / "Untitled (Pb)" / "0.png"));
    ASSERT_TRUE(fs::exists(out / "Untitled (Pb)" / "1.png"));

    // Neither deck overwrote the other, so both cache entries verify
    source_.resetCounters();
    TreeExportResult second = folders_->exportTree(s, {ExportFormat::kPng}, options_);
    ASSERT_TRUE(second.success());
    ASSERT_EQ(source_.fetchCalls(), 0);
    for (const auto& p : second.presentations) {
        for (const auto& artifact : p.artifacts) {
            ASSERT_TRUE(artifact.from_cache) << artifact.path;
        }
    }
}

TEST_F(FolderExporterTest, DirectIdAlsoFoundInRootExportsOnce) {
    source_.addFolder("root", "", {"P2"});
    FolderExportSpec s = spec();
    s.include_root = true;
    s.presentation_ids = {"P2"};
    TreeExportResult result = folders_->exportTree(s, {ExportFormat::kPng}, options_);
    ASSERT_TRUE(result.success());
    ASSERT_EQ(result.presentations.size(), 1u);
    ASSERT_FALSE(fs::exists(dir_ / "out" / "Second (P2)"));
}
