#include <gtest/gtest.h>
#include "core/export_format.h"
#include "core/export_request.h"
#include "core/export_result.h"
#include <cmath>
#include <limits>

namespace {

ExportRequest makeRequest() {
    ExportRequest request;
    request.presentation = Presentation::sourced("P1", "Deck", {}, {{"P1", "s1", {}}, {"P1", "s2", {}}},
                                                 nlohmann::json::object());
    request.formats = {ExportFormat::kPng};
    request.output_root = "out";
    return request;
}

} // namespace

TEST(ExportFormatTest, ParseTags) {
    ASSERT_EQ(parseExportFormat("PNG"), ExportFormat::kPng);
    ASSERT_EQ(parseExportFormat("jpg"), ExportFormat::kJpeg);
    ASSERT_EQ(parseExportFormat(" jpeg "), ExportFormat::kJpeg);
    ASSERT_EQ(parseExportFormat("mp4"), ExportFormat::kMp4);
    ASSERT_THROW(parseExportFormat("gif"), InvalidRequestError);
    ASSERT_STREQ(formatExtension(ExportFormat::kJpeg), "jpg");
    ASSERT_STREQ(formatExtension(ExportFormat::kSvg), "svg");
}

TEST(ExportFormatTest, NormalizeSortsAndDeduplicates) {
    auto formats = normalizeFormats({ExportFormat::kMp4, ExportFormat::kPng, ExportFormat::kMp4, ExportFormat::kSvg});
    ASSERT_EQ(formats, (std::vector<ExportFormat>{ExportFormat::kSvg, ExportFormat::kPng, ExportFormat::kMp4}));
    ASSERT_THROW(normalizeFormats({static_cast<ExportFormat>(42)}), InvalidRequestError);
}

TEST(ExportRequestTest, DefaultsValidate) {
    ASSERT_NO_THROW(validateRequest(makeRequest()));
}

TEST(ExportRequestTest, RejectsStructuralProblems) {
    ExportRequest request = makeRequest();
    request.formats.clear();
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request = makeRequest();
    request.options.fps = 0.0;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request = makeRequest();
    request.options.width = 1280;
    request.options.height = 0;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request = makeRequest();
    request.options.width = 0;
    request.options.height = 0;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);
    request.options.dpi = 144.0f;
    ASSERT_NO_THROW(validateRequest(request));

    request = makeRequest();
    request.options.jpeg_quality = 101;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request = makeRequest();
    request.options.codec_options = {{"", "fast"}};
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request = makeRequest();
    request.output_root.clear();
    ASSERT_THROW(validateRequest(request), InvalidRequestError);
}

TEST(ExportRequestTest, DurationsMustBeFiniteAndFitTheFrameCounter) {
    const double inf = std::numeric_limits<double>::infinity();

    ExportRequest request = makeRequest();
    request.options.slide_duration_secs = inf;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);
    request.options.slide_duration_secs = std::nan("");
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request = makeRequest();
    request.options.total_video_duration_secs = inf;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    // 1e9 seconds at 24 fps is more frames than an int can count
    request = makeRequest();
    request.options.fps = 24.0;
    request.options.slide_duration_secs = 1e9;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);
    request.options.slide_duration_secs = 3600.0;
    ASSERT_NO_THROW(validateRequest(request));
    request.options.total_video_duration_secs = 1e9;
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request = makeRequest();
    request.presentation = Presentation::explicitSlides("batch", "", {}, {{"P1", "s1", inf}});
    ASSERT_THROW(validateRequest(request), InvalidRequestError);
    request.presentation = Presentation::explicitSlides("batch", "", {}, {{"P1", "s1", 1e12}});
    ASSERT_THROW(validateRequest(request), InvalidRequestError);
    request.presentation = Presentation::explicitSlides("batch", "", {}, {{"P1", "s1", 2.5}});
    ASSERT_NO_THROW(validateRequest(request));
}

TEST(ExportRequestTest, ExplicitSlideListMustNotBeEmpty) {
    ExportRequest request = makeRequest();
    request.presentation = Presentation::explicitSlides("batch", "", {}, {});
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request.presentation = Presentation::explicitSlides("batch", "", {}, {{"P1", "s1", -1.0}});
    ASSERT_THROW(validateRequest(request), InvalidRequestError);

    request.presentation = Presentation::explicitSlides("batch", "", {}, {{"P1", "s1", 2.0}, {"P2", "s9", {}}});
    ASSERT_NO_THROW(validateRequest(request));
}

TEST(ExportRequestTest, EffectiveDurations) {
    RenderOptions options;
    options.slide_duration_secs = 3.0;
    Presentation p = Presentation::explicitSlides("b", "", {}, {{"P1", "s1", {}}, {"P1", "s2", 1.5}, {"P2", "s1", {}}});
    ASSERT_EQ(effectiveDurations(p, options), (std::vector<double>{3.0, 1.5, 3.0}));

    options.total_video_duration_secs = 12.0;
    ASSERT_EQ(effectiveDurations(p, options), (std::vector<double>{4.0, 1.5, 4.0}));
}

TEST(ExportRequestTest, SizesFromResolutionOrDpi) {
    RenderOptions options;
    options.width = 1280;
    options.height = 720;
    ASSERT_EQ(stillSize(options, 960.0f, 540.0f), (PixelSize{1280, 720}));
    ASSERT_EQ(videoSize(options, 960.0f, 540.0f), (PixelSize{1280, 720}));

    options.width = 0;
    options.height = 0;
    options.dpi = 72.0f;
    ASSERT_EQ(stillSize(options, 721.0f, 405.0f), (PixelSize{721, 405}));
    // Derived video sizes are rounded down to even dimensions
    ASSERT_EQ(videoSize(options, 721.0f, 405.0f), (PixelSize{720, 404}));

    options.video_width = 640;
    options.video_height = 360;
    ASSERT_EQ(videoSize(options, 721.0f, 405.0f), (PixelSize{640, 360}));
}

TEST(ExportRequestTest, NamingScheme) {
    ASSERT_EQ(parseNamingScheme("Named"), NamingScheme::kNamed);
    ASSERT_EQ(parseNamingScheme("index"), NamingScheme::kIndex);
    ASSERT_THROW(parseNamingScheme("fancy"), InvalidRequestError);
}
