/**
 * @file    crop_resolver_test.cpp
 * @brief   Template matching, crop estimation and recovery tests
 * @license MIT
 */

#include "core/crop_resolver.hpp"
#include "core/dct_transform.hpp"
#include "core/errors.hpp"
#include "core/image_mark.hpp"
#include "core/template_matcher.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace dmt {
namespace {

using test::noise_image;

std::shared_ptr<const TemplateMatcher> ncc(NccMatcherOptions options = NccMatcherOptions{}) {
    return std::make_shared<NccTemplateMatcher>(std::move(options));
}

// ---------------------------------------------------------------------------
// NccTemplateMatcher
// ---------------------------------------------------------------------------

TEST(NccTemplateMatcherTest, FindsExactFragment) {
    const cv::Mat image = noise_image(160, 120);
    const cv::Mat templ = image(cv::Rect(37, 21, 50, 40)).clone();

    const MatchResult match = NccTemplateMatcher{}.best_match(image, templ, OperationContext{});
    EXPECT_EQ(match.location, cv::Point(37, 21));
    EXPECT_EQ(match.size, cv::Size(50, 40));
    EXPECT_NEAR(match.score, 1.0, 1e-3);
    EXPECT_DOUBLE_EQ(match.scale, 1.0);
}

TEST(NccTemplateMatcherTest, TiesResolveToFirstInRasterOrder) {
    // Two identical patches on a flat background
    cv::Mat image(60, 100, CV_8UC3, cv::Scalar::all(128));
    const cv::Mat patch = noise_image(10, 10, 3, 5);
    patch.copyTo(image(cv::Rect(70, 5, 10, 10)));
    patch.copyTo(image(cv::Rect(20, 40, 10, 10)));

    const MatchResult match = NccTemplateMatcher{}.best_match(image, patch, OperationContext{});
    EXPECT_EQ(match.location, cv::Point(70, 5));
}

TEST(NccTemplateMatcherTest, RescaledTemplateIsFoundAtMatchingScale) {
    const cv::Mat image = noise_image(200, 160);
    cv::Mat region = image(cv::Rect(40, 30, 80, 60));

    // Fragment shrunk to half size (template / region = 0.5)
    cv::Mat templ;
    cv::resize(region, templ, cv::Size(40, 30), 0, 0, cv::INTER_AREA);

    NccMatcherOptions options;
    options.scales = {1.0, 0.5};
    const MatchResult match =
        NccTemplateMatcher(options).best_match(image, templ, OperationContext{});

    EXPECT_DOUBLE_EQ(match.scale, 0.5);
    EXPECT_EQ(match.size, cv::Size(80, 60));
    EXPECT_NEAR(match.location.x, 40, 1);
    EXPECT_NEAR(match.location.y, 30, 1);
}

TEST(NccTemplateMatcherTest, InvalidOptionsAreRejected) {
    NccMatcherOptions no_scales;
    no_scales.scales.clear();
    EXPECT_THROW(NccTemplateMatcher{no_scales}, ValidationError);

    NccMatcherOptions bad_scale;
    bad_scale.scales = {0.0};
    EXPECT_THROW(NccTemplateMatcher{bad_scale}, ValidationError);
}

// ---------------------------------------------------------------------------
// estimate_crop
// ---------------------------------------------------------------------------

TEST(CropEstimateTest, LocatesCropInOriginal) {
    const cv::Mat original = noise_image(256, 192);
    const CropBox box{64, 40, 200, 152};
    const cv::Mat templ = original(box.to_rect()).clone();

    CropGeometryResolver resolver(ncc());
    const CropEstimate estimate = resolver.estimate_crop(original, templ);

    EXPECT_EQ(estimate.box, box);
    EXPECT_EQ(estimate.shape, (CanvasShape{256, 192}));
    EXPECT_GT(estimate.score, 0.99);
    EXPECT_DOUBLE_EQ(estimate.scale, 1.0);
}

TEST(CropEstimateTest, UnrelatedTemplateIsNoMatch) {
    const cv::Mat original = noise_image(128, 128, 3, 1);
    const cv::Mat unrelated = noise_image(48, 48, 3, 2);

    CropGeometryResolver resolver(ncc(NccMatcherOptions{.confidence_floor = 0.9}));
    try {
        resolver.estimate_crop(original, unrelated);
        FAIL() << "expected NoMatchError";
    } catch (const NoMatchError& e) {
        EXPECT_EQ(e.tag(), "no_match");
        EXPECT_LT(e.best_score(), 0.9);
    }
}

TEST(CropEstimateTest, OversizeTemplateIsRejected) {
    CropGeometryResolver resolver(ncc());
    EXPECT_THROW(resolver.estimate_crop(noise_image(32, 32), noise_image(40, 20)),
                 ValidationError);
    EXPECT_THROW(resolver.estimate_crop(cv::Mat(), noise_image(4, 4)), ValidationError);
}

TEST(CropEstimateTest, MatcherIsRequired) {
    EXPECT_THROW(CropGeometryResolver(nullptr), ValidationError);
}

// ---------------------------------------------------------------------------
// recover_crop
// ---------------------------------------------------------------------------

TEST(CropRecoverTest, PlacesTemplateExactlyAndFillsTheRest) {
    const cv::Mat templ = noise_image(30, 20);
    CropGeometryResolver resolver(ncc(), cv::Scalar::all(7));

    const CropBox box{10, 5, 40, 25};
    const cv::Mat canvas = resolver.recover_crop(templ, box, CanvasShape{64, 48});

    ASSERT_EQ(canvas.size(), cv::Size(64, 48));
    ASSERT_EQ(canvas.type(), templ.type());
    EXPECT_EQ(cv::norm(canvas(box.to_rect()), templ, cv::NORM_INF), 0.0);

    cv::Mat outside = canvas.clone();
    outside(box.to_rect()).setTo(cv::Scalar::all(7));
    EXPECT_EQ(cv::norm(outside, cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(7)), cv::NORM_INF), 0.0);
}

TEST(CropRecoverTest, SquareCropOnSquareCanvas) {
    const cv::Mat original = noise_image(200, 200);
    const CropBox box{10, 10, 110, 110};
    const cv::Mat templ = original(box.to_rect()).clone();

    CropGeometryResolver resolver(ncc());
    const cv::Mat canvas = resolver.recover_crop(templ, box, CanvasShape{200, 200});

    EXPECT_EQ(cv::norm(canvas(box.to_rect()), templ, cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::countNonZero(canvas.reshape(1).colRange(0, 30)), 0);   // left strip
    EXPECT_EQ(cv::countNonZero(canvas(cv::Rect(0, 150, 200, 50)).reshape(1)), 0);
}

TEST(CropRecoverTest, InvalidGeometryIsRejected) {
    const cv::Mat templ = noise_image(30, 20);
    CropGeometryResolver resolver(ncc());

    // Outside the canvas
    EXPECT_THROW(resolver.recover_crop(templ, CropBox{40, 0, 70, 20}, CanvasShape{64, 48}),
                 ValidationError);
    // Size mismatch: recovery never resizes
    EXPECT_THROW(resolver.recover_crop(templ, CropBox{0, 0, 31, 20}, CanvasShape{64, 48}),
                 ValidationError);
    EXPECT_THROW(resolver.recover_crop(templ, CropBox{0, 0, 30, 20}, CanvasShape{0, 48}),
                 ValidationError);
    // Canvas too large to allocate
    EXPECT_THROW(resolver.recover_crop(templ, CropBox{0, 0, 30, 20},
                                       CanvasShape{1 << 30, 1 << 30}),
                 ValidationError);
    EXPECT_THROW(resolver.recover_crop(cv::Mat(), CropBox{0, 0, 30, 20}, CanvasShape{64, 48}),
                 ValidationError);
}

// ---------------------------------------------------------------------------
// Embed -> cut -> estimate -> recover -> extract
// ---------------------------------------------------------------------------

TEST(CropPipelineTest, MarkSurvivesCropAfterRecovery) {
    InvisibleImageMarkOrchestrator orchestrator(std::make_shared<DctQimTransform>(),
                                                std::make_shared<OpenCvAttackSimulator>());
    CropGeometryResolver resolver(ncc());

    const Payload payload{'c', 'r', 'o', 'p'};
    const cv::Mat original = noise_image(256, 256);
    const EmbeddedMark mark = orchestrator.embed(original, payload, 3, 9);

    // Block-aligned cut keeping well over half the blocks
    AttackParams cut;
    cut.box = CropBox{16, 32, 240, 224};
    const cv::Mat fragment = orchestrator.attack(mark.image, AttackType::Cut, cut);

    const CropEstimate estimate = resolver.estimate_crop(mark.image, fragment);
    ASSERT_EQ(estimate.box, *cut.box);

    const cv::Mat recovered = resolver.recover_crop(fragment, estimate.box, estimate.shape);
    EXPECT_EQ(orchestrator.extract(recovered, mark.bit_length, 3, 9), payload);
}

}  // namespace
}  // namespace dmt
