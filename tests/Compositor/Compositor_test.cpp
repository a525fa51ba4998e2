/*
Cutout Studio
Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include <CutoutStudio/Compositor/Compositor.hpp>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <CutoutStudio/Compositor/Canvas.hpp>
#include <CutoutStudio/Compositor/CompositorError.hpp>
#include <CutoutStudio/Compositor/ImageCodec.hpp>

#include "Fixture.hpp"
#include "NullLogger.hpp"

using namespace CutoutStudio::Compositor;

namespace {

std::shared_ptr<const RasterImage> share(RasterImage image)
{
	return std::make_shared<const RasterImage>(std::move(image));
}

// 1000x500 background whose outer 150 columns on each side are red and the rest green.
RasterImage makeBannerBackground()
{
	std::vector<std::uint8_t> rgba(1000 * 500 * 4);
	for (std::uint32_t y = 0; y < 500; ++y) {
		for (std::uint32_t x = 0; x < 1000; ++x) {
			const Rgba color = (x < 150 || x >= 850) ? RED : GREEN;
			const std::size_t i = (static_cast<std::size_t>(y) * 1000 + x) * 4;
			rgba[i + 0] = color.r;
			rgba[i + 1] = color.g;
			rgba[i + 2] = color.b;
			rgba[i + 3] = color.a;
		}
	}
	return RasterImage(1000, 500, std::move(rgba));
}

bool isNear(const cv::Vec3b &bgr, Rgba expected, int tolerance)
{
	return std::abs(bgr[2] - expected.r) <= tolerance && std::abs(bgr[1] - expected.g) <= tolerance &&
	       std::abs(bgr[0] - expected.b) <= tolerance;
}

} // namespace

class CompositorTest : public ::testing::Test {
protected:
	Compositor compositor{std::make_shared<NullLogger>()};
};

TEST_F(CompositorTest, TransparentPngPassesOriginalBytesThrough)
{
	const std::vector<std::uint8_t> original = encodeWithOpenCv(makeCutoutImage(64, 48, BLUE), ".png");

	CompositionRequest request;
	request.foreground = share(decodeImage(original));
	request.mode = OutputMode::TransparentPNG;
	request.subjectFileName = "portrait.jpeg";

	const EncodedOutput output = compositor.compose(request);
	EXPECT_EQ(output.bytes, original);
	EXPECT_EQ(output.mimeType, "image/png");
	EXPECT_EQ(output.suggestedFileName, "bg-removed-portrait.png");
}

TEST_F(CompositorTest, TransparentPngWithoutSourceBytesIsLossless)
{
	const RasterImage foreground = makeCutoutImage(20, 10, RED);

	CompositionRequest request;
	request.foreground = share(foreground);
	request.subjectFileName = "a.png";

	const EncodedOutput output = compositor.compose(request);
	const RasterImage roundTripped = decodeImage(output.bytes);
	ASSERT_EQ(roundTripped.getWidth(), 20u);
	ASSERT_EQ(roundTripped.getHeight(), 10u);
	EXPECT_TRUE(std::equal(foreground.getPixels().begin(), foreground.getPixels().end(),
			       roundTripped.getPixels().begin()));
}

TEST_F(CompositorTest, CompositeOnWideBackgroundScenario)
{
	CompositionRequest request;
	request.foreground = share(makeCutoutImage(400, 300, BLUE));
	request.background = share(makeBannerBackground());
	request.mode = OutputMode::TransparentPNG;
	request.subjectFileName = "photo.png";

	const EncodedOutput output = compositor.compose(request);
	EXPECT_EQ(output.mimeType, "image/png");
	EXPECT_EQ(output.suggestedFileName, "composite-photo.png");

	const RasterImage composite = decodeImage(output.bytes);
	ASSERT_EQ(composite.getWidth(), 400u);
	ASSERT_EQ(composite.getHeight(), 300u);
	EXPECT_TRUE(composite.isFullyOpaque());

	// The cover crop spans columns 166.67..833.33, so none of the red margin is visible.
	EXPECT_EQ(composite.pixelAt(0, 0), GREEN);
	EXPECT_EQ(composite.pixelAt(399, 0), GREEN);
	EXPECT_EQ(composite.pixelAt(0, 299), GREEN);
	EXPECT_EQ(composite.pixelAt(399, 299), GREEN);
	EXPECT_EQ(composite.pixelAt(200, 150), BLUE);
}

TEST_F(CompositorTest, CompositeDimensionsFollowForeground)
{
	const std::shared_ptr<const RasterImage> background = share(makeSolidImage(1000, 500, GREEN));
	const struct {
		std::uint32_t w, h;
	} sizes[] = {{400, 300}, {90, 160}, {1, 1}, {1200, 40}};

	for (const auto &size : sizes) {
		const RasterImage composite =
			Compositor::placeOnBackground(makeCutoutImage(size.w, size.h, RED), *background);
		EXPECT_EQ(composite.getWidth(), size.w);
		EXPECT_EQ(composite.getHeight(), size.h);
	}
}

TEST_F(CompositorTest, FlattenedJpegWithoutBackground)
{
	CompositionRequest request;
	request.foreground = share(makeCutoutImage(64, 32, BLUE));
	request.mode = OutputMode::FlattenedJPEG;
	request.subjectFileName = "cat.photo.png";

	const EncodedOutput output = compositor.compose(request);
	EXPECT_EQ(output.mimeType, "image/jpeg");
	EXPECT_EQ(output.suggestedFileName, "bg-removed-cat.jpg");

	const cv::Mat decoded = decodeWithOpenCv(output.bytes);
	ASSERT_EQ(decoded.cols, 64);
	ASSERT_EQ(decoded.rows, 32);
	EXPECT_TRUE(isNear(decoded.at<cv::Vec3b>(0, 0), WHITE, 3));
}

TEST_F(CompositorTest, FlattenOnWhiteLeavesNoTransparentPixel)
{
	const RasterImage flattened = Compositor::flattenOnWhite(makeCutoutImage(50, 50, RED));
	EXPECT_FALSE(flattened.hasFullyTransparentPixel());
	EXPECT_TRUE(flattened.isFullyOpaque());
	EXPECT_EQ(flattened.pixelAt(0, 0), WHITE);
	EXPECT_EQ(flattened.pixelAt(25, 25), RED);
}

TEST_F(CompositorTest, FlattenedJpegWithBackground)
{
	CompositionRequest request;
	request.foreground = share(makeCutoutImage(400, 300, BLUE));
	request.background = share(makeBannerBackground());
	request.mode = OutputMode::FlattenedJPEG;
	request.subjectFileName = "photo.png";

	const EncodedOutput output = compositor.compose(request);
	EXPECT_EQ(output.mimeType, "image/jpeg");
	EXPECT_EQ(output.suggestedFileName, "composite-photo.jpg");

	const cv::Mat decoded = decodeWithOpenCv(output.bytes);
	ASSERT_EQ(decoded.cols, 400);
	ASSERT_EQ(decoded.rows, 300);
	EXPECT_TRUE(isNear(decoded.at<cv::Vec3b>(5, 5), GREEN, 8));
}

TEST_F(CompositorTest, PassportSquareScenario)
{
	CompositionRequest request;
	request.foreground = share(makeCutoutImage(800, 800, BLUE));
	request.mode = OutputMode::PassportJPEG;
	request.subjectFileName = "me.png";

	const EncodedOutput output = compositor.compose(request);
	EXPECT_EQ(output.mimeType, "image/jpeg");
	EXPECT_EQ(output.suggestedFileName, "passport-me.jpg");

	const cv::Mat decoded = decodeWithOpenCv(output.bytes);
	ASSERT_EQ(decoded.cols, 600);
	ASSERT_EQ(decoded.rows, 600);
	EXPECT_TRUE(isNear(decoded.at<cv::Vec3b>(0, 0), WHITE, 3));
	EXPECT_TRUE(isNear(decoded.at<cv::Vec3b>(599, 599), WHITE, 3));
	EXPECT_TRUE(isNear(decoded.at<cv::Vec3b>(300, 300), BLUE, 8));
}

TEST_F(CompositorTest, PassportIgnoresBackgroundAndCropsCenter)
{
	// A landscape cutout with a green stripe on the left that falls outside the square crop.
	std::vector<std::uint8_t> rgba(800 * 600 * 4, 0);
	for (std::uint32_t y = 0; y < 600; ++y) {
		for (std::uint32_t x = 0; x < 50; ++x) {
			const std::size_t i = (static_cast<std::size_t>(y) * 800 + x) * 4;
			rgba[i + 1] = 255;
			rgba[i + 3] = 255;
		}
	}

	CompositionRequest request;
	request.foreground = share(RasterImage(800, 600, std::move(rgba)));
	request.background = share(makeSolidImage(100, 100, RED));
	request.mode = OutputMode::PassportJPEG;
	request.subjectFileName = "me.png";

	const EncodedOutput output = compositor.compose(request);
	EXPECT_EQ(output.suggestedFileName, "passport-me.jpg");

	const cv::Mat decoded = decodeWithOpenCv(output.bytes);
	ASSERT_EQ(decoded.cols, 600);
	ASSERT_EQ(decoded.rows, 600);
	EXPECT_TRUE(isNear(decoded.at<cv::Vec3b>(300, 2), WHITE, 3));
}

TEST_F(CompositorTest, CropPassportAlwaysProducesFixedSize)
{
	const std::pair<std::uint32_t, std::uint32_t> sizes[] = {{800, 800}, {1000, 400}, {30, 90}};
	for (const auto &[w, h] : sizes) {
		const RasterImage passport = Compositor::cropPassport(makeCutoutImage(w, h, RED));
		EXPECT_EQ(passport.getWidth(), Compositor::kPassportSize);
		EXPECT_EQ(passport.getHeight(), Compositor::kPassportSize);
		EXPECT_TRUE(passport.isFullyOpaque());
	}
}

TEST_F(CompositorTest, InputsAreNotModified)
{
	const auto foreground = share(makeCutoutImage(40, 30, RED));
	const auto background = share(makeSolidImage(100, 50, GREEN));
	const std::vector<std::uint8_t> foregroundBefore(foreground->getPixels().begin(),
							 foreground->getPixels().end());

	CompositionRequest request;
	request.foreground = foreground;
	request.background = background;
	request.mode = OutputMode::FlattenedJPEG;
	compositor.compose(request);

	EXPECT_TRUE(std::equal(foregroundBefore.begin(), foregroundBefore.end(), foreground->getPixels().begin()));
	EXPECT_EQ(background->pixelAt(0, 0), GREEN);
}

TEST_F(CompositorTest, MissingForegroundIsAComposeError)
{
	CompositionRequest request;
	try {
		compositor.compose(request);
		FAIL() << "expected CompositorError";
	} catch (const CompositorError &e) {
		EXPECT_EQ(e.getStage(), CompositorStage::Compose);
	}
}

TEST_F(CompositorTest, OversizedForegroundReportsRenderTarget)
{
	CompositionRequest request;
	request.foreground = share(makeSolidImage(Canvas::kMaxDimension + 1, 1, RED));
	request.mode = OutputMode::FlattenedJPEG;
	EXPECT_THROW(compositor.compose(request), RenderTargetUnavailable);
}
