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

#include <CutoutStudio/Compositor/ImageCodec.hpp>

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include <CutoutStudio/Compositor/CompositorError.hpp>

#include "Fixture.hpp"

using namespace CutoutStudio::Compositor;

TEST(DecodeImageTest, RejectsEmptyAndCorruptData)
{
	EXPECT_THROW(decodeImage({}), DecodeFailure);

	const std::vector<std::uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
	try {
		decodeImage(garbage);
		FAIL() << "expected DecodeFailure";
	} catch (const CompositorError &e) {
		EXPECT_EQ(e.getStage(), CompositorStage::Decode);
	}

	std::vector<std::uint8_t> truncated = encodeWithOpenCv(makeSolidImage(64, 64, RED), ".png");
	truncated.resize(24);
	EXPECT_THROW(decodeImage(truncated), DecodeFailure);
}

TEST(EncodePngTest, PreservesTransparency)
{
	const RasterImage image = makeCutoutImage(10, 10, GREEN);
	const cv::Mat decoded = decodeWithOpenCv(encodePng(image));
	ASSERT_EQ(decoded.channels(), 4);
	EXPECT_EQ(decoded.at<cv::Vec4b>(0, 0)[3], 0);
	EXPECT_EQ(decoded.at<cv::Vec4b>(5, 5), cv::Vec4b(0, 255, 0, 255));
}

TEST(EncodeJpegTest, FlattensTranslucencyOntoWhite)
{
	const cv::Mat decoded = decodeWithOpenCv(encodeJpeg(makeSolidImage(8, 8, CLEAR)));
	ASSERT_EQ(decoded.channels(), 3);
	const cv::Vec3b pixel = decoded.at<cv::Vec3b>(4, 4);
	EXPECT_GE(pixel[0], 252);
	EXPECT_GE(pixel[1], 252);
	EXPECT_GE(pixel[2], 252);
}

TEST(EncodeJpegTest, OversizedImageFailsInEncodeStage)
{
	// Baseline JPEG cannot describe a line this long.
	const RasterImage tooWide = makeSolidImage(70000, 1, RED);
	try {
		encodeJpeg(tooWide);
		FAIL() << "expected EncodeFailure";
	} catch (const CompositorError &e) {
		EXPECT_EQ(e.getStage(), CompositorStage::Encode);
	}
}

TEST(EncodeJpegTest, RejectsQualityOutOfRange)
{
	const RasterImage image = makeSolidImage(2, 2, RED);
	EXPECT_THROW(encodeJpeg(image, 0), EncodeFailure);
	EXPECT_THROW(encodeJpeg(image, 101), EncodeFailure);
	EXPECT_FALSE(encodeJpeg(image, 1).empty());
}
