/*
 * Cutout Studio - Compositor Module
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; for more details see the file
 * "LICENSE.GPL-3.0-or-later" in the distribution root.
 */

#include "Canvas.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <new>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <opencv2/imgproc.hpp>

#include <CutoutStudio/Raster/MatView.hpp>

#include "CompositorError.hpp"

namespace CutoutStudio::Compositor {

namespace {

constexpr double kMaxBilinearShrink = 2.0;

cv::Mat toPremultipliedFloat(const cv::Mat &straight)
{
	cv::Mat premultiplied;
	straight.convertTo(premultiplied, CV_32FC4, 1.0 / 255.0);
	for (int y = 0; y < premultiplied.rows; ++y) {
		cv::Vec4f *row = premultiplied.ptr<cv::Vec4f>(y);
		for (int x = 0; x < premultiplied.cols; ++x) {
			const float a = row[x][3];
			row[x][0] *= a;
			row[x][1] *= a;
			row[x][2] *= a;
		}
	}
	return premultiplied;
}

// Porter-Duff "source over" of premultiplied float pixels onto straight RGBA8 pixels.
void blendOver(const cv::Mat &source, cv::Mat &target)
{
	for (int y = 0; y < target.rows; ++y) {
		const cv::Vec4f *src = source.ptr<cv::Vec4f>(y);
		cv::Vec4b *dst = target.ptr<cv::Vec4b>(y);
		for (int x = 0; x < target.cols; ++x) {
			const float sa = std::clamp(src[x][3], 0.0f, 1.0f);
			const float keep = (dst[x][3] / 255.0f) * (1.0f - sa);
			const float outA = sa + keep;
			if (outA <= 0.0f) {
				dst[x] = cv::Vec4b(0, 0, 0, 0);
				continue;
			}
			for (int c = 0; c < 3; ++c) {
				const float outC = src[x][c] + (dst[x][c] / 255.0f) * keep;
				dst[x][c] = cv::saturate_cast<std::uint8_t>(outC / outA * 255.0f);
			}
			dst[x][3] = cv::saturate_cast<std::uint8_t>(outA * 255.0f);
		}
	}
}

// Whole source pixels covering the crop window, clamped to the image.
cv::Rect sourceRegion(const Raster::RasterImage &source, const CropWindow &window)
{
	const int maxX = static_cast<int>(source.getWidth());
	const int maxY = static_cast<int>(source.getHeight());
	const int left = std::clamp(static_cast<int>(std::floor(window.x)), 0, maxX - 1);
	const int top = std::clamp(static_cast<int>(std::floor(window.y)), 0, maxY - 1);
	const int right = std::clamp(static_cast<int>(std::ceil(window.x + window.width)), left + 1, maxX);
	const int bottom = std::clamp(static_cast<int>(std::ceil(window.y + window.height)), top + 1, maxY);
	return cv::Rect(left, top, right - left, bottom - top);
}

} // namespace

Canvas::Canvas(std::uint32_t width, std::uint32_t height) : width_(width), height_(height)
{
	if (width == 0 || height == 0 || width > kMaxDimension || height > kMaxDimension) {
		throw RenderTargetUnavailable(
			fmt::format("cannot create a {}x{} canvas (limit {} per side)", width, height, kMaxDimension));
	}

	try {
		pixels_ = cv::Mat::zeros(static_cast<int>(height), static_cast<int>(width), CV_8UC4);
	} catch (const cv::Exception &e) {
		throw RenderTargetUnavailable(fmt::format("canvas allocation failed: {}", e.what()));
	} catch (const std::bad_alloc &) {
		throw RenderTargetUnavailable(fmt::format("out of memory allocating a {}x{} canvas", width, height));
	}
}

void Canvas::fill(const Raster::Rgba &color)
{
	pixels_.setTo(cv::Scalar(color.r, color.g, color.b, color.a));
}

void Canvas::drawImage(const Raster::RasterImage &source)
{
	const int w = static_cast<int>(std::min(width_, source.getWidth()));
	const int h = static_cast<int>(std::min(height_, source.getHeight()));
	const cv::Rect region(0, 0, w, h);

	const cv::Mat premultiplied = toPremultipliedFloat(Raster::wrapReadOnly(source)(region));
	cv::Mat target = pixels_(region);
	blendOver(premultiplied, target);
}

void Canvas::drawImageScaled(const Raster::RasterImage &source, const CropWindow &window)
{
	if (window.width <= 0.0 || window.height <= 0.0) {
		throw CompositorError(CompositorStage::Compose, "crop window is empty");
	}

	const double scaleX = window.width / width_;
	const double scaleY = window.height / height_;

	cv::Mat premultiplied;
	double originX = window.x;
	double originY = window.y;
	double stepX = scaleX;
	double stepY = scaleY;

	if (scaleX > kMaxBilinearShrink || scaleY > kMaxBilinearShrink) {
		// Bilinear taps only 2x2 source pixels, so strong reductions are box-filtered first.
		const cv::Rect region = sourceRegion(source, window);
		const int shrunkWidth =
			scaleX > kMaxBilinearShrink ? std::max(1, cvRound(region.width / scaleX)) : region.width;
		const int shrunkHeight =
			scaleY > kMaxBilinearShrink ? std::max(1, cvRound(region.height / scaleY)) : region.height;

		cv::resize(toPremultipliedFloat(Raster::wrapReadOnly(source)(region)), premultiplied,
			   cv::Size(shrunkWidth, shrunkHeight), 0.0, 0.0, cv::INTER_AREA);

		const double factorX = static_cast<double>(shrunkWidth) / region.width;
		const double factorY = static_cast<double>(shrunkHeight) / region.height;
		originX = (window.x - region.x) * factorX;
		originY = (window.y - region.y) * factorY;
		stepX = scaleX * factorX;
		stepY = scaleY * factorY;
	} else {
		premultiplied = toPremultipliedFloat(Raster::wrapReadOnly(source));
	}

	// Maps destination pixel centers back into the (possibly shrunk) source window.
	const cv::Matx23d inverseMap(stepX, 0.0, originX + 0.5 * stepX - 0.5, 0.0, stepY, originY + 0.5 * stepY - 0.5);

	cv::Mat resampled;
	cv::warpAffine(premultiplied, resampled, inverseMap, pixels_.size(), cv::INTER_LINEAR | cv::WARP_INVERSE_MAP,
		       cv::BORDER_REPLICATE);

	blendOver(resampled, pixels_);
}

Raster::RasterImage Canvas::toRasterImage() const
{
	std::vector<std::uint8_t> rgba(pixels_.total() * Raster::RasterImage::kChannels);
	if (pixels_.isContinuous()) {
		std::copy(pixels_.datastart, pixels_.dataend, rgba.begin());
	} else {
		const std::size_t rowBytes = static_cast<std::size_t>(width_) * Raster::RasterImage::kChannels;
		for (int y = 0; y < pixels_.rows; ++y) {
			const std::uint8_t *row = pixels_.ptr<std::uint8_t>(y);
			std::copy(row, row + rowBytes, rgba.begin() + static_cast<std::ptrdiff_t>(y * rowBytes));
		}
	}
	return Raster::RasterImage(width_, height_, std::move(rgba));
}

} // namespace CutoutStudio::Compositor
