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

#include "ImageCodec.hpp"

#include <fmt/format.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <CutoutStudio/Raster/ImageDecoder.hpp>
#include <CutoutStudio/Raster/MatView.hpp>

#include "Canvas.hpp"
#include "CompositorError.hpp"

namespace CutoutStudio::Compositor {

namespace {

std::vector<std::uint8_t> encodeWith(const char *extension, const Raster::RasterImage &image, int conversionCode,
				     const std::vector<int> &params)
{
	std::vector<std::uint8_t> encoded;
	try {
		cv::Mat converted;
		cv::cvtColor(Raster::wrapReadOnly(image), converted, conversionCode);
		if (!cv::imencode(extension, converted, encoded, params)) {
			throw EncodeFailure(fmt::format("{} encoder rejected a {}x{} image", extension,
							image.getWidth(), image.getHeight()));
		}
	} catch (const cv::Exception &e) {
		throw EncodeFailure(fmt::format("{} encoder failed: {}", extension, e.what()));
	}
	return encoded;
}

} // namespace

Raster::RasterImage decodeImage(std::span<const std::uint8_t> bytes)
{
	try {
		return Raster::decodeImage(bytes);
	} catch (const Raster::ImageDecodeError &e) {
		throw DecodeFailure(e.what());
	}
}

std::vector<std::uint8_t> encodePng(const Raster::RasterImage &image)
{
	return encodeWith(".png", image, cv::COLOR_RGBA2BGRA, {});
}

std::vector<std::uint8_t> encodeJpeg(const Raster::RasterImage &image, int quality)
{
	if (quality < 1 || quality > 100) {
		throw EncodeFailure(fmt::format("JPEG quality {} outside 1..100", quality));
	}

	const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
	if (image.isFullyOpaque()) {
		return encodeWith(".jpg", image, cv::COLOR_RGBA2BGR, params);
	}

	Canvas canvas(image.getWidth(), image.getHeight());
	canvas.fill(Raster::kOpaqueWhite);
	canvas.drawImage(image);
	return encodeWith(".jpg", canvas.toRasterImage(), cv::COLOR_RGBA2BGR, params);
}

} // namespace CutoutStudio::Compositor
