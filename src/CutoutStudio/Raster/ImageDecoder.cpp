/*
 * Cutout Studio - Raster Module
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

#include "ImageDecoder.hpp"

#include <new>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "ImageFormat.hpp"

namespace CutoutStudio::Raster {

namespace {

cv::Mat to8Bit(const cv::Mat &decoded)
{
	switch (decoded.depth()) {
	case CV_8U:
		return decoded;
	case CV_16U: {
		cv::Mat converted;
		decoded.convertTo(converted, CV_8U, 1.0 / 257.0);
		return converted;
	}
	case CV_32F: {
		cv::Mat converted;
		decoded.convertTo(converted, CV_8U, 255.0);
		return converted;
	}
	default:
		throw ImageDecodeError(fmt::format("unsupported sample depth {}", decoded.depth()));
	}
}

cv::Mat toRgba(const cv::Mat &decoded)
{
	cv::Mat rgba;
	switch (decoded.channels()) {
	case 1:
		cv::cvtColor(decoded, rgba, cv::COLOR_GRAY2RGBA);
		break;
	case 3:
		cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA);
		break;
	case 4:
		cv::cvtColor(decoded, rgba, cv::COLOR_BGRA2RGBA);
		break;
	default:
		throw ImageDecodeError(fmt::format("unsupported channel count {}", decoded.channels()));
	}
	return rgba;
}

} // namespace

RasterImage decodeImage(std::span<const std::uint8_t> bytes)
{
	if (bytes.empty()) {
		throw ImageDecodeError("image data is empty");
	}

	const ImageFormat format = sniffImageFormat(bytes);
	const int flags = format == ImageFormat::Jpeg ? cv::IMREAD_COLOR : cv::IMREAD_UNCHANGED;

	const cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<std::uint8_t *>(bytes.data()));
	try {
		const cv::Mat decoded = cv::imdecode(encoded, flags);
		if (decoded.empty()) {
			throw ImageDecodeError(fmt::format("corrupt or unsupported {} data ({} bytes)",
							   mimeTypeOf(format), bytes.size()));
		}
		const cv::Mat rgba = toRgba(to8Bit(decoded));

		std::vector<std::uint8_t> pixels(rgba.datastart, rgba.dataend);
		return RasterImage(static_cast<std::uint32_t>(rgba.cols), static_cast<std::uint32_t>(rgba.rows),
				   std::move(pixels), format, std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
	} catch (const cv::Exception &e) {
		throw ImageDecodeError(fmt::format("decoder failed: {}", e.what()));
	} catch (const std::bad_alloc &) {
		throw ImageDecodeError(fmt::format("out of memory while decoding {} bytes", bytes.size()));
	}
}

} // namespace CutoutStudio::Raster
