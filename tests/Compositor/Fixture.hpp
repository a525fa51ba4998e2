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

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <CutoutStudio/Raster/RasterImage.hpp>

using CutoutStudio::Raster::RasterImage;
using CutoutStudio::Raster::Rgba;

constexpr Rgba RED = {255, 0, 0, 255};
constexpr Rgba GREEN = {0, 255, 0, 255};
constexpr Rgba BLUE = {0, 0, 255, 255};
constexpr Rgba WHITE = {255, 255, 255, 255};
constexpr Rgba BLACK = {0, 0, 0, 255};
constexpr Rgba CLEAR = {0, 0, 0, 0};

inline RasterImage makeSolidImage(std::uint32_t width, std::uint32_t height, Rgba color)
{
	std::vector<std::uint8_t> rgba(static_cast<std::size_t>(width) * height * 4);
	for (std::size_t i = 0; i < rgba.size(); i += 4) {
		rgba[i + 0] = color.r;
		rgba[i + 1] = color.g;
		rgba[i + 2] = color.b;
		rgba[i + 3] = color.a;
	}
	return RasterImage(width, height, std::move(rgba));
}

// Opaque subject disc on a fully transparent field, the shape a cutout usually has.
inline RasterImage makeCutoutImage(std::uint32_t width, std::uint32_t height, Rgba subject)
{
	std::vector<std::uint8_t> rgba(static_cast<std::size_t>(width) * height * 4, 0);
	const double cx = width / 2.0;
	const double cy = height / 2.0;
	const double radius = std::min(width, height) / 4.0;
	for (std::uint32_t y = 0; y < height; ++y) {
		for (std::uint32_t x = 0; x < width; ++x) {
			const double dx = x + 0.5 - cx;
			const double dy = y + 0.5 - cy;
			if (dx * dx + dy * dy <= radius * radius) {
				const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 4;
				rgba[i + 0] = subject.r;
				rgba[i + 1] = subject.g;
				rgba[i + 2] = subject.b;
				rgba[i + 3] = subject.a;
			}
		}
	}
	return RasterImage(width, height, std::move(rgba));
}

// Encodes straight RGBA into a file format with OpenCV, independently of the code under test.
inline std::vector<std::uint8_t> encodeWithOpenCv(const RasterImage &image, const char *extension)
{
	cv::Mat rgba(static_cast<int>(image.getHeight()), static_cast<int>(image.getWidth()), CV_8UC4,
		     const_cast<std::uint8_t *>(image.getPixels().data()));
	const bool dropsAlpha = std::string_view(extension) == ".jpg";
	cv::Mat converted;
	cv::cvtColor(rgba, converted, dropsAlpha ? cv::COLOR_RGBA2BGR : cv::COLOR_RGBA2BGRA);
	std::vector<std::uint8_t> bytes;
	cv::imencode(extension, converted, bytes);
	return bytes;
}

inline cv::Mat decodeWithOpenCv(const std::vector<std::uint8_t> &bytes)
{
	return cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
}
