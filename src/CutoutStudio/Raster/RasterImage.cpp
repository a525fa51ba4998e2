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

#include "RasterImage.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace CutoutStudio::Raster {

RasterImage::RasterImage(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> rgba,
			 std::optional<ImageFormat> sourceFormat, std::vector<std::uint8_t> encodedSource)
	: width_(width),
	  height_(height),
	  rgba_(std::move(rgba)),
	  sourceFormat_(sourceFormat),
	  encodedSource_(std::move(encodedSource))
{
	if (width_ == 0 || height_ == 0) {
		throw std::invalid_argument(fmt::format("RasterImage has empty dimensions {}x{}", width_, height_));
	}
	if (rgba_.size() != getPixelCount() * kChannels) {
		throw std::invalid_argument(fmt::format("RasterImage buffer holds {} bytes, expected {} for {}x{}",
							rgba_.size(), getPixelCount() * kChannels, width_, height_));
	}
}

Rgba RasterImage::pixelAt(std::uint32_t x, std::uint32_t y) const
{
	if (x >= width_ || y >= height_) {
		throw std::out_of_range(fmt::format("pixel ({}, {}) outside {}x{}", x, y, width_, height_));
	}
	const std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * kChannels;
	return {rgba_[i + 0], rgba_[i + 1], rgba_[i + 2], rgba_[i + 3]};
}

bool RasterImage::hasFullyTransparentPixel() const noexcept
{
	for (std::size_t i = 3; i < rgba_.size(); i += kChannels) {
		if (rgba_[i] == 0) {
			return true;
		}
	}
	return false;
}

bool RasterImage::isFullyOpaque() const noexcept
{
	for (std::size_t i = 3; i < rgba_.size(); i += kChannels) {
		if (rgba_[i] != 255) {
			return false;
		}
	}
	return true;
}

} // namespace CutoutStudio::Raster
