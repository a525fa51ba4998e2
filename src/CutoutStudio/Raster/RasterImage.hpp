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

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "ImageFormat.hpp"

namespace CutoutStudio::Raster {

struct Rgba {
	std::uint8_t r, g, b, a;

	bool operator==(const Rgba &) const = default;
};

constexpr Rgba kOpaqueWhite = {255, 255, 255, 255};
constexpr Rgba kTransparent = {0, 0, 0, 0};

/**
 * @brief An immutable RGBA8 bitmap with straight (non-premultiplied) alpha.
 *
 * Rows are tightly packed, top to bottom. A raster decoded from a file also
 * remembers the encoded bytes it came from so lossless exports can hand them
 * back untouched.
 */
class RasterImage {
public:
	static constexpr std::size_t kChannels = 4;

	RasterImage(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> rgba,
		    std::optional<ImageFormat> sourceFormat = std::nullopt,
		    std::vector<std::uint8_t> encodedSource = {});

	std::uint32_t getWidth() const noexcept { return width_; }
	std::uint32_t getHeight() const noexcept { return height_; }
	std::size_t getPixelCount() const noexcept { return static_cast<std::size_t>(width_) * height_; }

	std::span<const std::uint8_t> getPixels() const noexcept { return rgba_; }
	std::optional<ImageFormat> getSourceFormat() const noexcept { return sourceFormat_; }
	std::span<const std::uint8_t> getEncodedSource() const noexcept { return encodedSource_; }

	Rgba pixelAt(std::uint32_t x, std::uint32_t y) const;

	bool hasFullyTransparentPixel() const noexcept;
	bool isFullyOpaque() const noexcept;

private:
	std::uint32_t width_;
	std::uint32_t height_;
	std::vector<std::uint8_t> rgba_;
	std::optional<ImageFormat> sourceFormat_;
	std::vector<std::uint8_t> encodedSource_;
};

} // namespace CutoutStudio::Raster
