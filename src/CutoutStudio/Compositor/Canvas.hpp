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

#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

#include <CutoutStudio/Raster/RasterImage.hpp>

#include "CropGeometry.hpp"

namespace CutoutStudio::Compositor {

/**
 * @brief A freshly allocated RGBA8 drawing surface, transparent on creation.
 *
 * Pixels are stored with straight alpha. Every draw composites the source
 * "over" the existing content; sources are only read, never modified.
 */
class Canvas {
public:
	static constexpr std::uint32_t kMaxDimension = 16384;

	/**
	 * @throws RenderTargetUnavailable if the size is empty, exceeds kMaxDimension,
	 * or the pixel storage cannot be allocated.
	 */
	Canvas(std::uint32_t width, std::uint32_t height);

	std::uint32_t getWidth() const noexcept { return width_; }
	std::uint32_t getHeight() const noexcept { return height_; }

	void fill(const Raster::Rgba &color);

	/**
	 * @brief Draws an image at (0, 0) at its native size, clipped to the canvas.
	 */
	void drawImage(const Raster::RasterImage &source);

	/**
	 * @brief Draws the given window of an image stretched over the whole canvas.
	 *
	 * Resampling is bilinear on premultiplied color, so fully transparent
	 * source pixels do not tint their neighbours.
	 */
	void drawImageScaled(const Raster::RasterImage &source, const CropWindow &window);

	Raster::RasterImage toRasterImage() const;

	Canvas(const Canvas &) = delete;
	Canvas &operator=(const Canvas &) = delete;

private:
	std::uint32_t width_;
	std::uint32_t height_;
	cv::Mat pixels_;
};

} // namespace CutoutStudio::Compositor
