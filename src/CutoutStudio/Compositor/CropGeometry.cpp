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

#include "CropGeometry.hpp"

#include <algorithm>
#include <stdexcept>

namespace CutoutStudio::Compositor {

CropWindow computeCoverCrop(std::uint32_t sourceWidth, std::uint32_t sourceHeight, std::uint32_t targetWidth,
			    std::uint32_t targetHeight)
{
	if (sourceWidth == 0 || sourceHeight == 0 || targetWidth == 0 || targetHeight == 0) {
		throw std::invalid_argument("computeCoverCrop requires non-empty source and target");
	}

	const double sw = sourceWidth;
	const double sh = sourceHeight;
	const double sourceAspect = sw / sh;
	const double targetAspect = static_cast<double>(targetWidth) / static_cast<double>(targetHeight);

	CropWindow window{0.0, 0.0, sw, sh};
	if (sourceAspect > targetAspect) {
		window.width = sh * targetAspect;
		window.x = (sw - window.width) / 2.0;
	} else {
		window.height = sw / targetAspect;
		window.y = (sh - window.height) / 2.0;
	}
	return window;
}

CropWindow computeCenteredSquareCrop(std::uint32_t width, std::uint32_t height)
{
	if (width == 0 || height == 0) {
		throw std::invalid_argument("computeCenteredSquareCrop requires a non-empty image");
	}

	const double cropSize = std::min(width, height);
	return {(width - cropSize) / 2.0, (height - cropSize) / 2.0, cropSize, cropSize};
}

ScaleFactors scaleFactorsFor(const CropWindow &window, std::uint32_t targetWidth, std::uint32_t targetHeight)
{
	return {static_cast<double>(targetWidth) / window.width, static_cast<double>(targetHeight) / window.height};
}

} // namespace CutoutStudio::Compositor
