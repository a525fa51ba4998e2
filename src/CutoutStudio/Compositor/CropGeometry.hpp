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

namespace CutoutStudio::Compositor {

/**
 * @brief A source rectangle in pixel units. Coordinates may be fractional.
 */
struct CropWindow {
	double x = 0.0;
	double y = 0.0;
	double width = 0.0;
	double height = 0.0;
};

struct ScaleFactors {
	double x;
	double y;
};

/**
 * @brief Computes the centered window of a source image that covers a target of the given size.
 *
 * The window keeps the target's aspect ratio. A relatively wider source loses
 * columns on both sides, a relatively taller (or equally shaped) one loses rows
 * at the top and bottom.
 */
CropWindow computeCoverCrop(std::uint32_t sourceWidth, std::uint32_t sourceHeight, std::uint32_t targetWidth,
			    std::uint32_t targetHeight);

/**
 * @brief Computes the largest centered square inside an image.
 */
CropWindow computeCenteredSquareCrop(std::uint32_t width, std::uint32_t height);

ScaleFactors scaleFactorsFor(const CropWindow &window, std::uint32_t targetWidth, std::uint32_t targetHeight);

} // namespace CutoutStudio::Compositor
