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

#include <cstdint>

#include <opencv2/core.hpp>

#include "RasterImage.hpp"

namespace CutoutStudio::Raster {

/**
 * @brief Wraps a raster's pixels in a CV_8UC4 header without copying.
 *
 * The result must only be used as a read-only input; the raster owns the memory.
 */
inline cv::Mat wrapReadOnly(const RasterImage &image)
{
	return cv::Mat(static_cast<int>(image.getHeight()), static_cast<int>(image.getWidth()), CV_8UC4,
		       const_cast<std::uint8_t *>(image.getPixels().data()));
}

} // namespace CutoutStudio::Raster
