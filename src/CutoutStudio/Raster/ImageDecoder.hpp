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
#include <span>
#include <stdexcept>
#include <string>

#include "RasterImage.hpp"

namespace CutoutStudio::Raster {

class ImageDecodeError : public std::runtime_error {
public:
	explicit ImageDecodeError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Decodes PNG, JPEG, GIF, WebP or BMP bytes into a straight-alpha RGBA raster.
 *
 * JPEG input honours its EXIF orientation. The returned raster keeps a copy
 * of the encoded bytes.
 *
 * @throws ImageDecodeError if the bytes are empty, corrupt or in an unsupported layout,
 * or if the decoded pixels do not fit in memory.
 */
RasterImage decodeImage(std::span<const std::uint8_t> bytes);

} // namespace CutoutStudio::Raster
