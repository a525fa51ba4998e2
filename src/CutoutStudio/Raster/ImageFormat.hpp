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
#include <string_view>

namespace CutoutStudio::Raster {

enum class ImageFormat { Unknown, Png, Jpeg, Gif, Webp, Bmp };

/**
 * @brief Identifies an encoded image by its magic bytes.
 */
ImageFormat sniffImageFormat(std::span<const std::uint8_t> bytes) noexcept;

/**
 * @brief Returns the MIME type for a format, or "application/octet-stream" for Unknown.
 */
std::string_view mimeTypeOf(ImageFormat format) noexcept;

} // namespace CutoutStudio::Raster
