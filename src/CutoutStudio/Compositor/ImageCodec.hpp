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
#include <span>
#include <vector>

#include <CutoutStudio/Raster/RasterImage.hpp>

namespace CutoutStudio::Compositor {

constexpr int kDefaultJpegQuality = 95;

/**
 * @brief Raster::decodeImage, reporting failures as the decode stage of an export.
 *
 * @throws DecodeFailure
 */
Raster::RasterImage decodeImage(std::span<const std::uint8_t> bytes);

/**
 * @throws EncodeFailure
 */
std::vector<std::uint8_t> encodePng(const Raster::RasterImage &image);

/**
 * @brief Encodes a JPEG. Any remaining translucency is flattened onto white first,
 * since JPEG carries no alpha channel.
 *
 * @throws EncodeFailure
 */
std::vector<std::uint8_t> encodeJpeg(const Raster::RasterImage &image, int quality = kDefaultJpegQuality);

} // namespace CutoutStudio::Compositor
