/*
 * Cutout Studio - Segmentation Module
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

#include <CutoutStudio/Raster/RasterImage.hpp>

namespace CutoutStudio::Segmentation {

class ISegmentationClient {
protected:
	ISegmentationClient() = default;

public:
	virtual ~ISegmentationClient() = default;

	/**
	 * @brief Sends one subject image to the remote model and returns the background-free raster.
	 *
	 * Makes exactly one remote call and never retries.
	 *
	 * @throws ModelRefused if the response holds no image.
	 * @throws TransportFailure if the exchange fails.
	 * @throws std::invalid_argument if mimeType is not an image type.
	 */
	virtual Raster::RasterImage segmentForeground(std::span<const std::uint8_t> imageBytes,
						      std::string_view mimeType) = 0;

	ISegmentationClient(const ISegmentationClient &) = delete;
	ISegmentationClient &operator=(const ISegmentationClient &) = delete;
	ISegmentationClient(ISegmentationClient &&) = delete;
	ISegmentationClient &operator=(ISegmentationClient &&) = delete;
};

} // namespace CutoutStudio::Segmentation
