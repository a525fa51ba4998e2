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
#include <memory>
#include <string>
#include <vector>

#include <CutoutStudio/Logger/ILogger.hpp>
#include <CutoutStudio/Raster/RasterImage.hpp>

#include "ImageCodec.hpp"
#include "OutputMode.hpp"

namespace CutoutStudio::Compositor {

struct CompositionRequest {
	std::shared_ptr<const Raster::RasterImage> foreground;
	// Null when no background was chosen. Ignored in PassportJPEG mode.
	std::shared_ptr<const Raster::RasterImage> background;
	OutputMode mode = OutputMode::TransparentPNG;
	std::string subjectFileName;
};

struct EncodedOutput {
	std::vector<std::uint8_t> bytes;
	std::string mimeType;
	std::string suggestedFileName;
};

struct CompositorOptions {
	int jpegQuality = kDefaultJpegQuality;
};

class Compositor {
public:
	static constexpr std::uint32_t kPassportSize = 600;

	Compositor(std::shared_ptr<const Logger::ILogger> logger, CompositorOptions options = {});

	/**
	 * @brief Produces the export for a request.
	 *
	 * Either returns a complete output or throws a CompositorError naming the
	 * failed stage. The request's rasters are never modified.
	 */
	EncodedOutput compose(const CompositionRequest &request) const;

	/**
	 * @brief Cover-fits the background behind the foreground on a canvas of the foreground's size.
	 */
	static Raster::RasterImage placeOnBackground(const Raster::RasterImage &foreground,
						     const Raster::RasterImage &background);

	/**
	 * @brief Draws the foreground over opaque white at its own size.
	 */
	static Raster::RasterImage flattenOnWhite(const Raster::RasterImage &foreground);

	/**
	 * @brief Scales the centered square of the foreground onto a 600x600 white canvas.
	 */
	static Raster::RasterImage cropPassport(const Raster::RasterImage &foreground);

private:
	std::vector<std::uint8_t> encode(const Raster::RasterImage &image, EncodingFormat format) const;

	const std::shared_ptr<const Logger::ILogger> logger_;
	const CompositorOptions options_;
};

} // namespace CutoutStudio::Compositor
