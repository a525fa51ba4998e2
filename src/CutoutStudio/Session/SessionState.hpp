/*
 * Cutout Studio - Session Module
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
#include <optional>
#include <string>
#include <vector>

#include <CutoutStudio/Compositor/OutputMode.hpp>
#include <CutoutStudio/Raster/RasterImage.hpp>

namespace CutoutStudio::Session {

struct UploadedImage {
	std::vector<std::uint8_t> bytes;
	std::string mimeType;
	std::string fileName;
};

struct SessionState {
	std::optional<UploadedImage> subject;
	std::shared_ptr<const Raster::RasterImage> cutout;
	std::optional<UploadedImage> background;
	Compositor::OutputMode outputMode = Compositor::OutputMode::TransparentPNG;
	bool isLoading = false;
	std::optional<std::string> errorMessage;
};

} // namespace CutoutStudio::Session
