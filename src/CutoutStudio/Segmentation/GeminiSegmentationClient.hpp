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

#include <memory>
#include <string>

#include <CutoutStudio/Logger/ILogger.hpp>

#include "IHttpTransport.hpp"
#include "ISegmentationClient.hpp"

namespace CutoutStudio::Segmentation {

struct GeminiClientSettings {
	std::string apiBaseUrl = "https://generativelanguage.googleapis.com";
	std::string model = "gemini-2.5-flash-image-preview";
	std::string apiKey;
};

/**
 * @brief Asks a Gemini image model to cut the subject out of a photo.
 */
class GeminiSegmentationClient final : public ISegmentationClient {
public:
	static constexpr const char *kPrompt =
		"Remove the background of this image. The main subject should be preserved perfectly. "
		"The output must be a PNG with a transparent background.";

	static constexpr const char *kNoImageFallbackReason =
		"Model did not return an image. It might be due to safety policies or an inability to process the request.";

	GeminiSegmentationClient(GeminiClientSettings settings, std::shared_ptr<IHttpTransport> transport,
				 std::shared_ptr<const Logger::ILogger> logger);
	~GeminiSegmentationClient() override = default;

	Raster::RasterImage segmentForeground(std::span<const std::uint8_t> imageBytes,
					      std::string_view mimeType) override;

	std::string endpointUrl() const;

private:
	const GeminiClientSettings settings_;
	const std::shared_ptr<IHttpTransport> transport_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace CutoutStudio::Segmentation
