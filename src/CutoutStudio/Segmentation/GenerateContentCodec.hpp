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
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace CutoutStudio::Segmentation {

struct InlineImage {
	std::string mimeType;
	std::vector<std::uint8_t> data;
};

/**
 * @brief What a generateContent answer contained in its first candidate.
 */
struct GenerateContentResult {
	std::optional<InlineImage> image; // first inline image part
	std::optional<std::string> text;  // first non-empty text part
};

/**
 * @brief Serializes a request with one inline image part followed by one text part,
 * asking for IMAGE and TEXT response modalities.
 */
std::string buildGenerateContentBody(std::span<const std::uint8_t> imageBytes, std::string_view mimeType,
				     std::string_view prompt);

/**
 * @throws TransportFailure if the body is not valid JSON or an inline payload is not valid base64.
 */
GenerateContentResult parseGenerateContentResponse(std::string_view body);

/**
 * @brief Extracts "error.message" from an error body, if present.
 */
std::optional<std::string> parseErrorMessage(std::string_view body);

} // namespace CutoutStudio::Segmentation
