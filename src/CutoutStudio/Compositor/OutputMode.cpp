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

#include "OutputMode.hpp"

namespace CutoutStudio::Compositor {

EncodingFormat encodingFormatOf(OutputMode mode) noexcept
{
	switch (mode) {
	case OutputMode::TransparentPNG:
		return EncodingFormat::Png;
	case OutputMode::FlattenedJPEG:
	case OutputMode::PassportJPEG:
		return EncodingFormat::Jpeg;
	}
	return EncodingFormat::Png;
}

std::string_view mimeTypeOf(EncodingFormat format) noexcept
{
	switch (format) {
	case EncodingFormat::Png:
		return "image/png";
	case EncodingFormat::Jpeg:
		return "image/jpeg";
	}
	return "application/octet-stream";
}

std::string_view fileExtensionOf(EncodingFormat format) noexcept
{
	switch (format) {
	case EncodingFormat::Png:
		return "png";
	case EncodingFormat::Jpeg:
		return "jpg";
	}
	return "bin";
}

std::string_view toString(OutputMode mode) noexcept
{
	switch (mode) {
	case OutputMode::TransparentPNG:
		return "png";
	case OutputMode::FlattenedJPEG:
		return "jpeg";
	case OutputMode::PassportJPEG:
		return "passport";
	}
	return "unknown";
}

std::optional<OutputMode> parseOutputMode(std::string_view name) noexcept
{
	if (name == "png")
		return OutputMode::TransparentPNG;
	if (name == "jpeg" || name == "jpg")
		return OutputMode::FlattenedJPEG;
	if (name == "passport")
		return OutputMode::PassportJPEG;
	return std::nullopt;
}

} // namespace CutoutStudio::Compositor
