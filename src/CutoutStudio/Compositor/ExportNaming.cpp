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

#include "ExportNaming.hpp"

#include <fmt/format.h>

namespace CutoutStudio::Compositor {

namespace {

constexpr std::string_view kDefaultStem = "image";

std::string_view prefixFor(OutputMode mode, bool hasBackground) noexcept
{
	switch (mode) {
	case OutputMode::PassportJPEG:
		return "passport-";
	case OutputMode::TransparentPNG:
	case OutputMode::FlattenedJPEG:
		return hasBackground ? "composite-" : "bg-removed-";
	}
	return "bg-removed-";
}

} // namespace

std::string fileStemOf(std::string_view fileName)
{
	if (fileName.empty()) {
		return std::string(kDefaultStem);
	}

	const std::size_t lastSeparator = fileName.find_last_of("/\\");
	if (lastSeparator != std::string_view::npos) {
		fileName.remove_prefix(lastSeparator + 1);
	}

	return std::string(fileName.substr(0, fileName.find('.')));
}

std::string suggestedFileName(OutputMode mode, bool hasBackground, std::string_view subjectFileName)
{
	return fmt::format("{}{}.{}", prefixFor(mode, hasBackground), fileStemOf(subjectFileName),
			   fileExtensionOf(encodingFormatOf(mode)));
}

} // namespace CutoutStudio::Compositor
