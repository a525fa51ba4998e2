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

#include <optional>
#include <string_view>

namespace CutoutStudio::Compositor {

enum class OutputMode { TransparentPNG, FlattenedJPEG, PassportJPEG };

enum class EncodingFormat { Png, Jpeg };

EncodingFormat encodingFormatOf(OutputMode mode) noexcept;

std::string_view mimeTypeOf(EncodingFormat format) noexcept;
std::string_view fileExtensionOf(EncodingFormat format) noexcept;

// Short names "png", "jpeg" and "passport", as used by configuration and the command line.
std::string_view toString(OutputMode mode) noexcept;
std::optional<OutputMode> parseOutputMode(std::string_view name) noexcept;

} // namespace CutoutStudio::Compositor
