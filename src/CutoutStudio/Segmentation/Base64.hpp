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
#include <string>
#include <string_view>
#include <vector>

namespace CutoutStudio::Segmentation {

// RFC 4648 standard alphabet with '=' padding.
std::string encodeBase64(std::span<const std::uint8_t> data);

/**
 * @brief Decodes standard base64. Whitespace is skipped and missing padding is tolerated.
 * @throws std::invalid_argument on characters outside the alphabet or a dangling sextet.
 */
std::vector<std::uint8_t> decodeBase64(std::string_view encoded);

} // namespace CutoutStudio::Segmentation
