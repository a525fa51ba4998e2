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

#include <string>
#include <string_view>

#include "OutputMode.hpp"

namespace CutoutStudio::Compositor {

/**
 * @brief Returns the file name without directories and without everything from its first '.'.
 *
 * "holiday.final.jpg" becomes "holiday" and ".hidden" becomes "". Only a missing
 * name (the empty string) becomes "image".
 */
std::string fileStemOf(std::string_view fileName);

/**
 * @brief Builds the download name, e.g. "composite-holiday.png" or "passport-me.jpg".
 */
std::string suggestedFileName(OutputMode mode, bool hasBackground, std::string_view subjectFileName);

} // namespace CutoutStudio::Compositor
