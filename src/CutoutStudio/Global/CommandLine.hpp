/*
 * Cutout Studio - Global Module
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

#include <filesystem>
#include <optional>
#include <span>

#include <CutoutStudio/Compositor/OutputMode.hpp>

namespace CutoutStudio::Global {

struct CommandLine {
	std::filesystem::path subject;
	std::optional<std::filesystem::path> background;
	Compositor::OutputMode mode = Compositor::OutputMode::TransparentPNG;
	std::filesystem::path outputDir = ".";
	std::optional<std::filesystem::path> config;

	/**
	 * @brief Parses the arguments after the program name.
	 *
	 * @throws std::invalid_argument on unknown options, missing values, a missing subject,
	 * or a background combined with passport output.
	 */
	static CommandLine parse(std::span<const char *const> args);
};

} // namespace CutoutStudio::Global
