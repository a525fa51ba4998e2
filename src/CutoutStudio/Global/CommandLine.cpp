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

#include "CommandLine.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

namespace CutoutStudio::Global {

CommandLine CommandLine::parse(std::span<const char *const> args)
{
	CommandLine commandLine;
	bool hasSubject = false;

	for (std::size_t i = 0; i < args.size(); ++i) {
		const std::string_view arg = args[i];

		auto value = [&]() -> std::string_view {
			if (i + 1 >= args.size()) {
				throw std::invalid_argument(fmt::format("{} requires a value", arg));
			}
			return args[++i];
		};

		if (arg == "--background") {
			commandLine.background = std::filesystem::path(value());
		} else if (arg == "--mode") {
			const std::string_view name = value();
			const std::optional<Compositor::OutputMode> mode = Compositor::parseOutputMode(name);
			if (!mode) {
				throw std::invalid_argument(fmt::format("unknown output mode '{}'", name));
			}
			commandLine.mode = *mode;
		} else if (arg == "--output-dir") {
			commandLine.outputDir = std::filesystem::path(value());
		} else if (arg == "--config") {
			commandLine.config = std::filesystem::path(value());
		} else if (arg.starts_with("--")) {
			throw std::invalid_argument(fmt::format("unknown option '{}'", arg));
		} else if (!hasSubject) {
			commandLine.subject = std::filesystem::path(arg);
			hasSubject = true;
		} else {
			throw std::invalid_argument(fmt::format("unexpected argument '{}'", arg));
		}
	}

	if (!hasSubject) {
		throw std::invalid_argument("missing subject image");
	}
	if (commandLine.background && commandLine.mode == Compositor::OutputMode::PassportJPEG) {
		throw std::invalid_argument("--background cannot be combined with --mode passport");
	}
	return commandLine;
}

} // namespace CutoutStudio::Global
