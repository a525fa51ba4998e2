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
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <CutoutStudio/Logger/ILogger.hpp>

namespace CutoutStudio::Global {

struct AppConfig {
	std::string apiBaseUrl = "https://generativelanguage.googleapis.com";
	std::string model = "gemini-2.5-flash-image-preview";
	std::string apiKey;
	long connectTimeoutSeconds = 10;
	long requestTimeoutSeconds = 120;
	int jpegQuality = 95;
	Logger::LogLevel logLevel = Logger::LogLevel::Info;

	/**
	 * @brief Loads the JSON file if given, then takes the API key from the API_KEY environment variable.
	 *
	 * A missing file is an error only when a path was given explicitly.
	 *
	 * @throws std::runtime_error on unreadable files, malformed JSON or out-of-range values.
	 */
	static AppConfig load(const std::optional<std::filesystem::path> &path,
			      std::shared_ptr<const Logger::ILogger> logger);

	/**
	 * @brief Applies the keys present in a JSON document over the defaults.
	 * @throws std::runtime_error
	 */
	static AppConfig fromJson(std::string_view json, const Logger::ILogger &logger);
};

} // namespace CutoutStudio::Global
