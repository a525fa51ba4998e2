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

#include "AppConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <CutoutStudio/Logger/ILogger.hpp>

namespace CutoutStudio::Global {

using nlohmann::json;

namespace {

constexpr char kApiKeyEnv[] = "API_KEY";

std::string readString(const json &root, const char *key, const std::string &fallback)
{
	const auto it = root.find(key);
	if (it == root.end()) {
		return fallback;
	}
	if (!it->is_string()) {
		throw std::runtime_error(fmt::format("ConfigError(AppConfig::load):{} must be a string", key));
	}
	return it->get<std::string>();
}

long readInteger(const json &root, const char *key, long fallback, long min, long max)
{
	const auto it = root.find(key);
	if (it == root.end()) {
		return fallback;
	}
	if (!it->is_number_integer()) {
		throw std::runtime_error(fmt::format("ConfigError(AppConfig::load):{} must be an integer", key));
	}
	const long value = it->get<long>();
	if (value < min || value > max) {
		throw std::runtime_error(
			fmt::format("ConfigError(AppConfig::load):{}={} outside {}..{}", key, value, min, max));
	}
	return value;
}

} // namespace

AppConfig AppConfig::fromJson(std::string_view text, const Logger::ILogger &logger)
{
	const json root = json::parse(text, nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		throw std::runtime_error("ConfigError(AppConfig::load):config is not a JSON object");
	}

	AppConfig config;
	config.apiBaseUrl = readString(root, "apiBaseUrl", config.apiBaseUrl);
	config.model = readString(root, "model", config.model);
	config.apiKey = readString(root, "apiKey", config.apiKey);
	config.connectTimeoutSeconds = readInteger(root, "connectTimeoutSeconds", config.connectTimeoutSeconds, 1, 600);
	config.requestTimeoutSeconds = readInteger(root, "requestTimeoutSeconds", config.requestTimeoutSeconds, 1, 3600);
	config.jpegQuality = static_cast<int>(readInteger(root, "jpegQuality", config.jpegQuality, 1, 100));

	const std::string levelName = readString(root, "logLevel", std::string(Logger::logLevelName(config.logLevel)));
	const std::optional<Logger::LogLevel> level = Logger::parseLogLevel(levelName);
	if (!level) {
		throw std::runtime_error(fmt::format("ConfigError(AppConfig::load):unknown logLevel '{}'", levelName));
	}
	config.logLevel = *level;

	logger.info("Loaded config: model={} apiBaseUrl={} jpegQuality={} logLevel={}", config.model,
		    config.apiBaseUrl, config.jpegQuality, levelName);
	return config;
}

AppConfig AppConfig::load(const std::optional<std::filesystem::path> &path,
			  std::shared_ptr<const Logger::ILogger> logger)
{
	AppConfig config;

	if (path) {
		std::ifstream ifs(*path, std::ios::binary);
		if (!ifs) {
			throw std::runtime_error(
				fmt::format("ConfigError(AppConfig::load):cannot open {}", path->string()));
		}
		std::ostringstream contents;
		contents << ifs.rdbuf();
		config = fromJson(contents.str(), *logger);
	} else {
		logger->info("No config file given, using default configuration");
	}

	if (const char *apiKey = std::getenv(kApiKeyEnv); apiKey && *apiKey) {
		config.apiKey = apiKey;
	}
	if (config.apiKey.empty()) {
		logger->warn("{} is not set; background removal will be unavailable", kApiKeyEnv);
	}

	return config;
}

} // namespace CutoutStudio::Global
