/*
 * Cutout Studio
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

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <CutoutStudio/Compositor/Compositor.hpp>
#include <CutoutStudio/Compositor/OutputMode.hpp>
#include <CutoutStudio/CurlHelper/CurlUnique.hpp>
#include <CutoutStudio/Global/AppConfig.hpp>
#include <CutoutStudio/Global/CommandLine.hpp>
#include <CutoutStudio/Logger/StderrLogger.hpp>
#include <CutoutStudio/Raster/ImageFormat.hpp>
#include <CutoutStudio/Segmentation/CurlHttpTransport.hpp>
#include <CutoutStudio/Segmentation/GeminiSegmentationClient.hpp>
#include <CutoutStudio/Session/Workflow.hpp>

using namespace CutoutStudio;

#define PROGRAM_NAME "cutout-studio"

namespace {

void printUsage()
{
	std::fputs("usage: " PROGRAM_NAME " <subject> [--background <file>] [--mode png|jpeg|passport]\n"
		   "       [--output-dir <dir>] [--config <file>]\n",
		   stderr);
}

std::vector<std::uint8_t> readFile(const std::filesystem::path &path)
{
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) {
		throw std::runtime_error(fmt::format("IOError(readFile):cannot open {}", path.string()));
	}
	return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

void writeFile(const std::filesystem::path &path, const std::vector<std::uint8_t> &bytes)
{
	std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
	if (!ofs) {
		throw std::runtime_error(fmt::format("IOError(writeFile):cannot open {}", path.string()));
	}
	ofs.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
	if (!ofs) {
		throw std::runtime_error(fmt::format("IOError(writeFile):failed to write {}", path.string()));
	}
}

std::string_view sniffMimeType(const std::vector<std::uint8_t> &bytes)
{
	return Raster::mimeTypeOf(Raster::sniffImageFormat(bytes));
}

int run(const Global::CommandLine &commandLine, const std::shared_ptr<const Logger::ILogger> &bootstrapLogger)
{
	const Global::AppConfig config = Global::AppConfig::load(commandLine.config, bootstrapLogger);

	const std::shared_ptr<const Logger::ILogger> logger =
		std::make_shared<Logger::StderrLogger>("[" PROGRAM_NAME "]", config.logLevel);

	auto transport = std::make_shared<Segmentation::CurlHttpTransport>(
		logger, Segmentation::CurlHttpTransportOptions{config.connectTimeoutSeconds,
							       config.requestTimeoutSeconds});
	auto client = std::make_shared<Segmentation::GeminiSegmentationClient>(
		Segmentation::GeminiClientSettings{config.apiBaseUrl, config.model, config.apiKey}, transport,
		logger);
	auto compositor = std::make_shared<const Compositor::Compositor>(
		logger, Compositor::CompositorOptions{config.jpegQuality});

	Session::Workflow workflow(client, compositor, logger);

	const std::vector<std::uint8_t> subjectBytes = readFile(commandLine.subject);
	if (!workflow.selectSubject(subjectBytes, sniffMimeType(subjectBytes),
				    commandLine.subject.filename().string())) {
		logger->error("{}", workflow.snapshot().errorMessage.value_or("invalid subject"));
		return 1;
	}

	if (commandLine.background) {
		const std::vector<std::uint8_t> backgroundBytes = readFile(*commandLine.background);
		if (!workflow.selectBackground(backgroundBytes, sniffMimeType(backgroundBytes),
					       commandLine.background->filename().string())) {
			logger->error("{}", workflow.snapshot().errorMessage.value_or("invalid background"));
			return 1;
		}
	}

	workflow.setOutputMode(commandLine.mode);

	try {
		workflow.removeBackground().get();
	} catch (const std::exception &) {
		logger->error("{}", workflow.snapshot().errorMessage.value_or("background removal failed"));
		return 1;
	}

	const Compositor::EncodedOutput output = workflow.exportImage();

	std::filesystem::create_directories(commandLine.outputDir);
	const std::filesystem::path outputPath = commandLine.outputDir / output.suggestedFileName;
	writeFile(outputPath, output.bytes);

	logger->info("wrote {} ({} bytes, {})", outputPath.string(), output.bytes.size(), output.mimeType);
	return 0;
}

} // anonymous namespace

int main(int argc, char **argv)
{
	const std::shared_ptr<const Logger::ILogger> bootstrapLogger =
		std::make_shared<Logger::StderrLogger>("[" PROGRAM_NAME "]");

	const char *const *args = argv + 1;
	const std::size_t argCount = argc > 1 ? static_cast<std::size_t>(argc - 1) : 0;

	Global::CommandLine commandLine;
	try {
		commandLine = Global::CommandLine::parse(std::span<const char *const>(args, argCount));
	} catch (const std::invalid_argument &e) {
		bootstrapLogger->error("{}", e.what());
		printUsage();
		return 1;
	}

	try {
		CurlHelper::CurlGlobalGuard curlGlobalGuard;
		return run(commandLine, bootstrapLogger);
	} catch (const std::exception &e) {
		bootstrapLogger->logException(e, "main");
		return 1;
	}
}
