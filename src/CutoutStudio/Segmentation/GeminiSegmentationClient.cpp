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

#include "GeminiSegmentationClient.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <CutoutStudio/Raster/ImageDecoder.hpp>

#include "GenerateContentCodec.hpp"
#include "SegmentationError.hpp"

namespace CutoutStudio::Segmentation {

GeminiSegmentationClient::GeminiSegmentationClient(GeminiClientSettings settings,
						   std::shared_ptr<IHttpTransport> transport,
						   std::shared_ptr<const Logger::ILogger> logger)
	: settings_(std::move(settings)),
	  transport_(transport ? std::move(transport) : throw std::invalid_argument("transport must not be null")),
	  logger_(std::move(logger))
{
}

std::string GeminiSegmentationClient::endpointUrl() const
{
	std::string_view base = settings_.apiBaseUrl;
	while (!base.empty() && base.back() == '/') {
		base.remove_suffix(1);
	}
	return fmt::format("{}/v1beta/models/{}:generateContent", base, settings_.model);
}

Raster::RasterImage GeminiSegmentationClient::segmentForeground(std::span<const std::uint8_t> imageBytes,
								std::string_view mimeType)
{
	if (!mimeType.starts_with("image/")) {
		throw std::invalid_argument(fmt::format("'{}' is not an image MIME type", mimeType));
	}
	if (settings_.apiKey.empty()) {
		throw std::runtime_error("ConfigError(GeminiSegmentationClient): API key is not set");
	}

	HttpRequest request;
	request.url = endpointUrl();
	request.headers = {{"Content-Type", "application/json"}, {"x-goog-api-key", settings_.apiKey}};
	request.body = buildGenerateContentBody(imageBytes, mimeType, kPrompt);

	logger_->info("SegmentationRequested", {{"model", settings_.model},
						{"mimeType", mimeType},
						{"bytes", std::to_string(imageBytes.size())}});

	const HttpResponse response = transport_->post(request);
	const std::string_view body(reinterpret_cast<const char *>(response.body.data()), response.body.size());

	if (response.statusCode < 200 || response.statusCode >= 300) {
		const std::string message = parseErrorMessage(body).value_or("no error message");
		logger_->error("SegmentationHttpError",
			       {{"status", std::to_string(response.statusCode)}, {"message", message}});
		throw TransportFailure(fmt::format("HTTP {}: {}", response.statusCode, message));
	}

	GenerateContentResult result = parseGenerateContentResponse(body);

	if (!result.image) {
		std::string reason = result.text.value_or(kNoImageFallbackReason);
		logger_->warn("SegmentationRefused", {{"reason", reason}});
		throw ModelRefused(std::move(reason));
	}

	try {
		Raster::RasterImage foreground = Raster::decodeImage(result.image->data);
		logger_->info("SegmentationSucceeded", {{"width", std::to_string(foreground.getWidth())},
							{"height", std::to_string(foreground.getHeight())},
							{"mimeType", result.image->mimeType}});
		return foreground;
	} catch (const Raster::ImageDecodeError &e) {
		logger_->error("SegmentationPayloadUndecodable", {{"message", e.what()}});
		throw TransportFailure(fmt::format("MalformedResponse(GeminiSegmentationClient): {}", e.what()));
	}
}

} // namespace CutoutStudio::Segmentation
