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

#include "CurlHttpTransport.hpp"

#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

#include <CutoutStudio/CurlHelper/CurlUnique.hpp>
#include <CutoutStudio/CurlHelper/CurlVectorWriter.hpp>

#include "SegmentationError.hpp"

namespace CutoutStudio::Segmentation {

CurlHttpTransport::CurlHttpTransport(std::shared_ptr<const Logger::ILogger> logger, CurlHttpTransportOptions options)
	: logger_(std::move(logger)),
	  options_(options)
{
}

HttpResponse CurlHttpTransport::post(const HttpRequest &request)
{
	const CurlHelper::unique_curl_t curl(curl_easy_init());
	if (!curl) {
		logger_->error("Failed to initialize CURL for {}", request.url);
		throw TransportFailure("InitError(CurlHttpTransport::post)");
	}

	CurlHelper::unique_curl_slist_t headers;
	for (const auto &[name, value] : request.headers) {
		const std::string line = fmt::format("{}: {}", name, value);
		curl_slist *appended = curl_slist_append(headers.get(), line.c_str());
		if (!appended) {
			throw TransportFailure("InitError(CurlHttpTransport::post): header list");
		}
		// curl_slist_append returns the existing head unless the list was empty.
		if (!headers) {
			headers.reset(appended);
		}
	}

	CurlHelper::CurlVectorWriterBuffer readBuffer;
	char errorBuffer[CURL_ERROR_SIZE] = {};

	curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
	curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
	curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlHelper::CurlVectorWriter);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &readBuffer);
	curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
	curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.requestTimeoutSeconds);
	curl_easy_setopt(curl.get(), CURLOPT_MAXFILESIZE, options_.maxResponseBytes);
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

	const CURLcode res = curl_easy_perform(curl.get());
	if (res != CURLE_OK) {
		const char *detail = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res);
		logger_->error("HttpPostFailed", {{"url", request.url}, {"curl", detail}});
		throw TransportFailure(fmt::format("NetworkError(CurlHttpTransport::post):{}", detail));
	}

	HttpResponse response;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.statusCode);
	response.body = std::move(readBuffer);

	logger_->debug("HttpPostCompleted", {{"url", request.url},
					     {"status", std::to_string(response.statusCode)},
					     {"bytes", std::to_string(response.body.size())}});
	return response;
}

} // namespace CutoutStudio::Segmentation
