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
#include <string>
#include <utility>
#include <vector>

namespace CutoutStudio::Segmentation {

struct HttpRequest {
	std::string url;
	std::vector<std::pair<std::string, std::string>> headers;
	std::string body;
};

struct HttpResponse {
	long statusCode = 0;
	std::vector<std::uint8_t> body;
};

class IHttpTransport {
protected:
	IHttpTransport() = default;

public:
	virtual ~IHttpTransport() = default;

	/**
	 * @brief Performs a single POST. Non-2xx statuses are returned, not thrown.
	 * @throws TransportFailure if no response could be obtained.
	 */
	virtual HttpResponse post(const HttpRequest &request) = 0;

	IHttpTransport(const IHttpTransport &) = delete;
	IHttpTransport &operator=(const IHttpTransport &) = delete;
	IHttpTransport(IHttpTransport &&) = delete;
	IHttpTransport &operator=(IHttpTransport &&) = delete;
};

} // namespace CutoutStudio::Segmentation
