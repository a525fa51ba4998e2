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

#include <memory>

#include <CutoutStudio/Logger/ILogger.hpp>

#include "IHttpTransport.hpp"

namespace CutoutStudio::Segmentation {

struct CurlHttpTransportOptions {
	long connectTimeoutSeconds = 10;
	long requestTimeoutSeconds = 120;
	// Upper bound on the response body; generated images are a few megabytes.
	long maxResponseBytes = 64L * 1024 * 1024;
};

/**
 * @brief IHttpTransport backed by a fresh libcurl easy handle per request.
 *
 * curl_global_init must have been called (see CurlHelper::CurlGlobalGuard).
 */
class CurlHttpTransport final : public IHttpTransport {
public:
	CurlHttpTransport(std::shared_ptr<const Logger::ILogger> logger, CurlHttpTransportOptions options = {});
	~CurlHttpTransport() override = default;

	HttpResponse post(const HttpRequest &request) override;

private:
	const std::shared_ptr<const Logger::ILogger> logger_;
	const CurlHttpTransportOptions options_;
};

} // namespace CutoutStudio::Segmentation
