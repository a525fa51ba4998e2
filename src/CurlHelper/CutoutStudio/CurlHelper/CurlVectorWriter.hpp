/*
 * CutoutStudio CurlHelper Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <exception>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace CutoutStudio::CurlHelper {

using CurlVectorWriterBuffer = std::vector<std::uint8_t>;

/**
 * @brief CURLOPT_WRITEFUNCTION callback appending the body to a CurlVectorWriterBuffer.
 *
 * Returning a short count makes libcurl abort the transfer with CURLE_WRITE_ERROR,
 * which is how an allocation failure is reported back.
 */
inline std::size_t CurlVectorWriter(void *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	const std::size_t totalSize = size * nmemb;
	auto *buffer = static_cast<CurlVectorWriterBuffer *>(userp);
	try {
		const auto *bytes = static_cast<const std::uint8_t *>(contents);
		buffer->insert(buffer->end(), bytes, bytes + totalSize);
	} catch (const std::exception &) {
		return 0;
	}
	return totalSize;
}

} // namespace CutoutStudio::CurlHelper
