/*
 * CutoutStudio CurlHelper Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <stdexcept>

#include <curl/curl.h>

namespace CutoutStudio::CurlHelper {

namespace CurlUnique {

struct CurlEasyDeleter {
	void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
	void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

} // namespace CurlUnique

using unique_curl_t = std::unique_ptr<CURL, CurlUnique::CurlEasyDeleter>;
using unique_curl_slist_t = std::unique_ptr<curl_slist, CurlUnique::CurlSlistDeleter>;

/**
 * @brief Owns libcurl's process-wide state for the lifetime of the program.
 *
 * Construct exactly once in main() before any other thread starts.
 */
class CurlGlobalGuard {
public:
	CurlGlobalGuard()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw std::runtime_error("InitError(CurlGlobalGuard)");
		}
	}

	~CurlGlobalGuard() noexcept { curl_global_cleanup(); }

	CurlGlobalGuard(const CurlGlobalGuard &) = delete;
	CurlGlobalGuard &operator=(const CurlGlobalGuard &) = delete;
	CurlGlobalGuard(CurlGlobalGuard &&) = delete;
	CurlGlobalGuard &operator=(CurlGlobalGuard &&) = delete;
};

} // namespace CutoutStudio::CurlHelper
