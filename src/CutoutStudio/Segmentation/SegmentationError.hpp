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

#include <stdexcept>
#include <string>
#include <utility>

namespace CutoutStudio::Segmentation {

class SegmentationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @brief The model answered but returned no image. reason() is the model's own text
 * when it gave one.
 */
class ModelRefused : public SegmentationError {
public:
	explicit ModelRefused(std::string reason)
		: SegmentationError("ModelRefused: " + reason),
		  reason_(std::move(reason))
	{
	}

	const std::string &reason() const noexcept { return reason_; }

private:
	std::string reason_;
};

/**
 * @brief The exchange itself failed: network, HTTP status, or an unreadable response.
 */
class TransportFailure : public SegmentationError {
public:
	explicit TransportFailure(const std::string &detail) : SegmentationError("TransportFailure: " + detail) {}
};

} // namespace CutoutStudio::Segmentation
