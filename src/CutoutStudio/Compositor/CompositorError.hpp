/*
 * Cutout Studio - Compositor Module
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
#include <string_view>

namespace CutoutStudio::Compositor {

enum class CompositorStage { Decode, RenderTarget, Compose, Encode };

inline std::string_view stageName(CompositorStage stage) noexcept
{
	switch (stage) {
	case CompositorStage::Decode:
		return "decode";
	case CompositorStage::RenderTarget:
		return "render-target";
	case CompositorStage::Compose:
		return "compose";
	case CompositorStage::Encode:
		return "encode";
	}
	return "unknown";
}

/**
 * @brief Base of every export failure. The stage tells the caller which step failed.
 */
class CompositorError : public std::runtime_error {
public:
	CompositorError(CompositorStage stage, const std::string &message)
		: std::runtime_error(std::string(stageName(stage)) + ": " + message),
		  stage_(stage)
	{
	}

	CompositorStage getStage() const noexcept { return stage_; }

private:
	CompositorStage stage_;
};

class DecodeFailure : public CompositorError {
public:
	explicit DecodeFailure(const std::string &message) : CompositorError(CompositorStage::Decode, message) {}
};

class RenderTargetUnavailable : public CompositorError {
public:
	explicit RenderTargetUnavailable(const std::string &message)
		: CompositorError(CompositorStage::RenderTarget, message)
	{
	}
};

class EncodeFailure : public CompositorError {
public:
	explicit EncodeFailure(const std::string &message) : CompositorError(CompositorStage::Encode, message) {}
};

} // namespace CutoutStudio::Compositor
