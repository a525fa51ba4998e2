/*
 * Cutout Studio - Session Module
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
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include <CutoutStudio/Compositor/Compositor.hpp>
#include <CutoutStudio/Compositor/ImageCodec.hpp>
#include <CutoutStudio/Logger/ILogger.hpp>
#include <CutoutStudio/Segmentation/ISegmentationClient.hpp>
#include <CutoutStudio/TaskQueue/ThrottledTaskQueue.hpp>

#include "SessionState.hpp"

namespace CutoutStudio::Session {

inline constexpr std::string_view kInvalidSubjectMessage = "Please upload a valid image file (PNG, JPG, etc.).";
inline constexpr std::string_view kInvalidBackgroundMessage = "Please upload a valid image file for the background.";
inline constexpr std::string_view kRemoveBackgroundFailedMessage =
	"Failed to remove background. Please try another image.";
inline constexpr std::string_view kBackgroundLoadFailedMessage = "Failed to load background image for composition.";
inline constexpr std::string_view kExportFailedMessage = "Failed to export image.";

/**
 * @brief Thrown through a removeBackground future whose request was abandoned by reset().
 */
class RequestAbandoned : public std::runtime_error {
public:
	RequestAbandoned() : std::runtime_error("RequestAbandoned: the session was reset") {}
};

/**
 * @brief Drives one subject image from upload to export.
 *
 * All operations are safe to call from any thread. The segmentation call runs
 * on a single worker; results belonging to a session that has since been
 * reset are discarded.
 */
class Workflow {
public:
	using BackgroundDecoder = std::function<Raster::RasterImage(std::span<const std::uint8_t>)>;

	Workflow(std::shared_ptr<Segmentation::ISegmentationClient> segmentationClient,
		 std::shared_ptr<const Compositor::Compositor> compositor,
		 std::shared_ptr<const Logger::ILogger> logger,
		 BackgroundDecoder backgroundDecoder = Compositor::decodeImage);

	~Workflow() noexcept;

	Workflow(const Workflow &) = delete;
	Workflow &operator=(const Workflow &) = delete;
	Workflow(Workflow &&) = delete;
	Workflow &operator=(Workflow &&) = delete;

	/**
	 * @brief Starts a new session for the given subject.
	 * @return false if mimeType is not an image type; errorMessage is set and the session is kept.
	 */
	bool selectSubject(std::span<const std::uint8_t> bytes, std::string_view mimeType, std::string_view fileName);

	/**
	 * @return false if mimeType is not an image type; errorMessage is set and the background is kept.
	 */
	bool selectBackground(std::span<const std::uint8_t> bytes, std::string_view mimeType,
			      std::string_view fileName);

	/**
	 * @throws std::invalid_argument for PassportJPEG while a background is set.
	 */
	void setOutputMode(Compositor::OutputMode mode);

	/**
	 * @brief Requests the cutout for the current subject.
	 *
	 * The future yields the cutout, the segmentation error, or RequestAbandoned
	 * if reset() or a newer request overtook it. A request dropped before it
	 * started yields std::future_error with broken_promise.
	 *
	 * @throws std::logic_error if no subject is selected.
	 */
	std::future<std::shared_ptr<const Raster::RasterImage>> removeBackground();

	/**
	 * @brief Clears the session and abandons any pending request.
	 */
	void reset();

	/**
	 * @brief Composes and encodes the current cutout in the current output mode.
	 * errorMessage is set on every failure other than a missing cutout.
	 *
	 * @throws std::logic_error if there is no cutout yet.
	 * @throws Compositor::CompositorError
	 */
	Compositor::EncodedOutput exportImage();

	SessionState snapshot() const;

private:
	struct RequestTicket {
		std::uint64_t generation;
		std::uint64_t serial;
	};

	bool isCurrentLocked(const RequestTicket &ticket) const noexcept;
	bool publishCutout(const RequestTicket &ticket, std::shared_ptr<const Raster::RasterImage> cutout);
	bool publishFailure(const RequestTicket &ticket, const std::exception &e);
	void recordExportFailure(std::uint64_t generation, std::string_view message);

	const std::shared_ptr<Segmentation::ISegmentationClient> segmentationClient_;
	const std::shared_ptr<const Compositor::Compositor> compositor_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const BackgroundDecoder backgroundDecoder_;

	mutable std::mutex mutex_;
	SessionState state_;
	std::uint64_t generation_ = 0;
	std::uint64_t latestRequestSerial_ = 0;

	// Declared last so the worker is joined before the state it touches goes away.
	TaskQueue::ThrottledTaskQueue segmentationQueue_;
};

} // namespace CutoutStudio::Session
