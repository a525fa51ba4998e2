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

#include "Workflow.hpp"

#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include <CutoutStudio/Compositor/CompositorError.hpp>

namespace CutoutStudio::Session {

using Compositor::OutputMode;
using Raster::RasterImage;

namespace {

bool isImageMimeType(std::string_view mimeType) noexcept
{
	return mimeType.starts_with("image/");
}

UploadedImage makeUpload(std::span<const std::uint8_t> bytes, std::string_view mimeType, std::string_view fileName)
{
	return UploadedImage{{bytes.begin(), bytes.end()}, std::string(mimeType), std::string(fileName)};
}

} // namespace

Workflow::Workflow(std::shared_ptr<Segmentation::ISegmentationClient> segmentationClient,
		   std::shared_ptr<const Compositor::Compositor> compositor,
		   std::shared_ptr<const Logger::ILogger> logger, BackgroundDecoder backgroundDecoder)
	: segmentationClient_(segmentationClient ? std::move(segmentationClient)
						 : throw std::invalid_argument("segmentationClient must not be null")),
	  compositor_(compositor ? std::move(compositor) : throw std::invalid_argument("compositor must not be null")),
	  logger_(std::move(logger)),
	  backgroundDecoder_(backgroundDecoder ? std::move(backgroundDecoder)
					       : throw std::invalid_argument("backgroundDecoder must not be null")),
	  segmentationQueue_(logger_, 1)
{
}

Workflow::~Workflow() noexcept
{
	segmentationQueue_.shutdown();
}

bool Workflow::selectSubject(std::span<const std::uint8_t> bytes, std::string_view mimeType,
			     std::string_view fileName)
{
	if (!isImageMimeType(mimeType)) {
		std::lock_guard<std::mutex> lock(mutex_);
		state_.errorMessage = std::string(kInvalidSubjectMessage);
		logger_->warn("SubjectRejected", {{"mimeType", mimeType}, {"fileName", fileName}});
		return false;
	}

	reset();

	std::lock_guard<std::mutex> lock(mutex_);
	state_.subject = makeUpload(bytes, mimeType, fileName);
	logger_->info("SubjectSelected", {{"fileName", fileName},
					  {"mimeType", mimeType},
					  {"bytes", std::to_string(bytes.size())}});
	return true;
}

bool Workflow::selectBackground(std::span<const std::uint8_t> bytes, std::string_view mimeType,
				std::string_view fileName)
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (!isImageMimeType(mimeType)) {
		state_.errorMessage = std::string(kInvalidBackgroundMessage);
		logger_->warn("BackgroundRejected", {{"mimeType", mimeType}, {"fileName", fileName}});
		return false;
	}

	state_.background = makeUpload(bytes, mimeType, fileName);
	state_.outputMode = OutputMode::TransparentPNG;
	logger_->info("BackgroundSelected", {{"fileName", fileName},
					     {"mimeType", mimeType},
					     {"bytes", std::to_string(bytes.size())}});
	return true;
}

void Workflow::setOutputMode(OutputMode mode)
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (mode == OutputMode::PassportJPEG && state_.background) {
		throw std::invalid_argument("passport output is unavailable while a background is set");
	}
	state_.outputMode = mode;
	logger_->debug("OutputModeChanged", {{"mode", Compositor::toString(mode)}});
}

std::future<std::shared_ptr<const RasterImage>> Workflow::removeBackground()
{
	RequestTicket ticket{};
	UploadedImage subject;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!state_.subject) {
			throw std::logic_error("removeBackground called without a subject");
		}
		ticket = {generation_, ++latestRequestSerial_};
		subject = *state_.subject;
		state_.isLoading = true;
		state_.errorMessage.reset();
		state_.cutout.reset();
	}

	auto promise = std::make_shared<std::promise<std::shared_ptr<const RasterImage>>>();
	std::future<std::shared_ptr<const RasterImage>> future = promise->get_future();

	segmentationQueue_.push([this, ticket, subject = std::move(subject),
				 promise](const TaskQueue::ThrottledTaskQueue::CancellationToken &token) {
		try {
			auto cutout = std::make_shared<const RasterImage>(
				segmentationClient_->segmentForeground(subject.bytes, subject.mimeType));

			if (token->load() || !publishCutout(ticket, cutout)) {
				logger_->info("StaleCutoutDiscarded", {{"generation", std::to_string(ticket.generation)}});
				promise->set_exception(std::make_exception_ptr(RequestAbandoned()));
				return;
			}
			promise->set_value(std::move(cutout));
		} catch (const std::exception &e) {
			if (publishFailure(ticket, e)) {
				promise->set_exception(std::current_exception());
			} else {
				promise->set_exception(std::make_exception_ptr(RequestAbandoned()));
			}
		}
	});

	return future;
}

void Workflow::reset()
{
	segmentationQueue_.cancelAll();

	std::lock_guard<std::mutex> lock(mutex_);
	++generation_;
	state_ = SessionState{};
	logger_->debug("SessionReset", {{"generation", std::to_string(generation_)}});
}

Compositor::EncodedOutput Workflow::exportImage()
{
	std::uint64_t generation = 0;
	std::shared_ptr<const RasterImage> cutout;
	std::optional<UploadedImage> background;
	OutputMode mode = OutputMode::TransparentPNG;
	std::string subjectFileName;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!state_.cutout) {
			throw std::logic_error("exportImage called before a cutout is available");
		}
		generation = generation_;
		cutout = state_.cutout;
		background = state_.background;
		mode = state_.outputMode;
		subjectFileName = state_.subject ? state_.subject->fileName : std::string();
	}

	std::future<std::shared_ptr<const RasterImage>> backgroundReady;
	if (background && mode != OutputMode::PassportJPEG) {
		backgroundReady = std::async(std::launch::async, [this, bytes = std::move(background->bytes)] {
			return std::make_shared<const RasterImage>(backgroundDecoder_(bytes));
		});
	}

	Compositor::CompositionRequest request;
	request.foreground = std::move(cutout);
	request.mode = mode;
	request.subjectFileName = std::move(subjectFileName);

	if (backgroundReady.valid()) {
		try {
			request.background = backgroundReady.get();
		} catch (const Compositor::DecodeFailure &e) {
			logger_->logException(e, "Workflow::exportImage(background)");
			recordExportFailure(generation, kBackgroundLoadFailedMessage);
			throw;
		} catch (const std::exception &e) {
			logger_->logException(e, "Workflow::exportImage(background)");
			recordExportFailure(generation, kExportFailedMessage);
			throw;
		}
	}

	try {
		Compositor::EncodedOutput output = compositor_->compose(request);
		logger_->info("ExportReady", {{"fileName", output.suggestedFileName},
					      {"mimeType", output.mimeType},
					      {"bytes", std::to_string(output.bytes.size())}});
		return output;
	} catch (const std::exception &e) {
		logger_->logException(e, "Workflow::exportImage");
		recordExportFailure(generation, kExportFailedMessage);
		throw;
	}
}

SessionState Workflow::snapshot() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return state_;
}

bool Workflow::isCurrentLocked(const RequestTicket &ticket) const noexcept
{
	return ticket.generation == generation_ && ticket.serial == latestRequestSerial_;
}

bool Workflow::publishCutout(const RequestTicket &ticket, std::shared_ptr<const RasterImage> cutout)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (!isCurrentLocked(ticket)) {
		return false;
	}
	state_.cutout = std::move(cutout);
	state_.isLoading = false;
	state_.errorMessage.reset();
	return true;
}

bool Workflow::publishFailure(const RequestTicket &ticket, const std::exception &e)
{
	logger_->logException(e, "Workflow::removeBackground");

	std::lock_guard<std::mutex> lock(mutex_);
	if (!isCurrentLocked(ticket)) {
		return false;
	}
	state_.isLoading = false;
	state_.errorMessage = std::string(kRemoveBackgroundFailedMessage);
	return true;
}

void Workflow::recordExportFailure(std::uint64_t generation, std::string_view message)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (generation == generation_) {
		state_.errorMessage = std::string(message);
	}
}

} // namespace CutoutStudio::Session
