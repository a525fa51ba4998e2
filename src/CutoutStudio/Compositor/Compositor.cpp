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

#include "Compositor.hpp"

#include <new>
#include <string>
#include <utility>

#include <opencv2/core.hpp>

#include "Canvas.hpp"
#include "CompositorError.hpp"
#include "CropGeometry.hpp"
#include "ExportNaming.hpp"

namespace CutoutStudio::Compositor {

Compositor::Compositor(std::shared_ptr<const Logger::ILogger> logger, CompositorOptions options)
	: logger_(std::move(logger)),
	  options_(options)
{
}

EncodedOutput Compositor::compose(const CompositionRequest &request) const
{
	if (!request.foreground) {
		throw CompositorError(CompositorStage::Compose, "no foreground image to export");
	}

	const Raster::RasterImage &foreground = *request.foreground;
	const bool useBackground = request.background && request.mode != OutputMode::PassportJPEG;
	const EncodingFormat format = encodingFormatOf(request.mode);

	EncodedOutput output;
	output.mimeType = mimeTypeOf(format);
	output.suggestedFileName = suggestedFileName(request.mode, useBackground, request.subjectFileName);

	try {
		switch (request.mode) {
		case OutputMode::TransparentPNG:
			if (useBackground) {
				output.bytes = encode(placeOnBackground(foreground, *request.background), format);
			} else if (foreground.getSourceFormat() == Raster::ImageFormat::Png &&
				   !foreground.getEncodedSource().empty()) {
				const auto source = foreground.getEncodedSource();
				output.bytes.assign(source.begin(), source.end());
			} else {
				output.bytes = encode(foreground, format);
			}
			break;
		case OutputMode::FlattenedJPEG:
			output.bytes = encode(useBackground ? placeOnBackground(foreground, *request.background)
							    : flattenOnWhite(foreground),
					      format);
			break;
		case OutputMode::PassportJPEG:
			output.bytes = encode(cropPassport(foreground), format);
			break;
		}
	} catch (const cv::Exception &e) {
		throw CompositorError(CompositorStage::Compose, e.what());
	} catch (const std::bad_alloc &) {
		throw CompositorError(CompositorStage::Compose, "out of memory while composing");
	}

	logger_->info("ExportComposed", {{"mode", toString(request.mode)},
					 {"fileName", output.suggestedFileName},
					 {"bytes", std::to_string(output.bytes.size())}});
	return output;
}

Raster::RasterImage Compositor::placeOnBackground(const Raster::RasterImage &foreground,
						   const Raster::RasterImage &background)
{
	Canvas canvas(foreground.getWidth(), foreground.getHeight());

	const CropWindow window = computeCoverCrop(background.getWidth(), background.getHeight(),
						   canvas.getWidth(), canvas.getHeight());
	canvas.drawImageScaled(background, window);
	canvas.drawImage(foreground);

	return canvas.toRasterImage();
}

Raster::RasterImage Compositor::flattenOnWhite(const Raster::RasterImage &foreground)
{
	Canvas canvas(foreground.getWidth(), foreground.getHeight());
	canvas.fill(Raster::kOpaqueWhite);
	canvas.drawImage(foreground);
	return canvas.toRasterImage();
}

Raster::RasterImage Compositor::cropPassport(const Raster::RasterImage &foreground)
{
	Canvas canvas(kPassportSize, kPassportSize);
	canvas.fill(Raster::kOpaqueWhite);
	canvas.drawImageScaled(foreground, computeCenteredSquareCrop(foreground.getWidth(), foreground.getHeight()));
	return canvas.toRasterImage();
}

std::vector<std::uint8_t> Compositor::encode(const Raster::RasterImage &image, EncodingFormat format) const
{
	switch (format) {
	case EncodingFormat::Png:
		return encodePng(image);
	case EncodingFormat::Jpeg:
		return encodeJpeg(image, options_.jpegQuality);
	}
	throw EncodeFailure("unknown encoding format");
}

} // namespace CutoutStudio::Compositor
