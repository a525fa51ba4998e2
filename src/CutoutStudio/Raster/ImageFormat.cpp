/*
 * Cutout Studio - Raster Module
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

#include "ImageFormat.hpp"

#include <algorithm>
#include <array>

namespace CutoutStudio::Raster {

namespace {

template<std::size_t N>
bool startsWith(std::span<const std::uint8_t> bytes, const std::array<std::uint8_t, N> &magic,
		std::size_t offset = 0) noexcept
{
	if (bytes.size() < offset + N) {
		return false;
	}
	return std::equal(magic.begin(), magic.end(), bytes.begin() + offset);
}

constexpr std::array<std::uint8_t, 8> kPngMagic = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a};
constexpr std::array<std::uint8_t, 3> kJpegMagic = {0xff, 0xd8, 0xff};
constexpr std::array<std::uint8_t, 4> kGifMagic = {'G', 'I', 'F', '8'};
constexpr std::array<std::uint8_t, 4> kRiffMagic = {'R', 'I', 'F', 'F'};
constexpr std::array<std::uint8_t, 4> kWebpMagic = {'W', 'E', 'B', 'P'};
constexpr std::array<std::uint8_t, 2> kBmpMagic = {'B', 'M'};

} // namespace

ImageFormat sniffImageFormat(std::span<const std::uint8_t> bytes) noexcept
{
	if (startsWith(bytes, kPngMagic))
		return ImageFormat::Png;
	if (startsWith(bytes, kJpegMagic))
		return ImageFormat::Jpeg;
	if (startsWith(bytes, kGifMagic))
		return ImageFormat::Gif;
	if (startsWith(bytes, kRiffMagic) && startsWith(bytes, kWebpMagic, 8))
		return ImageFormat::Webp;
	if (startsWith(bytes, kBmpMagic))
		return ImageFormat::Bmp;
	return ImageFormat::Unknown;
}

std::string_view mimeTypeOf(ImageFormat format) noexcept
{
	switch (format) {
	case ImageFormat::Png:
		return "image/png";
	case ImageFormat::Jpeg:
		return "image/jpeg";
	case ImageFormat::Gif:
		return "image/gif";
	case ImageFormat::Webp:
		return "image/webp";
	case ImageFormat::Bmp:
		return "image/bmp";
	case ImageFormat::Unknown:
		break;
	}
	return "application/octet-stream";
}

} // namespace CutoutStudio::Raster
