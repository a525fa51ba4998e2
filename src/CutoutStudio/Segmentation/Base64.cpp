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

#include "Base64.hpp"

#include <array>
#include <stdexcept>

#include <fmt/format.h>

namespace CutoutStudio::Segmentation {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::int8_t kInvalid = -1;

constexpr std::array<std::int8_t, 256> makeDecodeTable()
{
	std::array<std::int8_t, 256> table{};
	for (auto &entry : table) {
		entry = kInvalid;
	}
	for (int i = 0; i < 64; ++i) {
		table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
	}
	return table;
}

constexpr std::array<std::int8_t, 256> kDecodeTable = makeDecodeTable();

bool isWhitespace(char c) noexcept
{
	return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

std::string encodeBase64(std::span<const std::uint8_t> data)
{
	std::string out;
	out.reserve((data.size() + 2) / 3 * 4);

	std::size_t i = 0;
	for (; i + 2 < data.size(); i += 3) {
		const std::uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
		out.push_back(kAlphabet[(triple >> 18) & 0x3f]);
		out.push_back(kAlphabet[(triple >> 12) & 0x3f]);
		out.push_back(kAlphabet[(triple >> 6) & 0x3f]);
		out.push_back(kAlphabet[triple & 0x3f]);
	}

	const std::size_t rest = data.size() - i;
	if (rest == 1) {
		const std::uint32_t triple = data[i] << 16;
		out.push_back(kAlphabet[(triple >> 18) & 0x3f]);
		out.push_back(kAlphabet[(triple >> 12) & 0x3f]);
		out.append("==");
	} else if (rest == 2) {
		const std::uint32_t triple = (data[i] << 16) | (data[i + 1] << 8);
		out.push_back(kAlphabet[(triple >> 18) & 0x3f]);
		out.push_back(kAlphabet[(triple >> 12) & 0x3f]);
		out.push_back(kAlphabet[(triple >> 6) & 0x3f]);
		out.push_back('=');
	}
	return out;
}

std::vector<std::uint8_t> decodeBase64(std::string_view encoded)
{
	std::vector<std::uint8_t> out;
	out.reserve(encoded.size() / 4 * 3);

	std::uint32_t accumulator = 0;
	int sextets = 0;
	bool paddingSeen = false;

	for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
		const char c = encoded[pos];
		if (isWhitespace(c)) {
			continue;
		}
		if (c == '=') {
			paddingSeen = true;
			continue;
		}

		const std::int8_t value = kDecodeTable[static_cast<unsigned char>(c)];
		if (value == kInvalid || paddingSeen) {
			throw std::invalid_argument(fmt::format("invalid base64 character at offset {}", pos));
		}

		accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
		if (++sextets == 4) {
			out.push_back(static_cast<std::uint8_t>((accumulator >> 16) & 0xff));
			out.push_back(static_cast<std::uint8_t>((accumulator >> 8) & 0xff));
			out.push_back(static_cast<std::uint8_t>(accumulator & 0xff));
			accumulator = 0;
			sextets = 0;
		}
	}

	if (sextets == 1) {
		throw std::invalid_argument("truncated base64 input");
	}
	if (sextets == 2) {
		out.push_back(static_cast<std::uint8_t>((accumulator >> 4) & 0xff));
	} else if (sextets == 3) {
		out.push_back(static_cast<std::uint8_t>((accumulator >> 10) & 0xff));
		out.push_back(static_cast<std::uint8_t>((accumulator >> 2) & 0xff));
	}
	return out;
}

} // namespace CutoutStudio::Segmentation
