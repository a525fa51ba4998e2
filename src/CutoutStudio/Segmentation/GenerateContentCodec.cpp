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

#include "GenerateContentCodec.hpp"

#include <initializer_list>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "Base64.hpp"
#include "SegmentationError.hpp"

namespace CutoutStudio::Segmentation {

using nlohmann::json;

namespace {

// The REST API answers in camelCase, but snake_case is accepted on input and seen in some proxies.
const json *findInlineData(const json &part)
{
	for (const char *key : {"inlineData", "inline_data"}) {
		const auto it = part.find(key);
		if (it != part.end() && it->is_object()) {
			return &*it;
		}
	}
	return nullptr;
}

std::string stringField(const json &object, std::initializer_list<const char *> keys)
{
	for (const char *key : keys) {
		const auto it = object.find(key);
		if (it != object.end() && it->is_string()) {
			return it->get<std::string>();
		}
	}
	return {};
}

} // namespace

std::string buildGenerateContentBody(std::span<const std::uint8_t> imageBytes, std::string_view mimeType,
				     std::string_view prompt)
{
	json imagePart = {{"inlineData", {{"mimeType", std::string(mimeType)}, {"data", encodeBase64(imageBytes)}}}};
	json textPart = {{"text", std::string(prompt)}};

	json content = {{"parts", json::array({std::move(imagePart), std::move(textPart)})}};

	json body = {
		{"contents", json::array({std::move(content)})},
		{"generationConfig", {{"responseModalities", json::array({"IMAGE", "TEXT"})}}},
	};
	return body.dump();
}

GenerateContentResult parseGenerateContentResponse(std::string_view body)
{
	const json root = json::parse(body, nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		throw TransportFailure("MalformedResponse(parseGenerateContentResponse): not a JSON object");
	}

	GenerateContentResult result;

	const auto candidates = root.find("candidates");
	if (candidates == root.end() || !candidates->is_array() || candidates->empty()) {
		return result;
	}

	const json &firstCandidate = (*candidates)[0];
	if (!firstCandidate.is_object()) {
		return result;
	}

	const auto content = firstCandidate.find("content");
	if (content == firstCandidate.end() || !content->is_object()) {
		return result;
	}

	const auto parts = content->find("parts");
	if (parts == content->end() || !parts->is_array()) {
		return result;
	}

	for (const json &part : *parts) {
		if (!part.is_object()) {
			continue;
		}

		if (!result.image) {
			if (const json *inlineData = findInlineData(part)) {
				InlineImage image;
				image.mimeType = stringField(*inlineData, {"mimeType", "mime_type"});
				try {
					image.data = decodeBase64(stringField(*inlineData, {"data"}));
				} catch (const std::invalid_argument &e) {
					throw TransportFailure(
						fmt::format("MalformedResponse(parseGenerateContentResponse): {}", e.what()));
				}
				result.image = std::move(image);
				continue;
			}
		}

		if (!result.text) {
			const auto text = part.find("text");
			if (text != part.end() && text->is_string() && !text->get_ref<const std::string &>().empty()) {
				result.text = text->get<std::string>();
			}
		}
	}

	return result;
}

std::optional<std::string> parseErrorMessage(std::string_view body)
{
	const json root = json::parse(body, nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		return std::nullopt;
	}

	const auto error = root.find("error");
	if (error == root.end() || !error->is_object()) {
		return std::nullopt;
	}

	const auto message = error->find("message");
	if (message == error->end() || !message->is_string()) {
		return std::nullopt;
	}
	return message->get<std::string>();
}

} // namespace CutoutStudio::Segmentation
