/*
Cutout Studio
Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include <CutoutStudio/Segmentation/GeminiSegmentationClient.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <CutoutStudio/Segmentation/Base64.hpp>
#include <CutoutStudio/Segmentation/SegmentationError.hpp>

#include "Compositor/Fixture.hpp"
#include "NullLogger.hpp"

using namespace CutoutStudio::Segmentation;
using nlohmann::json;

namespace {

class FakeHttpTransport final : public IHttpTransport {
public:
	HttpResponse post(const HttpRequest &request) override
	{
		requests.push_back(request);
		if (failure) {
			throw TransportFailure(*failure);
		}
		return response;
	}

	void respondWith(long statusCode, const std::string &body)
	{
		response.statusCode = statusCode;
		response.body.assign(body.begin(), body.end());
	}

	std::vector<HttpRequest> requests;
	HttpResponse response;
	std::optional<std::string> failure;
};

std::string imageResponse(const std::vector<std::uint8_t> &png)
{
	const json body = {{"candidates",
			    json::array({{{"content",
					   {{"parts", json::array({{{"inlineData",
								     {{"mimeType", "image/png"},
								      {"data", encodeBase64(png)}}}}})}}}}})}};
	return body.dump();
}

std::string textResponse(const std::string &text)
{
	const json body = {
		{"candidates", json::array({{{"content", {{"parts", json::array({{{"text", text}}})}}}}})}};
	return body.dump();
}

const std::vector<std::uint8_t> kSubjectBytes = {0xff, 0xd8, 0xff, 0xe0, 1, 2, 3};

} // namespace

class GeminiSegmentationClientTest : public ::testing::Test {
protected:
	GeminiSegmentationClient makeClient(std::string apiKey = "test-key")
	{
		GeminiClientSettings settings;
		settings.apiBaseUrl = "https://example.test/";
		settings.model = "image-model";
		settings.apiKey = std::move(apiKey);
		return GeminiSegmentationClient(settings, transport, std::make_shared<NullLogger>());
	}

	std::shared_ptr<FakeHttpTransport> transport = std::make_shared<FakeHttpTransport>();
};

TEST_F(GeminiSegmentationClientTest, RejectsNullTransport)
{
	EXPECT_THROW(GeminiSegmentationClient({}, nullptr, std::make_shared<NullLogger>()), std::invalid_argument);
}

TEST_F(GeminiSegmentationClientTest, EndpointUrl)
{
	EXPECT_EQ(makeClient().endpointUrl(), "https://example.test/v1beta/models/image-model:generateContent");
}

TEST_F(GeminiSegmentationClientTest, SuccessfulSegmentation)
{
	const std::vector<std::uint8_t> png = encodeWithOpenCv(makeCutoutImage(40, 30, RED), ".png");
	transport->respondWith(200, imageResponse(png));

	GeminiSegmentationClient client = makeClient();
	const RasterImage foreground = client.segmentForeground(kSubjectBytes, "image/jpeg");

	EXPECT_EQ(foreground.getWidth(), 40u);
	EXPECT_EQ(foreground.getHeight(), 30u);
	EXPECT_TRUE(foreground.hasFullyTransparentPixel());
	EXPECT_TRUE(std::equal(png.begin(), png.end(), foreground.getEncodedSource().begin(),
			       foreground.getEncodedSource().end()));

	ASSERT_EQ(transport->requests.size(), 1u);
	const HttpRequest &request = transport->requests.front();
	EXPECT_EQ(request.url, "https://example.test/v1beta/models/image-model:generateContent");
	EXPECT_NE(std::find(request.headers.begin(), request.headers.end(),
			    std::pair<std::string, std::string>{"x-goog-api-key", "test-key"}),
		  request.headers.end());

	const json body = json::parse(request.body);
	const json &parts = body.at("contents").at(0).at("parts");
	EXPECT_EQ(parts.at(0).at("inlineData").at("mimeType"), "image/jpeg");
	EXPECT_EQ(parts.at(0).at("inlineData").at("data"), encodeBase64(kSubjectBytes));
	EXPECT_EQ(parts.at(1).at("text"), GeminiSegmentationClient::kPrompt);
}

TEST_F(GeminiSegmentationClientTest, TextOnlyAnswerIsModelRefused)
{
	transport->respondWith(200, textResponse("Unable to process: unsafe content"));

	GeminiSegmentationClient client = makeClient();
	try {
		client.segmentForeground(kSubjectBytes, "image/png");
		FAIL() << "expected ModelRefused";
	} catch (const ModelRefused &e) {
		EXPECT_EQ(e.reason(), "Unable to process: unsafe content");
		EXPECT_STREQ(e.what(), "ModelRefused: Unable to process: unsafe content");
	}
	EXPECT_EQ(transport->requests.size(), 1u);
}

TEST_F(GeminiSegmentationClientTest, EmptyAnswerUsesFallbackReason)
{
	transport->respondWith(200, R"({"candidates":[{"finishReason":"SAFETY"}]})");

	GeminiSegmentationClient client = makeClient();
	try {
		client.segmentForeground(kSubjectBytes, "image/png");
		FAIL() << "expected ModelRefused";
	} catch (const ModelRefused &e) {
		EXPECT_EQ(e.reason(), GeminiSegmentationClient::kNoImageFallbackReason);
	}
}

TEST_F(GeminiSegmentationClientTest, HttpErrorIsTransportFailure)
{
	transport->respondWith(403, R"({"error":{"code":403,"message":"API key not valid"}})");

	GeminiSegmentationClient client = makeClient();
	try {
		client.segmentForeground(kSubjectBytes, "image/png");
		FAIL() << "expected TransportFailure";
	} catch (const TransportFailure &e) {
		EXPECT_NE(std::string(e.what()).find("403"), std::string::npos);
		EXPECT_NE(std::string(e.what()).find("API key not valid"), std::string::npos);
	}
	EXPECT_EQ(transport->requests.size(), 1u);
}

TEST_F(GeminiSegmentationClientTest, NetworkFailureIsNotRetried)
{
	transport->failure = "NetworkError(test): connection refused";

	GeminiSegmentationClient client = makeClient();
	EXPECT_THROW(client.segmentForeground(kSubjectBytes, "image/png"), TransportFailure);
	EXPECT_EQ(transport->requests.size(), 1u);
}

TEST_F(GeminiSegmentationClientTest, UndecodableImageIsTransportFailure)
{
	transport->respondWith(200, imageResponse({'n', 'o', 'p', 'e'}));

	GeminiSegmentationClient client = makeClient();
	EXPECT_THROW(client.segmentForeground(kSubjectBytes, "image/png"), TransportFailure);
}

TEST_F(GeminiSegmentationClientTest, NonImageMimeTypeMakesNoCall)
{
	GeminiSegmentationClient client = makeClient();
	EXPECT_THROW(client.segmentForeground(kSubjectBytes, "text/plain"), std::invalid_argument);
	EXPECT_TRUE(transport->requests.empty());
}

TEST_F(GeminiSegmentationClientTest, MissingApiKeyMakesNoCall)
{
	GeminiSegmentationClient client = makeClient("");
	EXPECT_THROW(client.segmentForeground(kSubjectBytes, "image/png"), std::runtime_error);
	EXPECT_TRUE(transport->requests.empty());
}
