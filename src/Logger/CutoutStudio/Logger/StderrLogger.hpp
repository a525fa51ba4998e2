/*
 * CutoutStudio Logger Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdio>
#include <iterator>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "ILogger.hpp"

namespace CutoutStudio::Logger {

class StderrLogger final : public ILogger {
public:
	explicit StderrLogger(std::string prefix, LogLevel minLevel = LogLevel::Info) noexcept
		: prefix_(std::move(prefix)),
		  minLevel_(minLevel)
	{
	}

	~StderrLogger() override = default;

protected:
	void log(LogLevel level, std::string_view message) const noexcept override
	{
		if (level < minLevel_) {
			return;
		}

		std::lock_guard<std::mutex> lock(mutex_);
		std::fprintf(stderr, "%s [%.*s] %.*s\n", prefix_.c_str(), static_cast<int>(logLevelName(level).size()),
			     logLevelName(level).data(), static_cast<int>(message.size()), message.data());
	}

	void logEvent(LogLevel level, std::string_view name, std::source_location loc,
		      std::span<const LogField> context) const noexcept override
	{
		if (level < minLevel_) {
			return;
		}

		try {
			fmt::basic_memory_buffer<char, 1024> buffer;

			fmt::format_to(std::back_inserter(buffer), "name={}\tlocation={}:{}", name, loc.file_name(),
				       loc.line());
			for (const LogField &field : context) {
				fmt::format_to(std::back_inserter(buffer), "\t{}={}", field.key, field.value);
			}

			log(level, {buffer.data(), buffer.size()});
		} catch (...) {
			log(LogLevel::Error, "name=LoggerPanic");
		}
	}

private:
	const std::string prefix_;
	const LogLevel minLevel_;
	mutable std::mutex mutex_;
};

} // namespace CutoutStudio::Logger
