/*
 * File: core/log.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-04
 * License: MIT
 */

#pragma once

#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace strictenc::core {

	enum class log_level : int {
		trace = 0,
		debug = 1,
		info = 2,
		warning = 3,
		error = 4,
		critical = 5,
		off = 6,
	};

	inline std::string_view to_string(log_level level) noexcept {
		switch (level) {
		case log_level::trace: return "trace";
		case log_level::debug: return "debug";
		case log_level::info: return "info";
		case log_level::warning: return "warning";
		case log_level::error: return "error";
		case log_level::critical: return "critical";
		case log_level::off: return "off";
		}
		return "unknown";
	}

	struct log_entry {
		log_level level;
		std::string_view category;
		std::string_view message;
	};

	// Process-wide logger. Sinks are called under the logger mutex.
	class logger {
	public:
		using sink_type = std::function<void(const log_entry&)>;

		static logger& instance() {
			static logger inst;
			return inst;
		}

		void set_level(log_level level) {
			std::lock_guard<std::mutex> lock(mutex_);
			min_level_ = level;
		}

		log_level level() const {
			std::lock_guard<std::mutex> lock(mutex_);
			return min_level_;
		}

		bool is_enabled(log_level level) const {
			std::lock_guard<std::mutex> lock(mutex_);
			return level != log_level::off && level >= min_level_;
		}

		void add_sink(sink_type sink) {
			std::lock_guard<std::mutex> lock(mutex_);
			sinks_.push_back(std::move(sink));
		}

		void clear_sinks() {
			std::lock_guard<std::mutex> lock(mutex_);
			sinks_.clear();
		}

		void log(log_level level, std::string_view category, std::string_view message) {
			std::lock_guard<std::mutex> lock(mutex_);
			if (level == log_level::off || level < min_level_) {
				return;
			}
			const log_entry entry{ level, category, message };
			for (auto& sink : sinks_) {
				sink(entry);
			}
		}

		template <typename... Args>
		void log_formatted(log_level level, std::string_view category,
			std::format_string<Args...> fmt, Args&&... args) {
			if (!is_enabled(level)) {
				return;
			}
			log(level, category, std::format(fmt, std::forward<Args>(args)...));
		}

	private:
		logger() = default;
		logger(const logger&) = delete;
		logger& operator = (const logger&) = delete;

		mutable std::mutex mutex_;
		log_level min_level_ = log_level::warning;
		std::vector<sink_type> sinks_;
	};

	namespace sinks {

		inline logger::sink_type console_sink() {
			return [](const log_entry& e) {
				std::clog << "[" << to_string(e.level) << "] " << e.category << ": " << e.message << "\n";
			};
		}

	} // namespace sinks

} // namespace strictenc::core

#define STRICTENC_LOG(level, category, ...)                                              \
	do {                                                                                 \
		if (::strictenc::core::logger::instance().is_enabled(level)) {                   \
			::strictenc::core::logger::instance().log_formatted(level, category, __VA_ARGS__); \
		}                                                                                \
	} while (0)

#define STRICTENC_LOG_TRACE(category, ...) STRICTENC_LOG(::strictenc::core::log_level::trace, category, __VA_ARGS__)
#define STRICTENC_LOG_DEBUG(category, ...) STRICTENC_LOG(::strictenc::core::log_level::debug, category, __VA_ARGS__)
#define STRICTENC_LOG_INFO(category, ...) STRICTENC_LOG(::strictenc::core::log_level::info, category, __VA_ARGS__)
#define STRICTENC_LOG_WARN(category, ...) STRICTENC_LOG(::strictenc::core::log_level::warning, category, __VA_ARGS__)
#define STRICTENC_LOG_ERROR(category, ...) STRICTENC_LOG(::strictenc::core::log_level::error, category, __VA_ARGS__)
