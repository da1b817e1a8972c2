/*
 * File: codec/errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-08
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace strictenc::codec {

	enum class codec_errc {
		unknown_variant,
		truncated_input,
		invalid_value,
		length_overflow,
		value_mismatch,
		variant_not_encodable,
		trailing_bytes,
	};

	inline std::string_view to_string(codec_errc code) noexcept {
		switch (code) {
		case codec_errc::unknown_variant: return "unknown variant";
		case codec_errc::truncated_input: return "truncated input";
		case codec_errc::invalid_value: return "invalid value";
		case codec_errc::length_overflow: return "length overflow";
		case codec_errc::value_mismatch: return "value mismatch";
		case codec_errc::variant_not_encodable: return "variant not encodable";
		case codec_errc::trailing_bytes: return "trailing bytes";
		}
		return "unknown error";
	}

	// Raised while encoding or decoding live data. The executor prepends the
	// member path while the error unwinds; code, type and raw value stay as raised.
	class codec_error : public std::runtime_error {
	public:
		codec_error(codec_errc code, std::string type_name, std::string detail,
			std::optional<std::uint64_t> raw_value = std::nullopt)
			: std::runtime_error(std::string(to_string(code)))
			, code_(code)
			, type_name_(std::move(type_name))
			, detail_(std::move(detail))
			, raw_value_(raw_value)
		{
			rebuild_message();
		}

		static codec_error unknown_variant(std::string type_name, std::uint64_t raw) {
			return codec_error(codec_errc::unknown_variant, std::move(type_name),
				"no variant with discriminant " + std::to_string(raw), raw);
		}

		static codec_error truncated(std::string type_name, std::size_t wanted) {
			return codec_error(codec_errc::truncated_input, std::move(type_name),
				"input ended, " + std::to_string(wanted) + " more bytes were needed");
		}

		codec_errc code() const noexcept { return code_; }
		const std::string& type_name() const noexcept { return type_name_; }
		const std::optional<std::uint64_t>& raw_value() const noexcept { return raw_value_; }
		const std::string& path() const noexcept { return path_; }

		// `segment` is `Type.field` or `Type::Variant`.
		void push_context(std::string_view segment) {
			if (path_.empty()) {
				path_ = std::string(segment);
			}
			else {
				path_ = std::string(segment) + " > " + path_;
			}
			rebuild_message();
		}

		const char* what() const noexcept override {
			return message_.c_str();
		}

	private:
		void rebuild_message() {
			message_ = std::string(to_string(code_));
			if (!type_name_.empty()) {
				message_ += " in `" + type_name_ + "`";
			}
			if (!path_.empty()) {
				message_ += " at " + path_;
			}
			if (!detail_.empty()) {
				message_ += ": " + detail_;
			}
		}

		codec_errc code_;
		std::string type_name_;
		std::string detail_;
		std::optional<std::uint64_t> raw_value_;
		std::string path_;
		std::string message_;
	};

} // namespace strictenc::codec
