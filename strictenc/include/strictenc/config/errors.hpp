/*
 * File: config/errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-02
 * License: MIT
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "strictenc/config/attribute.hpp"

namespace strictenc::config {

	enum class config_errc {
		unrecognized_key,
		wrong_value_class,
		prohibited_key_present,
		mutually_exclusive_keys,
		invalid_repr_kind,
		duplicate_key,
		discriminant_out_of_range,
		duplicate_discriminant,
		missing_default,
		unknown_type,
		duplicate_type,
		unsupported_type_kind,
		recursive_type,
	};

	inline std::string_view to_string(config_errc code) noexcept {
		switch (code) {
		case config_errc::unrecognized_key: return "unrecognized key";
		case config_errc::wrong_value_class: return "wrong value class";
		case config_errc::prohibited_key_present: return "prohibited key present";
		case config_errc::mutually_exclusive_keys: return "mutually exclusive keys";
		case config_errc::invalid_repr_kind: return "invalid repr kind";
		case config_errc::duplicate_key: return "duplicate key";
		case config_errc::discriminant_out_of_range: return "discriminant out of range";
		case config_errc::duplicate_discriminant: return "duplicate discriminant";
		case config_errc::missing_default: return "missing default";
		case config_errc::unknown_type: return "unknown type";
		case config_errc::duplicate_type: return "duplicate type";
		case config_errc::unsupported_type_kind: return "unsupported type kind";
		case config_errc::recursive_type: return "recursive type";
		}
		return "unknown error";
	}

	// Raised while resolving attributes or deriving a plan; never while processing data.
	class config_error : public std::runtime_error {
	public:
		config_error(config_errc code, std::string key, location where, const std::string& detail)
			: std::runtime_error(make_message(code, key, where, detail))
			, code_(code)
			, key_(std::move(key))
			, where_(std::move(where))
		{}

		config_errc code() const noexcept { return code_; }
		const std::string& key() const noexcept { return key_; }
		const location& where() const noexcept { return where_; }

	private:
		static std::string make_message(config_errc code, const std::string& key,
			const location& where, const std::string& detail) {
			std::string msg = where.str();
			msg += ": ";
			msg += to_string(code);
			if (!key.empty()) {
				msg += " `" + key + "`";
			}
			if (!detail.empty()) {
				msg += ": " + detail;
			}
			return msg;
		}

		config_errc code_;
		std::string key_;
		location where_;
	};

} // namespace strictenc::config
