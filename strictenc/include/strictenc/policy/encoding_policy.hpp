/*
 * File: policy/encoding_policy.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-04
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace strictenc::policy {

	// Fixed-width unsigned integer kind of an enum discriminant; the value is the width in bytes.
	enum class repr_kind : std::uint8_t {
		u8 = 1,
		u16 = 2,
		u32 = 4,
		u64 = 8,
	};

	constexpr std::size_t width_of(repr_kind r) noexcept {
		return static_cast<std::size_t>(r);
	}

	constexpr std::uint64_t max_value(repr_kind r) noexcept {
		return r == repr_kind::u64
			? std::numeric_limits<std::uint64_t>::max()
			: (std::uint64_t{ 1 } << (width_of(r) * 8)) - 1;
	}

	inline std::string_view to_string(repr_kind r) noexcept {
		switch (r) {
		case repr_kind::u8: return "u8";
		case repr_kind::u16: return "u16";
		case repr_kind::u32: return "u32";
		case repr_kind::u64: return "u64";
		}
		return "unknown";
	}

	inline std::optional<repr_kind> parse_repr(std::string_view name) noexcept {
		if (name == "u8") return repr_kind::u8;
		if (name == "u16") return repr_kind::u16;
		if (name == "u32") return repr_kind::u32;
		if (name == "u64") return repr_kind::u64;
		return std::nullopt;
	}

	struct by_declaration_order {
		bool operator == (const by_declaration_order&) const = default;
	};

	struct explicit_value {
		std::uint64_t value = 0;
		bool operator == (const explicit_value&) const = default;
	};

	struct by_native_ordinal {
		bool operator == (const by_native_ordinal&) const = default;
	};

	using discriminant_mode = std::variant<by_declaration_order, explicit_value, by_native_ordinal>;

	inline std::string_view to_string(const discriminant_mode& mode) noexcept {
		switch (mode.index()) {
		case 0: return "declaration order";
		case 1: return "explicit value";
		default: return "native ordinal";
		}
	}

	// Resolved encoding decisions for one scope. Derived value, never mutated.
	struct encoding_policy {
		std::string codec_namespace;
		bool skip = false;
		repr_kind discriminant_repr = repr_kind::u8;
		discriminant_mode mode = by_declaration_order{};

		bool operator == (const encoding_policy&) const = default;
	};

} // namespace strictenc::policy
