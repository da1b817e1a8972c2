/*
 * File: codec/value.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-09
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "strictenc/core/bytes.hpp"

namespace strictenc::codec {

	struct value;

	// Struct instance: one entry per declared field, skipped ones included.
	struct record {
		std::vector<value> fields;
	};

	// Enum instance: the selected variant and its payload.
	struct variant_value {
		std::string name;
		std::vector<value> fields;
	};

	// Dynamically typed value a plan is executed over.
	struct value {
		using data_type = std::variant<
			std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t,
			std::int8_t, std::int16_t, std::int32_t, std::int64_t,
			bool, std::string, core::byte_buffer,
			record, variant_value>;

		data_type data;

		value() = default;

		template <typename T>
			requires (!std::is_same_v<std::decay_t<T>, value>) && std::is_constructible_v<data_type, T&&>
		value(T&& v) : data(std::forward<T>(v)) {}

		template <typename T>
		bool is() const noexcept { return std::holds_alternative<T>(data); }

		template <typename T>
		const T* get_if() const noexcept { return std::get_if<T>(&data); }

		template <typename T>
		const T& as() const { return std::get<T>(data); }
	};

	namespace detail {
		inline bool fields_equal(const std::vector<value>& lhs, const std::vector<value>& rhs);
	}

	inline bool operator == (const record& lhs, const record& rhs) {
		return detail::fields_equal(lhs.fields, rhs.fields);
	}

	inline bool operator == (const variant_value& lhs, const variant_value& rhs) {
		return lhs.name == rhs.name && detail::fields_equal(lhs.fields, rhs.fields);
	}

	inline bool operator == (const value& lhs, const value& rhs) {
		return lhs.data == rhs.data;
	}

	inline bool detail::fields_equal(const std::vector<value>& lhs, const std::vector<value>& rhs) {
		return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
			[](const value& a, const value& b) { return a.data == b.data; });
	}

	inline value make_record(std::vector<value> fields) {
		return value(record{ std::move(fields) });
	}

	inline value make_variant(std::string name, std::vector<value> fields = {}) {
		return value(variant_value{ std::move(name), std::move(fields) });
	}

	inline std::ostream& operator << (std::ostream& os, const value& v);

	namespace detail {
		inline void print_list(std::ostream& os, const std::vector<value>& items) {
			for (std::size_t i = 0; i < items.size(); ++i) {
				if (i != 0) {
					os << ", ";
				}
				os << items[i];
			}
		}
	}

	inline std::ostream& operator << (std::ostream& os, const value& v) {
		std::visit([&os](const auto& x) {
			using T = std::decay_t<decltype(x)>;
			if constexpr (std::is_same_v<T, record>) {
				os << "{";
				detail::print_list(os, x.fields);
				os << "}";
			}
			else if constexpr (std::is_same_v<T, variant_value>) {
				os << x.name;
				if (!x.fields.empty()) {
					os << "(";
					detail::print_list(os, x.fields);
					os << ")";
				}
			}
			else if constexpr (std::is_same_v<T, std::string>) {
				os << '"' << x << '"';
			}
			else if constexpr (std::is_same_v<T, core::byte_buffer>) {
				os << "0x" << core::to_hex(x);
			}
			else if constexpr (std::is_same_v<T, bool>) {
				os << (x ? "true" : "false");
			}
			else if constexpr (std::is_same_v<T, std::uint8_t> || std::is_same_v<T, std::int8_t>) {
				os << static_cast<int>(x);
			}
			else {
				os << x;
			}
		}, v.data);
		return os;
	}

} // namespace strictenc::codec
