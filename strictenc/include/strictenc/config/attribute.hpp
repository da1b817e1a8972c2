/*
 * File: config/attribute.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-02
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strictenc::config {

	// Type-level attributes are global, field and variant attributes are local.
	enum class scope {
		global,
		local,
	};

	// Where an attribute set is declared. Selects the requirement tables.
	enum class context {
		struct_type,
		struct_field,
		enum_type,
		enum_variant,
		variant_field,
	};

	enum class value_class {
		flag,
		identifier,
		integer,
	};

	// Identifier or path, e.g. `u16` or `my_crate::codec`.
	struct identifier {
		std::string path;
		bool operator == (const identifier&) const = default;
	};

	// std::monostate is a bare key with no value.
	using arg_value = std::variant<std::monostate, identifier, std::uint64_t>;

	// One tokenized `key` or `key = value` request, as written on a scope.
	struct attribute {
		std::string key;
		arg_value value {};
	};

	using attribute_list = std::vector<attribute>;

	inline attribute flag(std::string key) {
		return { std::move(key), std::monostate{} };
	}

	inline attribute ident(std::string key, std::string path) {
		return { std::move(key), identifier{ std::move(path) } };
	}

	inline attribute integer(std::string key, std::uint64_t value) {
		return { std::move(key), value };
	}

	inline value_class class_of(const arg_value& v) noexcept {
		switch (v.index()) {
		case 1: return value_class::identifier;
		case 2: return value_class::integer;
		default: return value_class::flag;
		}
	}

	inline std::string_view to_string(scope s) noexcept {
		return s == scope::global ? "global" : "local";
	}

	inline std::string_view to_string(context c) noexcept {
		switch (c) {
		case context::struct_type: return "struct";
		case context::struct_field: return "struct field";
		case context::enum_type: return "enum";
		case context::enum_variant: return "enum variant";
		case context::variant_field: return "variant field";
		}
		return "unknown";
	}

	inline std::string_view to_string(value_class c) noexcept {
		switch (c) {
		case value_class::flag: return "flag";
		case value_class::identifier: return "identifier";
		case value_class::integer: return "integer literal";
		}
		return "unknown";
	}

	inline std::string to_string(const arg_value& v) {
		if (const auto* id = std::get_if<identifier>(&v)) {
			return id->path;
		}
		if (const auto* n = std::get_if<std::uint64_t>(&v)) {
			return std::to_string(*n);
		}
		return {};
	}

	// Human readable position of a scope: `Shape`, `Shape::Circle`, `Shape::Circle.radius`.
	struct location {
		std::string type_name;
		std::string member;
		config::scope scope = config::scope::global;

		std::string str() const {
			std::string result = type_name;
			if (!member.empty()) {
				result += member.front() == '.' ? member : "::" + member;
			}
			result += " (";
			result += to_string(scope);
			result += ")";
			return result;
		}

		location nested(std::string_view name, bool is_field) const {
			location result { type_name, member, config::scope::local };
			if (is_field) {
				result.member += ".";
				result.member += name;
			}
			else {
				result.member += name;
			}
			return result;
		}
	};

} // namespace strictenc::config
