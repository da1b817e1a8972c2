/*
 * File: config/requirements.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-03
 * License: MIT
 */

#pragma once

#include <map>
#include <string>
#include <string_view>

#include "strictenc/config/attribute.hpp"

namespace strictenc::config {

	namespace keys {
		inline constexpr std::string_view codec_namespace = "crate";
		inline constexpr std::string_view repr = "repr";
		inline constexpr std::string_view skip = "skip";
		inline constexpr std::string_view by_order = "by_order";
		inline constexpr std::string_view by_value = "by_value";
		inline constexpr std::string_view value = "value";
	}

	inline constexpr std::string_view default_codec_namespace = "strict_encoding";
	inline constexpr std::string_view default_repr = "u8";

	struct requirement {
		enum class kind {
			with_default,   // must carry a value of `cls`; filled with `default_value` when absent
			optional,       // may carry a value of `cls`
			flag,           // marker key, must carry no value
			prohibited,     // known key, not allowed in this context
		};

		kind type = kind::prohibited;
		value_class cls = value_class::flag;
		arg_value default_value {};

		static requirement with_default(arg_value v) {
			const auto c = class_of(v);
			return { kind::with_default, c, std::move(v) };
		}

		static requirement optional(value_class c) {
			return { kind::optional, c, {} };
		}

		static requirement flag() {
			return { kind::flag, value_class::flag, {} };
		}

		static requirement prohibited() {
			return { kind::prohibited, value_class::flag, {} };
		}
	};

	using requirement_table = std::map<std::string, requirement, std::less<>>;

	namespace detail {
		inline requirement_table all_prohibited() {
			requirement_table table;
			for (auto k : { keys::codec_namespace, keys::repr, keys::skip,
				keys::by_order, keys::by_value, keys::value }) {
				table.emplace(std::string(k), requirement::prohibited());
			}
			return table;
		}
	}

	// Table for what may be written directly on a scope of `ctx`.
	inline requirement_table local_requirements(context ctx) {
		auto table = detail::all_prohibited();
		switch (ctx) {
		case context::struct_type:
			table[std::string(keys::codec_namespace)] =
				requirement::with_default(identifier{ std::string(default_codec_namespace) });
			break;
		case context::enum_type:
			table[std::string(keys::codec_namespace)] =
				requirement::with_default(identifier{ std::string(default_codec_namespace) });
			table[std::string(keys::repr)] =
				requirement::with_default(identifier{ std::string(default_repr) });
			table[std::string(keys::by_order)] = requirement::flag();
			table[std::string(keys::by_value)] = requirement::flag();
			break;
		case context::struct_field:
			table[std::string(keys::skip)] = requirement::flag();
			break;
		// Fields of a variant are checked like the variant itself.
		case context::enum_variant:
		case context::variant_field:
			table[std::string(keys::skip)] = requirement::flag();
			table[std::string(keys::by_order)] = requirement::flag();
			table[std::string(keys::by_value)] = requirement::flag();
			table[std::string(keys::value)] = requirement::optional(value_class::integer);
			break;
		}
		return table;
	}

	// Table for the merged set of a scope, after the outer scope was folded in
	// and the type-global-only keys were stripped.
	inline requirement_table merged_requirements(context ctx) {
		auto table = local_requirements(ctx);
		table[std::string(keys::codec_namespace)] = requirement::prohibited();
		table[std::string(keys::repr)] = requirement::prohibited();
		return table;
	}

} // namespace strictenc::config
