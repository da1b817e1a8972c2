/*
 * File: policy/resolver.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-04
 * License: MIT
 */

#pragma once

#include <string>

#include "strictenc/config/attribute_set.hpp"
#include "strictenc/core/log.hpp"
#include "strictenc/policy/encoding_policy.hpp"

namespace strictenc::policy {

	// Input of one resolution: the enclosing scope's effective set plus the
	// raw requests written on this scope.
	struct scope_attributes {
		config::attribute_set outer;
		config::attribute_list local;
		config::location where;
	};

	struct resolution {
		encoding_policy policy;
		// Merged, validated and stripped of type-global-only keys. This is the
		// outer set for the next narrower scope.
		config::attribute_set effective;
	};

	namespace detail {

		inline const config::identifier& expect_identifier(const config::arg_value& v,
			std::string_view key, const config::location& where) {
			const auto* id = std::get_if<config::identifier>(&v);
			if (id == nullptr) {
				throw config::config_error(config::config_errc::wrong_value_class, std::string(key), where,
					"expected identifier, got " + std::string(config::to_string(config::class_of(v))));
			}
			return *id;
		}

	} // namespace detail

	// Resolves one scope. `parent` is the already resolved policy of the
	// enclosing scope; members inherit its namespace and discriminant width
	// as values, since the raw `crate`/`repr` keys are consumed once at type level.
	// Throws config::config_error; nothing is returned on failure.
	inline resolution resolve(const scope_attributes& input, config::context ctx,
		const encoding_policy* parent = nullptr) {
		namespace keys = config::keys;
		const auto& where = input.where;

		const auto raw = config::attribute_set::from(input.local, where);
		const auto local = config::check(raw, config::local_requirements(ctx), where);
		config::check_exclusive(local, where);

		const auto merged = config::merge(input.outer, local);

		std::string codec_namespace = parent ? parent->codec_namespace : std::string(config::default_codec_namespace);
		if (const auto* arg = merged.find(keys::codec_namespace)) {
			codec_namespace = detail::expect_identifier(*arg, keys::codec_namespace, where).path;
		}

		repr_kind repr = parent ? parent->discriminant_repr : repr_kind::u8;
		if (const auto* arg = merged.find(keys::repr)) {
			const auto& name = detail::expect_identifier(*arg, keys::repr, where).path;
			const auto parsed = parse_repr(name);
			if (!parsed) {
				throw config::config_error(config::config_errc::invalid_repr_kind, std::string(keys::repr), where,
					"`repr` requires integer type identifier (u8, u16, u32 or u64), got `" + name + "`");
			}
			repr = *parsed;
		}

		const auto stripped = merged.without({ keys::codec_namespace, keys::repr });
		auto effective = config::check(stripped, config::merged_requirements(ctx), where);
		config::check_exclusive(effective, where);

		encoding_policy result;
		result.codec_namespace = std::move(codec_namespace);
		result.discriminant_repr = repr;
		result.skip = effective.contains(keys::skip);
		if (effective.contains(keys::by_value)) {
			result.mode = by_native_ordinal{};
		}
		if (const auto* v = effective.find(keys::value)) {
			result.mode = explicit_value{ std::get<std::uint64_t>(*v) };
		}

		STRICTENC_LOG_DEBUG("resolve", "{}: namespace={} repr={} skip={} mode={}",
			where.str(), result.codec_namespace, to_string(result.discriminant_repr),
			result.skip, to_string(result.mode));

		return { std::move(result), std::move(effective) };
	}

} // namespace strictenc::policy
