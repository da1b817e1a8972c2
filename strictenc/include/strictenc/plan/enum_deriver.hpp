/*
 * File: plan/enum_deriver.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-06
 * License: MIT
 */

#pragma once

#include <string>

#include "strictenc/core/log.hpp"
#include "strictenc/plan/fields.hpp"
#include "strictenc/plan/validate.hpp"

namespace strictenc::plan {

	namespace detail {

		inline std::uint64_t assign_discriminant(const policy::encoding_policy& p,
			const model::variant_spec& variant, std::int64_t native_ordinal,
			const config::location& where) {
			const auto repr = p.discriminant_repr;
			const auto limit = policy::max_value(repr);

			if (const auto* ev = std::get_if<policy::explicit_value>(&p.mode)) {
				if (ev->value > limit) {
					throw config::config_error(config::config_errc::discriminant_out_of_range,
						std::string(config::keys::value), where,
						std::to_string(ev->value) + " does not fit " + std::string(policy::to_string(repr)));
				}
				return ev->value;
			}
			if (std::holds_alternative<policy::by_native_ordinal>(p.mode)) {
				// Same as an `as` cast: the ordinal is truncated to the repr width.
				return static_cast<std::uint64_t>(native_ordinal) & limit;
			}
			const auto index = static_cast<std::uint64_t>(variant.declaration_index);
			if (index > limit) {
				throw config::config_error(config::config_errc::discriminant_out_of_range, "", where,
					"declaration index " + std::to_string(index) + " does not fit " +
					std::string(policy::to_string(repr)));
			}
			return index;
		}

	} // namespace detail

	// Enum procedure: `discriminant || payload`. Discriminants follow the
	// declaration order, the native ordinal (`by_value`) or an explicit `value`.
	// Skip-marked variants are left out of the dispatch. The plan is checked
	// for discriminant collisions before it is returned.
	template <model::concepts::TypeCatalog CatalogT>
	enum_plan derive_enum(const model::type_spec& spec, const CatalogT& catalog) {
		const auto where = detail::type_location(spec);
		if (spec.kind != model::type_kind::enumeration) {
			throw config::config_error(config::config_errc::unsupported_type_kind, "", where,
				"expected an enum, got " + std::string(model::to_string(spec.kind)));
		}

		const auto type_res = detail::resolve_type(spec, config::context::enum_type);

		enum_plan result;
		result.type_name = spec.name;
		result.codec_namespace = type_res.policy.codec_namespace;
		result.repr = type_res.policy.discriminant_repr;

		const auto ordered = model::in_declaration_order(spec.variants);
		const auto ordinals = model::native_ordinals(ordered, where);

		for (std::size_t i = 0; i < ordered.size(); ++i) {
			const auto& variant = *ordered[i];
			const auto variant_where = where.nested(variant.name, false);
			const auto res = policy::resolve({ type_res.effective, variant.attributes, variant_where },
				config::context::enum_variant, &type_res.policy);

			if (res.policy.skip) {
				STRICTENC_LOG_DEBUG("derive", "{}: excluded from dispatch", variant_where.str());
				result.excluded_variants.push_back(variant.name);
				continue;
			}

			variant_arm arm;
			arm.name = variant.name;
			arm.declaration_index = variant.declaration_index;
			arm.discriminant = detail::assign_discriminant(res.policy, variant, ordinals[i], variant_where);
			arm.source = res.policy.mode;
			arm.fields = detail::derive_fields(variant.fields, res.effective,
				config::context::variant_field, res.policy, variant_where, catalog);

			STRICTENC_LOG_DEBUG("derive", "{}: discriminant {} by {}",
				variant_where.str(), arm.discriminant, policy::to_string(arm.source));
			result.arms.push_back(std::move(arm));
		}

		validate(result);
		return result;
	}

} // namespace strictenc::plan
