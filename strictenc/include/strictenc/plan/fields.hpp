/*
 * File: plan/fields.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-06
 * License: MIT
 */

#pragma once

#include <vector>

#include "strictenc/config/errors.hpp"
#include "strictenc/model/catalog.hpp"
#include "strictenc/plan/codec_plan.hpp"
#include "strictenc/policy/resolver.hpp"

namespace strictenc::plan::detail {

	template <model::concepts::TypeCatalog CatalogT>
	bool is_default_capable(const model::type_ref& type, const CatalogT& catalog) {
		if (type.is_primitive()) {
			return true;
		}
		const model::type_spec* spec = catalog.find(type.name());
		return spec != nullptr && spec->default_capable;
	}

	inline config::location type_location(const model::type_spec& spec) {
		return { spec.name, {}, config::scope::global };
	}

	inline policy::resolution resolve_type(const model::type_spec& spec, config::context ctx) {
		return policy::resolve({ {}, spec.attributes, type_location(spec) }, ctx);
	}

	// Resolves every field against `outer` and turns it into a step. Shared by
	// struct bodies and enum variant payloads.
	template <model::concepts::TypeCatalog CatalogT>
	std::vector<field_step> derive_fields(const std::vector<model::field_spec>& fields,
		const config::attribute_set& outer, config::context ctx,
		const policy::encoding_policy& parent, const config::location& owner,
		const CatalogT& catalog) {

		std::vector<field_step> steps;
		steps.reserve(fields.size());

		for (const auto* field : model::in_declaration_order(fields)) {
			const auto where = owner.nested(field->display_name(), true);
			const auto res = policy::resolve({ outer, field->attributes, where }, ctx, &parent);

			if (!field->type.is_primitive() && catalog.find(field->type.name()) == nullptr) {
				throw config::config_error(config::config_errc::unknown_type, "", where,
					"field type `" + field->type.name() + "` is not declared");
			}
			if (res.policy.skip && !is_default_capable(field->type, catalog)) {
				throw config::config_error(config::config_errc::missing_default, std::string(config::keys::skip), where,
					"skipped field type `" + field->type.str() + "` has no default value");
			}

			steps.push_back({
				field->display_name(),
				field->declaration_index,
				field->type,
				res.policy.skip,
				res.policy.codec_namespace,
			});
		}
		return steps;
	}

} // namespace strictenc::plan::detail
