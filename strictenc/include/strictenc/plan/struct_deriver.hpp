/*
 * File: plan/struct_deriver.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-06
 * License: MIT
 */

#pragma once

#include "strictenc/core/log.hpp"
#include "strictenc/plan/fields.hpp"

namespace strictenc::plan {

	// Struct procedure: fields in declaration order, skipped ones absent from
	// the wire and default-filled on decode. A struct without fields is empty on the wire.
	template <model::concepts::TypeCatalog CatalogT>
	struct_plan derive_struct(const model::type_spec& spec, const CatalogT& catalog) {
		const auto where = detail::type_location(spec);
		if (spec.kind != model::type_kind::structure) {
			throw config::config_error(config::config_errc::unsupported_type_kind, "", where,
				"expected a struct, got " + std::string(model::to_string(spec.kind)));
		}

		const auto type_res = detail::resolve_type(spec, config::context::struct_type);

		struct_plan result;
		result.type_name = spec.name;
		result.codec_namespace = type_res.policy.codec_namespace;
		result.fields = detail::derive_fields(spec.fields, type_res.effective,
			config::context::struct_field, type_res.policy, where, catalog);

		STRICTENC_LOG_DEBUG("derive", "struct {}: {} fields, {} on the wire",
			spec.name, result.fields.size(), result.wire_field_count());
		return result;
	}

} // namespace strictenc::plan
