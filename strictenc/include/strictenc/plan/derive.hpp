/*
 * File: plan/derive.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-07
 * License: MIT
 */

#pragma once

#include "strictenc/plan/enum_deriver.hpp"
#include "strictenc/plan/struct_deriver.hpp"

namespace strictenc::plan {

	template <model::concepts::TypeCatalog CatalogT>
	codec_plan derive(const model::type_spec& spec, const CatalogT& catalog) {
		switch (spec.kind) {
		case model::type_kind::structure:
			return derive_struct(spec, catalog);
		case model::type_kind::enumeration:
			return derive_enum(spec, catalog);
		case model::type_kind::union_type:
			break;
		}
		throw config::config_error(config::config_errc::unsupported_type_kind, "",
			detail::type_location(spec), "deriving strict encoding is not supported in unions");
	}

} // namespace strictenc::plan
