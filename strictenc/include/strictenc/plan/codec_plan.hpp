/*
 * File: plan/codec_plan.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-06
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "strictenc/model/type_spec.hpp"
#include "strictenc/policy/encoding_policy.hpp"

namespace strictenc::plan {

	// One member in encode/decode order.
	struct field_step {
		std::string name;                  // field name, or its position for tuple fields
		std::size_t declaration_index = 0;
		model::type_ref type;
		bool skip = false;                 // absent from the wire, decoded as the type's default
		std::string codec_namespace;
	};

	struct struct_plan {
		std::string type_name;
		std::string codec_namespace;
		std::vector<field_step> fields;

		std::size_t wire_field_count() const noexcept {
			std::size_t n = 0;
			for (const auto& f : fields) {
				n += f.skip ? 0 : 1;
			}
			return n;
		}
	};

	struct variant_arm {
		std::string name;
		std::size_t declaration_index = 0;
		std::uint64_t discriminant = 0;
		policy::discriminant_mode source;  // how `discriminant` was assigned
		std::vector<field_step> fields;
	};

	struct enum_plan {
		std::string type_name;
		std::string codec_namespace;
		policy::repr_kind repr = policy::repr_kind::u8;
		std::vector<variant_arm> arms;               // dispatchable variants, declaration order
		std::vector<std::string> excluded_variants;  // skip-marked, never produced or consumed

		// First arm carrying `discriminant`.
		const variant_arm* find_arm(std::uint64_t discriminant) const noexcept {
			for (const auto& arm : arms) {
				if (arm.discriminant == discriminant) {
					return &arm;
				}
			}
			return nullptr;
		}

		const variant_arm* find_arm(std::string_view name) const noexcept {
			for (const auto& arm : arms) {
				if (arm.name == name) {
					return &arm;
				}
			}
			return nullptr;
		}

		bool is_excluded(std::string_view name) const noexcept {
			for (const auto& n : excluded_variants) {
				if (n == name) {
					return true;
				}
			}
			return false;
		}
	};

	using codec_plan = std::variant<struct_plan, enum_plan>;

	inline const std::string& type_name_of(const codec_plan& p) {
		return std::visit([](const auto& v) -> const std::string& { return v.type_name; }, p);
	}

} // namespace strictenc::plan
