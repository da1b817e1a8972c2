/*
 * File: plan/printer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-09
 * License: MIT
 */

#pragma once

#include <format>
#include <ostream>
#include <string>

#include "strictenc/plan/codec_plan.hpp"

namespace strictenc::plan {

	namespace detail {

		inline void print_fields(std::ostream& os, const std::vector<field_step>& fields, int indent) {
			const auto pad = std::string(indent, ' ');
			if (fields.empty()) {
				os << pad << "(no fields, zero bytes)\n";
				return;
			}
			for (const auto& f : fields) {
				os << pad << std::format("#{} {}: {}", f.declaration_index, f.name, f.type.str());
				if (f.skip) {
					os << "  skip -> default";
				}
				else {
					os << std::format("  via {}", f.codec_namespace);
				}
				os << "\n";
			}
		}

	} // namespace detail

	inline std::ostream& print(std::ostream& os, const struct_plan& plan) {
		os << std::format("struct {} [crate={}]\n", plan.type_name, plan.codec_namespace);
		detail::print_fields(os, plan.fields, 2);
		return os;
	}

	inline std::ostream& print(std::ostream& os, const enum_plan& plan) {
		const auto digits = static_cast<int>(policy::width_of(plan.repr) * 2);
		os << std::format("enum {} [crate={} repr={}]\n", plan.type_name, plan.codec_namespace,
			policy::to_string(plan.repr));
		for (const auto& arm : plan.arms) {
			os << std::format("  0x{:0{}x} {} ({})\n", arm.discriminant, digits, arm.name,
				policy::to_string(arm.source));
			detail::print_fields(os, arm.fields, 4);
		}
		for (const auto& name : plan.excluded_variants) {
			os << std::format("  ---- {} (skipped)\n", name);
		}
		return os;
	}

	inline std::ostream& print(std::ostream& os, const codec_plan& plan) {
		return std::visit([&os](const auto& p) -> std::ostream& { return print(os, p); }, plan);
	}

} // namespace strictenc::plan
