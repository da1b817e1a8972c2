/*
 * File: plan/validate.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-07
 * License: MIT
 */

#pragma once

#include <map>
#include <string>

#include "strictenc/config/errors.hpp"
#include "strictenc/plan/codec_plan.hpp"

namespace strictenc::plan {

	// Every dispatchable arm must own a distinct discriminant, otherwise decode
	// could never reach the later arm.
	inline void validate(const enum_plan& plan) {
		std::map<std::uint64_t, const variant_arm*> seen;
		for (const auto& arm : plan.arms) {
			auto [itr, inserted] = seen.emplace(arm.discriminant, &arm);
			if (!inserted) {
				throw config::config_error(config::config_errc::duplicate_discriminant, "",
					config::location{ plan.type_name, arm.name, config::scope::local },
					"discriminant " + std::to_string(arm.discriminant) + " is already used by `" +
					itr->second->name + "`");
			}
		}
	}

	inline void validate(const struct_plan&) {}

	inline void validate(const codec_plan& plan) {
		std::visit([](const auto& p) { validate(p); }, plan);
	}

} // namespace strictenc::plan
