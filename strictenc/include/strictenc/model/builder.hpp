/*
 * File: model/builder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-05
 * License: MIT
 */

#pragma once

#include <string>
#include <utility>

#include "strictenc/model/type_spec.hpp"

namespace strictenc::model {

	// Fluent construction of type specs. Declaration indices follow call order.
	class struct_builder {
	public:
		explicit struct_builder(std::string name, config::attribute_list attrs = {}) {
			spec_.name = std::move(name);
			spec_.kind = type_kind::structure;
			spec_.attributes = std::move(attrs);
		}

		struct_builder& field(std::string name, type_ref type, config::attribute_list attrs = {}) {
			const auto idx = spec_.fields.size();
			spec_.fields.push_back({ std::move(name), idx, std::move(type), std::move(attrs) });
			return *this;
		}

		// Positional (tuple-struct) field.
		struct_builder& field(type_ref type, config::attribute_list attrs = {}) {
			return field(std::string{}, std::move(type), std::move(attrs));
		}

		struct_builder& with_default() {
			spec_.default_capable = true;
			return *this;
		}

		type_spec build() const {
			return spec_;
		}

	private:
		type_spec spec_;
	};

	class enum_builder {
	public:
		explicit enum_builder(std::string name, config::attribute_list attrs = {}) {
			spec_.name = std::move(name);
			spec_.kind = type_kind::enumeration;
			spec_.attributes = std::move(attrs);
		}

		enum_builder& variant(std::string name, config::attribute_list attrs = {}) {
			const auto idx = spec_.variants.size();
			variant_spec v;
			v.name = std::move(name);
			v.declaration_index = idx;
			v.attributes = std::move(attrs);
			spec_.variants.push_back(std::move(v));
			return *this;
		}

		// Sets the intrinsic ordinal of the last added variant.
		enum_builder& ordinal(std::int64_t value) {
			spec_.variants.back().native_ordinal = value;
			return *this;
		}

		// Adds a field to the last added variant.
		enum_builder& field(std::string name, type_ref type, config::attribute_list attrs = {}) {
			auto& fields = spec_.variants.back().fields;
			const auto idx = fields.size();
			fields.push_back({ std::move(name), idx, std::move(type), std::move(attrs) });
			return *this;
		}

		enum_builder& field(type_ref type, config::attribute_list attrs = {}) {
			return field(std::string{}, std::move(type), std::move(attrs));
		}

		enum_builder& with_default(std::string variant_name) {
			spec_.default_capable = true;
			spec_.default_variant = std::move(variant_name);
			return *this;
		}

		type_spec build() const {
			return spec_;
		}

	private:
		type_spec spec_;
	};

} // namespace strictenc::model
