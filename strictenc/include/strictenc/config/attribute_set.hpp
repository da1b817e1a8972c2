/*
 * File: config/attribute_set.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-03
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>

#include "strictenc/config/attribute.hpp"
#include "strictenc/config/errors.hpp"
#include "strictenc/config/requirements.hpp"

namespace strictenc::config {

	// Immutable-by-convention set of attribute requests for one scope.
	// Every operation below returns a new set.
	class attribute_set {
	public:
		using container_type = std::map<std::string, arg_value, std::less<>>;
		using const_iterator = container_type::const_iterator;

		attribute_set() = default;
		attribute_set(const attribute_set&) = default;
		attribute_set& operator = (const attribute_set&) = default;
		attribute_set(attribute_set&&) = default;
		attribute_set& operator = (attribute_set&&) = default;

		// Builds a set from tokenized requests; a key given twice is an error.
		static attribute_set from(const attribute_list& raw, const location& where) {
			attribute_set result;
			for (const auto& a : raw) {
				if (!result.args_.emplace(a.key, a.value).second) {
					throw config_error(config_errc::duplicate_key, a.key, where,
						"attribute argument can't be set twice");
				}
			}
			return result;
		}

		bool contains(std::string_view key) const {
			return args_.find(key) != args_.end();
		}

		const arg_value* find(std::string_view key) const {
			auto itr = args_.find(key);
			return itr == args_.end() ? nullptr : &itr->second;
		}

		attribute_set with(std::string key, arg_value value) const {
			attribute_set result = *this;
			result.args_.insert_or_assign(std::move(key), std::move(value));
			return result;
		}

		attribute_set without(std::initializer_list<std::string_view> keys) const {
			attribute_set result = *this;
			for (auto k : keys) {
				auto itr = result.args_.find(k);
				if (itr != result.args_.end()) {
					result.args_.erase(itr);
				}
			}
			return result;
		}

		std::size_t size() const noexcept { return args_.size(); }
		bool empty() const noexcept { return args_.empty(); }
		const_iterator begin() const { return args_.begin(); }
		const_iterator end() const { return args_.end(); }

		bool operator == (const attribute_set&) const = default;

	private:
		container_type args_;
	};

	// Validates `attrs` against `table` and returns it with the defaults of
	// `with_default` requirements filled in.
	inline attribute_set check(const attribute_set& attrs, const requirement_table& table, const location& where) {
		for (const auto& [key, val] : attrs) {
			auto itr = table.find(key);
			if (itr == table.end()) {
				throw config_error(config_errc::unrecognized_key, key, where, "");
			}
			const auto& req = itr->second;
			const auto got = class_of(val);
			switch (req.type) {
			case requirement::kind::prohibited:
				throw config_error(config_errc::prohibited_key_present, key, where,
					std::string("not allowed on ") + std::string(to_string(where.scope)) + " scope here");
			case requirement::kind::flag:
				if (got != value_class::flag) {
					throw config_error(config_errc::wrong_value_class, key, where,
						"expected a flag without value, got " + std::string(to_string(got)));
				}
				break;
			case requirement::kind::optional:
			case requirement::kind::with_default:
				if (got != req.cls) {
					throw config_error(config_errc::wrong_value_class, key, where,
						"expected " + std::string(to_string(req.cls)) + ", got " + std::string(to_string(got)));
				}
				break;
			}
		}

		attribute_set result = attrs;
		for (const auto& [key, req] : table) {
			if (req.type == requirement::kind::with_default && !result.contains(key)) {
				result = result.with(key, req.default_value);
			}
		}
		return result;
	}

	// Inner keys shadow outer keys of the same name.
	inline attribute_set merge(const attribute_set& outer, const attribute_set& inner) {
		attribute_set result = outer;
		for (const auto& [key, val] : inner) {
			result = result.with(key, val);
		}
		return result;
	}

	inline void check_exclusive(const attribute_set& attrs, const location& where) {
		if (attrs.contains(keys::by_value) && attrs.contains(keys::by_order)) {
			throw config_error(config_errc::mutually_exclusive_keys,
				std::string(keys::by_value), where,
				"`by_value` and `by_order` attributes can't be present together");
		}
	}

} // namespace strictenc::config
