/*
 * File: model/catalog.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-05
 * License: MIT
 */

#pragma once

#include <concepts>
#include <map>
#include <string>
#include <string_view>

#include "strictenc/config/errors.hpp"
#include "strictenc/model/type_spec.hpp"

namespace strictenc::model {

	namespace concepts {
		template <typename T>
		concept TypeCatalog = requires(const T & c, std::string_view name) {
			{ c.find(name) } -> std::convertible_to<const type_spec*>;
		};
	}

	// Named type specs a field may refer to.
	class catalog {
	public:
		using container_type = std::map<std::string, type_spec, std::less<>>;

		const type_spec& add(type_spec spec) {
			auto name = spec.name;
			auto [itr, inserted] = types_.emplace(name, std::move(spec));
			if (!inserted) {
				throw config::config_error(config::config_errc::duplicate_type, "",
					config::location{ name, {}, config::scope::global }, "type is already declared");
			}
			return itr->second;
		}

		const type_spec* find(std::string_view name) const {
			auto itr = types_.find(name);
			return itr == types_.end() ? nullptr : &itr->second;
		}

		std::size_t size() const noexcept { return types_.size(); }
		auto begin() const { return types_.begin(); }
		auto end() const { return types_.end(); }

	private:
		container_type types_;
	};

	// A catalog that knows nothing; named field types fail to resolve.
	struct empty_catalog {
		const type_spec* find(std::string_view) const noexcept { return nullptr; }
	};

} // namespace strictenc::model
