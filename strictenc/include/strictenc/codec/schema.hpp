/*
 * File: codec/schema.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-10
 * License: MIT
 */

#pragma once

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

#include "strictenc/codec/serializer.hpp"
#include "strictenc/codec/stream.hpp"
#include "strictenc/codec/value.hpp"
#include "strictenc/core/debug.hpp"
#include "strictenc/core/log.hpp"
#include "strictenc/model/catalog.hpp"
#include "strictenc/plan/derive.hpp"

namespace strictenc::codec {

	// A set of type specs with their derived plans. Once compiled it is
	// immutable and may be shared between threads.
	class schema {
	public:
		using plan_map = std::map<std::string, plan::codec_plan, std::less<>>;

		schema() = default;

		explicit schema(std::vector<model::type_spec> specs) {
			for (auto& s : specs) {
				add(std::move(s));
			}
			compile();
		}

		const model::type_spec& add(model::type_spec spec) {
			compiled_ = false;
			return catalog_.add(std::move(spec));
		}

		// Derives every plan and checks the declared default capabilities.
		// Throws config::config_error; the schema stays uncompiled on failure.
		void compile() {
			compiled_ = false;
			plan_map plans;
			for (const auto& [name, spec] : catalog_) {
				plans.emplace(name, plan::derive(spec, catalog_));
			}
			check_acyclic();
			for (const auto& [name, spec] : catalog_) {
				check_default_capability(spec, plans.at(name));
			}
			plans_ = std::move(plans);
			compiled_ = true;
			STRICTENC_LOG_DEBUG("derive", "schema compiled: {} types", plans_.size());
		}

		bool compiled() const noexcept { return compiled_; }
		const model::catalog& catalog() const noexcept { return catalog_; }
		const plan_map& plans() const noexcept { return plans_; }

		const plan::codec_plan& plan_for(std::string_view type_name) const {
			if (!compiled_) {
				throw std::logic_error("schema is not compiled");
			}
			auto itr = plans_.find(type_name);
			if (itr == plans_.end()) {
				throw std::invalid_argument("unknown type `" + std::string(type_name) + "`");
			}
			return itr->second;
		}

		template <concepts::ByteSink SinkT>
		std::size_t encode(std::string_view type_name, const value& v, SinkT& sink) const {
			return std::visit([&](const auto& p) { return encode_plan(p, v, sink); }, plan_for(type_name));
		}

		byte_buffer encode(std::string_view type_name, const value& v) const {
			buffer_sink sink;
			encode(type_name, v, sink);
			return sink.release();
		}

		template <concepts::ByteSource SourceT>
		value decode(std::string_view type_name, SourceT& source) const {
			return std::visit([&](const auto& p) { return decode_plan(p, source); }, plan_for(type_name));
		}

		// The whole input must belong to one value.
		value decode(std::string_view type_name, byte_view data) const {
			view_source source(data);
			auto result = decode(type_name, source);
			if (source.remaining() != 0) {
				throw codec_error(codec_errc::trailing_bytes, std::string(type_name),
					std::to_string(source.remaining()) + " bytes left after the value");
			}
			return result;
		}

		value default_value(const model::type_ref& type) const {
			if (type.is_primitive()) {
				return primitive_default(type.as_primitive());
			}
			const auto* spec = catalog_.find(type.name());
			if (spec == nullptr || !spec->default_capable) {
				throw std::invalid_argument("type `" + type.str() + "` has no default value");
			}
			const auto& p = plan_for(type.name());
			if (const auto* sp = std::get_if<plan::struct_plan>(&p)) {
				return make_record(default_fields(sp->fields));
			}
			const auto& ep = std::get<plan::enum_plan>(p);
			const auto* arm = ep.find_arm(std::string_view(spec->default_variant.value()));
			STRICTENC_ASSERT(arm != nullptr, "default variant was checked by compile()");
			return make_variant(arm->name, default_fields(arm->fields));
		}

	private:

		static value primitive_default(model::primitive p) {
			switch (p) {
			case model::primitive::u8: return std::uint8_t{ 0 };
			case model::primitive::u16: return std::uint16_t{ 0 };
			case model::primitive::u32: return std::uint32_t{ 0 };
			case model::primitive::u64: return std::uint64_t{ 0 };
			case model::primitive::i8: return std::int8_t{ 0 };
			case model::primitive::i16: return std::int16_t{ 0 };
			case model::primitive::i32: return std::int32_t{ 0 };
			case model::primitive::i64: return std::int64_t{ 0 };
			case model::primitive::boolean: return false;
			case model::primitive::string: return std::string{};
			case model::primitive::bytes: return byte_buffer{};
			}
			return {};
		}

		std::vector<value> default_fields(const std::vector<plan::field_step>& steps) const {
			std::vector<value> result;
			result.reserve(steps.size());
			for (const auto& step : steps) {
				result.push_back(default_value(step.type));
			}
			return result;
		}

		// ----- compile-time checks -----

		void check_default_capability(const model::type_spec& spec, const plan::codec_plan& p) const {
			if (!spec.default_capable) {
				return;
			}
			const config::location where{ spec.name, {}, config::scope::global };
			const auto require = [&](const std::vector<plan::field_step>& steps) {
				for (const auto& step : steps) {
					if (!plan::detail::is_default_capable(step.type, catalog_)) {
						throw config::config_error(config::config_errc::missing_default, "", where,
							"field `" + step.name + "` of type `" + step.type.str() + "` has no default value");
					}
				}
			};

			if (const auto* sp = std::get_if<plan::struct_plan>(&p)) {
				require(sp->fields);
				return;
			}
			const auto& ep = std::get<plan::enum_plan>(p);
			if (!spec.default_variant) {
				throw config::config_error(config::config_errc::missing_default, "", where,
					"default-capable enum must name its default variant");
			}
			const auto* arm = ep.find_arm(std::string_view(*spec.default_variant));
			if (arm == nullptr) {
				throw config::config_error(config::config_errc::missing_default, "", where,
					"default variant `" + *spec.default_variant + "` is not a dispatchable variant");
			}
			require(arm->fields);
		}

		// Without indirection a type that contains itself has no finite encoding.
		void check_acyclic() const {
			std::set<std::string, std::less<>> done;
			std::vector<std::string> stack;
			for (const auto& [name, spec] : catalog_) {
				visit_type(spec, done, stack);
			}
		}

		void visit_type(const model::type_spec& spec, std::set<std::string, std::less<>>& done,
			std::vector<std::string>& stack) const {
			if (done.contains(spec.name)) {
				return;
			}
			for (const auto& s : stack) {
				if (s == spec.name) {
					std::string chain;
					for (const auto& n : stack) {
						chain += n + " > ";
					}
					throw config::config_error(config::config_errc::recursive_type, "",
						config::location{ spec.name, {}, config::scope::global }, "contains itself: " + chain + spec.name);
				}
			}
			stack.push_back(spec.name);
			const auto visit_fields = [&](const std::vector<model::field_spec>& fields) {
				for (const auto& f : fields) {
					if (!f.type.is_primitive()) {
						if (const auto* nested = catalog_.find(f.type.name())) {
							visit_type(*nested, done, stack);
						}
					}
				}
			};
			visit_fields(spec.fields);
			for (const auto& v : spec.variants) {
				visit_fields(v.fields);
			}
			stack.pop_back();
			done.insert(spec.name);
		}

		// ----- encode -----

		template <typename T, concepts::ByteSink SinkT>
		static std::size_t encode_scalar(const value& v, SinkT& sink) {
			const auto* x = v.get_if<T>();
			if (x == nullptr) {
				throw codec_error(codec_errc::value_mismatch, std::string(serializer<T>::name),
					"value does not hold a " + std::string(serializer<T>::name));
			}
			return serializer<T>::encode(*x, sink);
		}

		template <concepts::ByteSink SinkT>
		std::size_t encode_ref(const model::type_ref& type, const value& v, SinkT& sink) const {
			if (!type.is_primitive()) {
				return encode(type.name(), v, sink);
			}
			switch (type.as_primitive()) {
			case model::primitive::u8: return encode_scalar<std::uint8_t>(v, sink);
			case model::primitive::u16: return encode_scalar<std::uint16_t>(v, sink);
			case model::primitive::u32: return encode_scalar<std::uint32_t>(v, sink);
			case model::primitive::u64: return encode_scalar<std::uint64_t>(v, sink);
			case model::primitive::i8: return encode_scalar<std::int8_t>(v, sink);
			case model::primitive::i16: return encode_scalar<std::int16_t>(v, sink);
			case model::primitive::i32: return encode_scalar<std::int32_t>(v, sink);
			case model::primitive::i64: return encode_scalar<std::int64_t>(v, sink);
			case model::primitive::boolean: return encode_scalar<bool>(v, sink);
			case model::primitive::string: return encode_scalar<std::string>(v, sink);
			case model::primitive::bytes: return encode_scalar<byte_buffer>(v, sink);
			}
			return 0;
		}

		template <concepts::ByteSink SinkT>
		std::size_t encode_fields(const std::vector<plan::field_step>& steps, const std::vector<value>& fields,
			SinkT& sink, const std::string& owner) const {
			std::size_t len = 0;
			for (std::size_t i = 0; i < steps.size(); ++i) {
				const auto& step = steps[i];
				if (step.skip) {
					continue;
				}
				try {
					len += encode_ref(step.type, fields[i], sink);
				}
				catch (codec_error& e) {
					e.push_context(owner + "." + step.name);
					throw;
				}
			}
			return len;
		}

		template <concepts::ByteSink SinkT>
		std::size_t encode_plan(const plan::struct_plan& p, const value& v, SinkT& sink) const {
			const auto* rec = v.get_if<record>();
			if (rec == nullptr || rec->fields.size() != p.fields.size()) {
				throw codec_error(codec_errc::value_mismatch, p.type_name,
					"expected a record of " + std::to_string(p.fields.size()) + " fields");
			}
			return encode_fields(p.fields, rec->fields, sink, p.type_name);
		}

		template <concepts::ByteSink SinkT>
		std::size_t encode_plan(const plan::enum_plan& p, const value& v, SinkT& sink) const {
			const auto* vv = v.get_if<variant_value>();
			if (vv == nullptr) {
				throw codec_error(codec_errc::value_mismatch, p.type_name, "expected a variant value");
			}
			const auto* arm = p.find_arm(std::string_view(vv->name));
			if (arm == nullptr) {
				if (p.is_excluded(vv->name)) {
					throw codec_error(codec_errc::variant_not_encodable, p.type_name,
						"variant `" + vv->name + "` is skipped");
				}
				throw codec_error(codec_errc::value_mismatch, p.type_name, "no variant `" + vv->name + "`");
			}
			if (vv->fields.size() != arm->fields.size()) {
				throw codec_error(codec_errc::value_mismatch, p.type_name,
					"variant `" + arm->name + "` expects " + std::to_string(arm->fields.size()) + " fields");
			}
			std::size_t len = discriminant_serializer::encode(arm->discriminant, p.repr, sink);
			len += encode_fields(arm->fields, vv->fields, sink, p.type_name + "::" + arm->name);
			return len;
		}

		// ----- decode -----

		template <typename T, concepts::ByteSource SourceT>
		static value decode_scalar(SourceT& source) {
			return value(serializer<T>::decode(source));
		}

		template <concepts::ByteSource SourceT>
		value decode_ref(const model::type_ref& type, SourceT& source) const {
			if (!type.is_primitive()) {
				return decode(type.name(), source);
			}
			switch (type.as_primitive()) {
			case model::primitive::u8: return decode_scalar<std::uint8_t>(source);
			case model::primitive::u16: return decode_scalar<std::uint16_t>(source);
			case model::primitive::u32: return decode_scalar<std::uint32_t>(source);
			case model::primitive::u64: return decode_scalar<std::uint64_t>(source);
			case model::primitive::i8: return decode_scalar<std::int8_t>(source);
			case model::primitive::i16: return decode_scalar<std::int16_t>(source);
			case model::primitive::i32: return decode_scalar<std::int32_t>(source);
			case model::primitive::i64: return decode_scalar<std::int64_t>(source);
			case model::primitive::boolean: return decode_scalar<bool>(source);
			case model::primitive::string: return decode_scalar<std::string>(source);
			case model::primitive::bytes: return decode_scalar<byte_buffer>(source);
			}
			return {};
		}

		template <concepts::ByteSource SourceT>
		std::vector<value> decode_fields(const std::vector<plan::field_step>& steps, SourceT& source,
			const std::string& owner) const {
			std::vector<value> fields;
			fields.reserve(steps.size());
			for (const auto& step : steps) {
				if (step.skip) {
					fields.push_back(default_value(step.type));
					continue;
				}
				try {
					fields.push_back(decode_ref(step.type, source));
				}
				catch (codec_error& e) {
					e.push_context(owner + "." + step.name);
					throw;
				}
			}
			return fields;
		}

		template <concepts::ByteSource SourceT>
		value decode_plan(const plan::struct_plan& p, SourceT& source) const {
			return make_record(decode_fields(p.fields, source, p.type_name));
		}

		template <concepts::ByteSource SourceT>
		value decode_plan(const plan::enum_plan& p, SourceT& source) const {
			const auto raw = discriminant_serializer::decode(p.repr, source, p.type_name);
			const auto* arm = p.find_arm(raw);
			if (arm == nullptr) {
				throw codec_error::unknown_variant(p.type_name, raw);
			}
			return make_variant(arm->name, decode_fields(arm->fields, source, p.type_name + "::" + arm->name));
		}

		model::catalog catalog_;
		plan_map plans_;
		bool compiled_ = false;
	};

} // namespace strictenc::codec
