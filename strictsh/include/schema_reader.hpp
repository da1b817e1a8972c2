/*
 * File: schema_reader.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-11
 * License: MIT
 */

#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <istream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "strictenc/config/attribute.hpp"
#include "strictenc/model/type_spec.hpp"

namespace strictsh {

	namespace model = strictenc::model;
	namespace config = strictenc::config;

	class schema_syntax_error : public std::runtime_error {
	public:
		schema_syntax_error(std::size_t line, const std::string& message)
			: std::runtime_error("line " + std::to_string(line) + ": " + message)
			, line_(line)
		{}

		std::size_t line() const noexcept { return line_; }

	private:
		std::size_t line_;
	};

	// Reads the line-oriented schema text:
	//
	//   struct Point [crate=my::codec] default
	//     field x u32
	//     field y u32 [skip]
	//   enum Shape [repr=u16 by_value] default=Empty
	//     variant Empty = 3 [value=200]
	//     variant Circle
	//       field radius u32
	//
	// Indentation is not significant: a `field` belongs to the last variant of
	// an enum, or to the struct it follows.
	class schema_reader {
	public:

		std::vector<model::type_spec> read(std::istream& is) {
			types_.clear();
			line_no_ = 0;
			std::string line;
			while (std::getline(is, line)) {
				++line_no_;
				parse_line(line);
			}
			return std::move(types_);
		}

		std::vector<model::type_spec> read(std::string_view text) {
			std::istringstream iss{ std::string(text) };
			return read(iss);
		}

		std::vector<model::type_spec> read_file(const std::string& path) {
			std::ifstream ifs(path);
			if (!ifs) {
				throw std::runtime_error("cannot open schema file `" + path + "`");
			}
			return read(ifs);
		}

	private:

		struct split_line {
			std::vector<std::string> words;
			config::attribute_list attributes;
		};

		[[noreturn]] void fail(const std::string& message) const {
			throw schema_syntax_error(line_no_, message);
		}

		static std::vector<std::string> words_of(std::string_view text) {
			std::vector<std::string> result;
			std::string current;
			for (char ch : text) {
				if (std::isspace(static_cast<unsigned char>(ch))) {
					if (!current.empty()) {
						result.push_back(current);
						current.clear();
					}
				}
				else {
					current += ch;
				}
			}
			if (!current.empty()) {
				result.push_back(current);
			}
			return result;
		}

		std::optional<std::uint64_t> parse_unsigned(std::string_view text) const {
			int base = 10;
			if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
				text.remove_prefix(2);
				base = 16;
			}
			if (text.empty()) {
				return std::nullopt;
			}
			std::uint64_t result = 0;
			const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result, base);
			if (ptr != text.data() + text.size()) {
				return std::nullopt;
			}
			if (ec == std::errc::result_out_of_range) {
				fail("integer literal `" + std::string(text) + "` does not fit in 64 bits");
			}
			return result;
		}

		config::attribute parse_attribute(const std::string& token) const {
			const auto eq = token.find('=');
			if (eq == std::string::npos) {
				return config::flag(token);
			}
			auto key = token.substr(0, eq);
			auto val = token.substr(eq + 1);
			if (key.empty() || val.empty()) {
				fail("malformed attribute `" + token + "`");
			}
			if (std::isdigit(static_cast<unsigned char>(val[0]))) {
				if (auto num = parse_unsigned(val)) {
					return config::integer(std::move(key), *num);
				}
				fail("malformed integer literal `" + val + "`");
			}
			return config::ident(std::move(key), std::move(val));
		}

		split_line split(std::string_view text) const {
			split_line result;
			const auto open = text.find('[');
			if (open == std::string_view::npos) {
				if (text.find(']') != std::string_view::npos) {
					fail("unbalanced `]`");
				}
				result.words = words_of(text);
				return result;
			}
			const auto close = text.find(']', open);
			if (close == std::string_view::npos) {
				fail("missing `]`");
			}
			if (text.find('[', open + 1) < close || text.find('[', close) != std::string_view::npos) {
				fail("only one attribute list is allowed per line");
			}
			result.words = words_of(text.substr(0, open));
			for (auto& w : words_of(text.substr(close + 1))) {
				result.words.push_back(std::move(w));
			}
			for (const auto& token : words_of(text.substr(open + 1, close - open - 1))) {
				result.attributes.push_back(parse_attribute(token));
			}
			return result;
		}

		void parse_line(std::string_view text) {
			if (const auto hash = text.find('#'); hash != std::string_view::npos) {
				text = text.substr(0, hash);
			}
			auto line = split(text);
			if (line.words.empty()) {
				if (!line.attributes.empty()) {
					fail("attribute list without a declaration");
				}
				return;
			}
			const auto& keyword = line.words[0];
			if (keyword == "struct") {
				parse_type(line, model::type_kind::structure);
			}
			else if (keyword == "enum") {
				parse_type(line, model::type_kind::enumeration);
			}
			else if (keyword == "union") {
				parse_type(line, model::type_kind::union_type);
			}
			else if (keyword == "variant") {
				parse_variant(line);
			}
			else if (keyword == "field") {
				parse_field(line);
			}
			else {
				fail("unknown declaration `" + keyword + "`");
			}
		}

		void parse_type(split_line& line, model::type_kind kind) {
			if (line.words.size() < 2) {
				fail("missing type name");
			}
			model::type_spec spec;
			spec.name = line.words[1];
			spec.kind = kind;
			spec.attributes = std::move(line.attributes);
			for (std::size_t i = 2; i < line.words.size(); ++i) {
				const auto& w = line.words[i];
				if (w == "default" && kind == model::type_kind::structure) {
					spec.default_capable = true;
				}
				else if (w.starts_with("default=") && kind != model::type_kind::structure && w.size() > 8) {
					spec.default_capable = true;
					spec.default_variant = w.substr(8);
				}
				else {
					fail("unexpected `" + w + "` after " + std::string(model::to_string(kind)) + " `" + spec.name + "`");
				}
			}
			types_.push_back(std::move(spec));
		}

		void parse_variant(split_line& line) {
			if (types_.empty() || types_.back().kind == model::type_kind::structure) {
				fail("variant outside of an enum");
			}
			if (line.words.size() < 2) {
				fail("missing variant name");
			}
			auto& spec = types_.back();
			model::variant_spec v;
			v.name = line.words[1];
			v.declaration_index = spec.variants.size();
			v.attributes = std::move(line.attributes);
			if (line.words.size() == 4 && line.words[2] == "=") {
				v.native_ordinal = parse_ordinal(line.words[3]);
			}
			else if (line.words.size() != 2) {
				fail("expected `variant <Name> [= ordinal]`");
			}
			spec.variants.push_back(std::move(v));
		}

		std::int64_t parse_ordinal(std::string_view text) const {
			const bool negative = !text.empty() && text[0] == '-';
			if (negative) {
				text.remove_prefix(1);
			}
			const auto magnitude = parse_unsigned(text);
			if (!magnitude) {
				fail("malformed ordinal `" + std::string(text) + "`");
			}
			const auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
			if (*magnitude > limit + (negative ? 1 : 0)) {
				fail("ordinal does not fit in i64");
			}
			if (negative) {
				return static_cast<std::int64_t>(~*magnitude + 1);
			}
			return static_cast<std::int64_t>(*magnitude);
		}

		static model::type_ref parse_type_ref(const std::string& name) {
			if (auto p = model::parse_primitive(name)) {
				return *p;
			}
			return model::type_ref::named(name);
		}

		void parse_field(split_line& line) {
			if (types_.empty()) {
				fail("field outside of a type");
			}
			auto& spec = types_.back();
			std::vector<model::field_spec>* fields = &spec.fields;
			if (spec.kind != model::type_kind::structure) {
				if (spec.variants.empty()) {
					fail("field before the first variant of `" + spec.name + "`");
				}
				fields = &spec.variants.back().fields;
			}

			model::field_spec f;
			f.declaration_index = fields->size();
			f.attributes = std::move(line.attributes);
			if (line.words.size() == 3) {
				f.name = line.words[1];
				f.type = parse_type_ref(line.words[2]);
			}
			else if (line.words.size() == 2) {
				f.type = parse_type_ref(line.words[1]);
			}
			else {
				fail("expected `field [name] <type>`");
			}
			fields->push_back(std::move(f));
		}

		std::vector<model::type_spec> types_;
		std::size_t line_no_ = 0;
	};

} // namespace strictsh
