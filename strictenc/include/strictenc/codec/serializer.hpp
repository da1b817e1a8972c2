/*
 * File: codec/serializer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-08
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "strictenc/codec/errors.hpp"
#include "strictenc/codec/stream.hpp"
#include "strictenc/core/byteorder.hpp"
#include "strictenc/policy/encoding_policy.hpp"

namespace strictenc::codec {

	namespace byteorder = core::byteorder;

	// Base-case value codecs. `encode` returns the number of bytes written,
	// `decode` consumes exactly the bytes the value occupies.
	template <typename T>
	struct serializer;

	namespace detail {
		template <std::size_t N, concepts::ByteSource SourceT>
		std::array<byte, N> read_exact(SourceT& source, std::string_view type_name) {
			std::array<byte, N> buf{};
			if (!source.read(byte_span(buf))) {
				throw codec_error::truncated(std::string(type_name), N);
			}
			return buf;
		}

		template <typename T> struct word_name;
		template <> struct word_name<std::uint8_t> { static constexpr std::string_view value = "u8"; };
		template <> struct word_name<std::uint16_t> { static constexpr std::string_view value = "u16"; };
		template <> struct word_name<std::uint32_t> { static constexpr std::string_view value = "u32"; };
		template <> struct word_name<std::uint64_t> { static constexpr std::string_view value = "u64"; };
		template <> struct word_name<std::int8_t> { static constexpr std::string_view value = "i8"; };
		template <> struct word_name<std::int16_t> { static constexpr std::string_view value = "i16"; };
		template <> struct word_name<std::int32_t> { static constexpr std::string_view value = "i32"; };
		template <> struct word_name<std::int64_t> { static constexpr std::string_view value = "i64"; };
	}

	template <byteorder::Word WordT>
	struct integer_serializer {

		using value_type = WordT;
		static constexpr std::string_view name = detail::word_name<WordT>::value;

		template <concepts::ByteSink SinkT>
		static std::size_t encode(value_type val, SinkT& sink) {
			std::array<byte, sizeof(value_type)> buf{};
			byteorder::native_to_le<value_type>(val, buf.data());
			sink.write(byte_view(buf));
			return sizeof(value_type);
		}

		template <concepts::ByteSource SourceT>
		static value_type decode(SourceT& source) {
			const auto buf = detail::read_exact<sizeof(value_type)>(source, name);
			return byteorder::le_to_native<value_type>(buf.data());
		}

		constexpr static std::size_t size(const value_type&) {
			return sizeof(value_type);
		}
	};

	template <>
	struct serializer<std::uint8_t> : public integer_serializer<std::uint8_t> {};
	template <>
	struct serializer<std::uint16_t> : public integer_serializer<std::uint16_t> {};
	template <>
	struct serializer<std::uint32_t> : public integer_serializer<std::uint32_t> {};
	template <>
	struct serializer<std::uint64_t> : public integer_serializer<std::uint64_t> {};

	template <>
	struct serializer<std::int8_t> : public integer_serializer<std::int8_t> {};
	template <>
	struct serializer<std::int16_t> : public integer_serializer<std::int16_t> {};
	template <>
	struct serializer<std::int32_t> : public integer_serializer<std::int32_t> {};
	template <>
	struct serializer<std::int64_t> : public integer_serializer<std::int64_t> {};

	// One byte, 0 or 1. Anything else is rejected on decode.
	template <>
	struct serializer<bool> {
		using value_type = bool;
		static constexpr std::string_view name = "bool";

		template <concepts::ByteSink SinkT>
		static std::size_t encode(value_type val, SinkT& sink) {
			return serializer<std::uint8_t>::encode(static_cast<std::uint8_t>(val ? 1 : 0), sink);
		}

		template <concepts::ByteSource SourceT>
		static value_type decode(SourceT& source) {
			const auto raw = serializer<std::uint8_t>::decode(source);
			if (raw > 1) {
				throw codec_error(codec_errc::invalid_value, std::string(name),
					"byte " + std::to_string(raw) + " is not a boolean", raw);
			}
			return raw == 1;
		}

		constexpr static std::size_t size(const value_type&) {
			return 1;
		}
	};

	// [len:u16][bytes...], shared by string and bytes.
	template <typename ContainerT>
	struct length_prefixed_serializer {
		using value_type = ContainerT;
		using length_type = std::uint16_t;

		template <concepts::ByteSink SinkT>
		static std::size_t encode(const value_type& val, SinkT& sink, std::string_view name) {
			if (val.size() > std::numeric_limits<length_type>::max()) {
				throw codec_error(codec_errc::length_overflow, std::string(name),
					std::to_string(val.size()) + " bytes exceed the u16 length prefix");
			}
			const auto shift = serializer<length_type>::encode(static_cast<length_type>(val.size()), sink);
			sink.write(byte_view(reinterpret_cast<const byte*>(val.data()), val.size()));
			return shift + val.size();
		}

		template <concepts::ByteSource SourceT>
		static value_type decode(SourceT& source, std::string_view name) {
			const auto len = serializer<length_type>::decode(source);
			value_type val(len, typename value_type::value_type{});
			if (!source.read(byte_span(reinterpret_cast<byte*>(val.data()), val.size()))) {
				throw codec_error::truncated(std::string(name), len);
			}
			return val;
		}

		static std::size_t size(const value_type& val) {
			return sizeof(length_type) + val.size();
		}
	};

	template <>
	struct serializer<std::string> : private length_prefixed_serializer<std::string> {
		using base = length_prefixed_serializer<std::string>;
		using value_type = std::string;
		static constexpr std::string_view name = "string";

		template <concepts::ByteSink SinkT>
		static std::size_t encode(const value_type& val, SinkT& sink) {
			return base::encode(val, sink, name);
		}

		template <concepts::ByteSource SourceT>
		static value_type decode(SourceT& source) {
			return base::decode(source, name);
		}

		using base::size;
	};

	template <>
	struct serializer<byte_buffer> : private length_prefixed_serializer<byte_buffer> {
		using base = length_prefixed_serializer<byte_buffer>;
		using value_type = byte_buffer;
		static constexpr std::string_view name = "bytes";

		template <concepts::ByteSink SinkT>
		static std::size_t encode(const value_type& val, SinkT& sink) {
			return base::encode(val, sink, name);
		}

		template <concepts::ByteSource SourceT>
		static value_type decode(SourceT& source) {
			return base::decode(source, name);
		}

		using base::size;
	};

	// Enum discriminant of a width chosen at resolution time.
	struct discriminant_serializer {

		template <concepts::ByteSink SinkT>
		static std::size_t encode(std::uint64_t val, policy::repr_kind repr, SinkT& sink) {
			std::array<byte, sizeof(std::uint64_t)> buf{};
			const auto width = policy::width_of(repr);
			byteorder::native_to_le_width(val, buf.data(), width);
			sink.write(byte_view(buf.data(), width));
			return width;
		}

		template <concepts::ByteSource SourceT>
		static std::uint64_t decode(policy::repr_kind repr, SourceT& source, std::string_view type_name) {
			std::array<byte, sizeof(std::uint64_t)> buf{};
			const auto width = policy::width_of(repr);
			if (!source.read(byte_span(buf.data(), width))) {
				throw codec_error::truncated(std::string(type_name), width);
			}
			return byteorder::le_to_native_width(buf.data(), width);
		}
	};

} // namespace strictenc::codec
