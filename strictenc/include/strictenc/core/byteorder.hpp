/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-02
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <limits>
#include <type_traits>

#include "strictenc/core/bytes.hpp"

namespace strictenc::core::byteorder {

	template <typename T>
	concept SignedWord = std::is_signed_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept UnsignedWord = std::is_unsigned_v<T> && !std::is_same_v<T, bool> &&
		((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = SignedWord<T> || UnsignedWord<T>;

	template <UnsignedWord WordT>
	constexpr inline WordT le_to_native_unsigned(const core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little || sizeof(WordT) == 1) {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				result |= static_cast<WordT>(static_cast<WordT>(mem[i]) << (i * 8));
			}
			return result;
		}
		else {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little || sizeof(WordT) == 1) {
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				mem[i] = static_cast<core::byte>((val >> (i * 8)) & 0xFF);
			}
		}
		else {
			std::memcpy(mem, &val, sizeof(WordT));
		}
	}

	template <SignedWord WordT>
	constexpr inline WordT le_to_native_signed(const core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const unsigned_type uns = le_to_native_unsigned<unsigned_type>(mem);
		return std::bit_cast<WordT>(uns);
	}

	template <SignedWord WordT>
	constexpr inline void native_to_le_signed(WordT val, core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const unsigned_type uns = std::bit_cast<unsigned_type>(val);
		native_to_le_unsigned<unsigned_type>(uns, mem);
	}

	template <Word WordT>
	constexpr inline WordT le_to_native(const core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			return le_to_native_unsigned<WordT>(mem);
		}
		else {
			return le_to_native_signed<WordT>(mem);
		}
	}

	template <Word WordT>
	constexpr inline void native_to_le(WordT val, core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			native_to_le_unsigned<WordT>(val, mem);
		}
		else {
			native_to_le_signed<WordT>(val, mem);
		}
	}

	// Width-erased helpers for discriminants, whose width is only known at run time.
	// `width` must be 1, 2, 4 or 8.
	inline std::uint64_t le_to_native_width(const core::byte* mem, std::size_t width) {
		std::uint64_t result = 0;
		for (std::size_t i = 0; i < width; ++i) {
			result |= static_cast<std::uint64_t>(mem[i]) << (i * 8);
		}
		return result;
	}

	inline void native_to_le_width(std::uint64_t val, core::byte* mem, std::size_t width) {
		for (std::size_t i = 0; i < width; ++i) {
			mem[i] = static_cast<core::byte>((val >> (i * 8)) & 0xFF);
		}
	}

} // namespace strictenc::core::byteorder
