/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-02
 * License: MIT
 */
#pragma once

#include <cstdint>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <concepts>

namespace strictenc::core {

	using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;
	using byte_span = std::span<byte>;

	inline std::string to_hex(byte_view data) {
		constexpr char digits[] = "0123456789abcdef";
		std::string result;
		result.reserve(data.size() * 2);
		for (auto b : data) {
			const auto v = static_cast<unsigned>(b);
			result.push_back(digits[v >> 4]);
			result.push_back(digits[v & 0x0F]);
		}
		return result;
	}

	// Accepts an optional "0x" prefix; whitespace between octets is ignored.
	inline std::optional<byte_buffer> from_hex(std::string_view text) {
		if (text.starts_with("0x") || text.starts_with("0X")) {
			text.remove_prefix(2);
		}

		const auto nibble = [](char c) -> int {
			if (c >= '0' && c <= '9') return c - '0';
			if (c >= 'a' && c <= 'f') return c - 'a' + 10;
			if (c >= 'A' && c <= 'F') return c - 'A' + 10;
			return -1;
		};

		byte_buffer result;
		int high = -1;
		for (char c : text) {
			if (c == ' ' || c == '\t' || c == ':') {
				continue;
			}
			const int v = nibble(c);
			if (v < 0) {
				return std::nullopt;
			}
			if (high < 0) {
				high = v;
			}
			else {
				result.push_back(static_cast<byte>((high << 4) | v));
				high = -1;
			}
		}
		if (high >= 0) {
			return std::nullopt;
		}
		return result;
	}

} // namespace strictenc::core
