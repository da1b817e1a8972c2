/*
 * File: codec/stream.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-08
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstring>
#include <istream>
#include <ostream>

#include "strictenc/core/bytes.hpp"

namespace strictenc::codec {

	using core::byte;
	using core::byte_buffer;
	using core::byte_span;
	using core::byte_view;

	namespace concepts {

		// Accepts bytes. Failures are reported by throwing; encoders let them pass.
		template <typename T>
		concept ByteSink = requires(T & s, byte_view data) {
			{ s.write(data) } -> std::same_as<void>;
		};

		// Fills `out` completely or returns false.
		template <typename T>
		concept ByteSource = requires(T & s, byte_span out) {
			{ s.read(out) } -> std::convertible_to<bool>;
		};

	} // namespace concepts

	// Growing in-memory sink.
	class buffer_sink {
	public:
		void write(byte_view data) {
			const auto old_size = buffer_.size();
			buffer_.resize(old_size + data.size());
			if (!data.empty()) {
				std::memcpy(&buffer_[old_size], data.data(), data.size());
			}
		}

		std::size_t size() const { return buffer_.size(); }
		const byte* data() const { return buffer_.data(); }

		byte_view view() const {
			return byte_view(buffer_.data(), buffer_.size());
		}

		byte_buffer release() {
			return std::move(buffer_);
		}

	private:
		byte_buffer buffer_;
	};

	// Reads from a borrowed view, front to back. The viewed bytes must outlive
	// the source, so temporary buffers are rejected.
	class view_source {
	public:
		view_source() = default;
		view_source(byte_view data) : data_(data) {}
		view_source(byte_buffer&&) = delete;

		bool read(byte_span out) {
			if (out.size() > data_.size()) {
				return false;
			}
			if (!out.empty()) {
				std::memcpy(out.data(), data_.data(), out.size());
			}
			data_ = data_.subspan(out.size());
			consumed_ += out.size();
			return true;
		}

		std::size_t consumed() const noexcept { return consumed_; }
		std::size_t remaining() const noexcept { return data_.size(); }

	private:
		byte_view data_ {};
		std::size_t consumed_ = 0;
	};

	// std::ostream sink; a failed write raises std::ios_base::failure.
	class ostream_sink {
	public:
		explicit ostream_sink(std::ostream& os) : os_(&os) {}

		void write(byte_view data) {
			os_->write(reinterpret_cast<const char*>(data.data()),
				static_cast<std::streamsize>(data.size()));
			if (!*os_) {
				throw std::ios_base::failure("ostream_sink: write failed");
			}
		}

	private:
		std::ostream* os_;
	};

	class istream_source {
	public:
		explicit istream_source(std::istream& is) : is_(&is) {}

		bool read(byte_span out) {
			is_->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
			return static_cast<std::size_t>(is_->gcount()) == out.size();
		}

	private:
		std::istream* is_;
	};

} // namespace strictenc::codec
