// tests/test_byteorder.cpp
#include "tests.hpp"
#include <array>
#include <random>
#include <limits>
#include <type_traits>

#include "strictenc/core/byteorder.hpp"

using strictenc::core::byte;
using namespace strictenc::core::byteorder;

TEST_SUITE("byteorder (little endian)") {

    template <typename T>
    void check_roundtrip_le(T value) {
        std::array<byte, sizeof(T)> buf{};
        native_to_le<T>(value, buf.data());
        T back = le_to_native<T>(buf.data());
        CHECK(back == value);
    }

    TEST_CASE("fixed patterns unsigned") {
        SUBCASE("uint8") {
            check_roundtrip_le<std::uint8_t>(0xA5u);
        }
        SUBCASE("uint16") {
            check_roundtrip_le<std::uint16_t>(0x1122u);
        }
        SUBCASE("uint32") {
            check_roundtrip_le<std::uint32_t>(0x11223344u);
        }
        SUBCASE("uint64") {
            check_roundtrip_le<std::uint64_t>(0x1122334455667788ull);
        }
    }

    TEST_CASE("fixed patterns signed") {
        SUBCASE("int8") {
            check_roundtrip_le<std::int8_t>(-100);
        }
        SUBCASE("int16") {
            check_roundtrip_le<std::int16_t>(-12345);
            check_roundtrip_le<std::int16_t>(+12345);
        }
        SUBCASE("int32") {
            check_roundtrip_le<std::int32_t>(-0x1020304);
            check_roundtrip_le<std::int32_t>(+0x1020304);
        }
        SUBCASE("int64") {
            check_roundtrip_le<std::int64_t>(-0x123456789ABCDELL);
            check_roundtrip_le<std::int64_t>(+0x123456789ABCDELL);
        }
    }

    TEST_CASE("least significant byte first") {
        std::array<byte, 4> buf{};
        native_to_le<std::uint32_t>(0x11223344u, buf.data());
        CHECK(buf[0] == byte{ 0x44 });
        CHECK(buf[1] == byte{ 0x33 });
        CHECK(buf[2] == byte{ 0x22 });
        CHECK(buf[3] == byte{ 0x11 });

        native_to_le<std::int16_t>(-2, buf.data());
        CHECK(buf[0] == byte{ 0xFE });
        CHECK(buf[1] == byte{ 0xFF });
    }

    TEST_CASE("runtime width") {
        std::array<byte, 8> buf{};

        SUBCASE("2 bytes") {
            native_to_le_width(0xBEEF, buf.data(), 2);
            CHECK(buf[0] == byte{ 0xEF });
            CHECK(buf[1] == byte{ 0xBE });
            CHECK(le_to_native_width(buf.data(), 2) == 0xBEEF);
        }
        SUBCASE("value wider than width keeps low bytes") {
            native_to_le_width(0x1234, buf.data(), 1);
            CHECK(buf[0] == byte{ 0x34 });
            CHECK(buf[1] == byte{ 0x00 });
            CHECK(le_to_native_width(buf.data(), 1) == 0x34);
        }
        SUBCASE("8 bytes") {
            native_to_le_width(0x0102030405060708ull, buf.data(), 8);
            CHECK(buf[0] == byte{ 0x08 });
            CHECK(buf[7] == byte{ 0x01 });
            CHECK(le_to_native_width(buf.data(), 8) == 0x0102030405060708ull);
        }
    }

    TEST_CASE("fuzz roundtrip all integer types") {
        std::mt19937_64 rng{ 987654321ULL };

        auto fuzz = [&](auto tag) {
            using T = decltype(tag);
            std::array<byte, sizeof(T)> buf{};

            if constexpr (std::is_signed_v<T>) {
                std::uniform_int_distribution<long long> dist(
                    (long long)std::numeric_limits<T>::lowest(),
                    (long long)std::numeric_limits<T>::max());

                for (int i = 0; i < 3000; ++i) {
                    T val = static_cast<T>(dist(rng));
                    native_to_le<T>(val, buf.data());
                    CHECK(le_to_native<T>(buf.data()) == val);
                }
            }
            else {
                std::uniform_int_distribution<unsigned long long> dist(
                    0ULL, static_cast<unsigned long long>(std::numeric_limits<T>::max()));

                for (int i = 0; i < 3000; ++i) {
                    T val = static_cast<T>(dist(rng));
                    native_to_le<T>(val, buf.data());
                    CHECK(le_to_native<T>(buf.data()) == val);
                }
            }
            };

        SUBCASE("unsigned") {
            fuzz(std::uint16_t{});
            fuzz(std::uint32_t{});
            fuzz(std::uint64_t{});
        }
        SUBCASE("signed") {
            fuzz(std::int16_t{});
            fuzz(std::int32_t{});
            fuzz(std::int64_t{});
        }
    }
}
