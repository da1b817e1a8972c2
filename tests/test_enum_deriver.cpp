// tests/test_enum_deriver.cpp
#include "tests.hpp"

#include <cstdint>
#include <limits>
#include <string>

#include "strictenc/model/builder.hpp"
#include "strictenc/model/catalog.hpp"
#include "strictenc/plan/enum_deriver.hpp"

using namespace strictenc;
using namespace strictenc::config;
using model::primitive;
using model::enum_builder;
using policy::repr_kind;

namespace {

    config_errc error_of(auto&& fn) {
        try {
            fn();
        }
        catch (const config_error& e) {
            return e.code();
        }
        FAIL("expected config_error");
        return config_errc::unrecognized_key;
    }

    plan::enum_plan derive(const model::type_spec& spec) {
        return plan::derive_enum(spec, model::empty_catalog{});
    }

}

TEST_SUITE("plan: enum deriver") {

    TEST_CASE("default discriminants follow declaration order") {
        const auto p = derive(enum_builder("Color").variant("Red").variant("Green").variant("Blue").build());
        CHECK(p.repr == repr_kind::u8);
        REQUIRE(p.arms.size() == 3);
        CHECK(p.arms[0].discriminant == 0);
        CHECK(p.arms[1].discriminant == 1);
        CHECK(p.arms[2].discriminant == 2);
        CHECK(p.find_arm(std::uint64_t{ 1 })->name == "Green");
        CHECK(p.find_arm(std::uint64_t{ 3 }) == nullptr);
        CHECK(p.find_arm(std::string_view("Blue"))->discriminant == 2);
    }

    TEST_CASE("explicit value overrides position") {
        const auto p = derive(enum_builder("Color")
            .variant("Red")
            .variant("Green", { integer("value", 200) })
            .variant("Blue")
            .build());
        CHECK(p.arms[1].discriminant == 200);
        CHECK(std::holds_alternative<policy::explicit_value>(p.arms[1].source));
        CHECK(p.arms[2].discriminant == 2);
    }

    TEST_CASE("by_value uses the native ordinal") {
        const auto spec = enum_builder("Level", { flag("by_value") })
            .variant("Low").ordinal(10)
            .variant("Mid")
            .variant("High").ordinal(40)
            .variant("Max")
            .build();
        const auto p = derive(spec);
        REQUIRE(p.arms.size() == 4);
        CHECK(p.arms[0].discriminant == 10);
        CHECK(p.arms[1].discriminant == 11);
        CHECK(p.arms[2].discriminant == 40);
        CHECK(p.arms[3].discriminant == 41);
        CHECK(std::holds_alternative<policy::by_native_ordinal>(p.arms[0].source));
    }

    TEST_CASE("by_value truncates the ordinal to the repr width") {
        const auto spec = enum_builder("Wide", { flag("by_value") })
            .variant("A").ordinal(0x1FF)
            .variant("B").ordinal(-2)
            .build();
        const auto p = derive(spec);
        CHECK(p.arms[0].discriminant == 0xFF);
        CHECK(p.arms[1].discriminant == 0xFE);
    }

    TEST_CASE("largest native ordinal") {
        constexpr auto max_ordinal = std::numeric_limits<std::int64_t>::max();

        const auto by_value = derive(enum_builder("Big", { ident("repr", "u64"), flag("by_value") })
            .variant("First").ordinal(1)
            .variant("Last").ordinal(max_ordinal)
            .build());
        REQUIRE(by_value.arms.size() == 2);
        CHECK(by_value.arms[1].discriminant == static_cast<std::uint64_t>(max_ordinal));

        const auto by_order = derive(enum_builder("Big")
            .variant("First").ordinal(1)
            .variant("Last").ordinal(max_ordinal)
            .build());
        CHECK(by_order.arms[1].discriminant == 1);

        SUBCASE("implicit ordinal after it overflows") {
            config_errc code{};
            std::string member;
            try {
                (void)derive(enum_builder("Big")
                    .variant("Last").ordinal(max_ordinal)
                    .variant("Next")
                    .build());
            }
            catch (const config_error& e) {
                code = e.code();
                member = e.where().member;
            }
            CHECK(code == config_errc::discriminant_out_of_range);
            CHECK(member == "Next");
        }
    }

    TEST_CASE("mode chosen per variant") {
        const auto spec = enum_builder("E")
            .variant("A").ordinal(5)
            .variant("B", { flag("by_value") }).ordinal(7)
            .variant("C", { flag("by_order") })
            .build();
        const auto p = derive(spec);
        CHECK(p.arms[0].discriminant == 0);
        CHECK(p.arms[1].discriminant == 7);
        CHECK(p.arms[2].discriminant == 2);
    }

    TEST_CASE("repr widens the discriminant") {
        const auto p = derive(enum_builder("Big", { ident("repr", "u16"), ident("crate", "my::codec") })
            .variant("A", { integer("value", 0xFFFF) })
            .build());
        CHECK(p.repr == repr_kind::u16);
        CHECK(p.codec_namespace == "my::codec");
        CHECK(p.arms[0].discriminant == 0xFFFF);
    }

    TEST_CASE("discriminant out of range") {
        CHECK(error_of([] {
            (void)derive(enum_builder("E").variant("A", { integer("value", 256) }).build());
            }) == config_errc::discriminant_out_of_range);

        auto wide = enum_builder("Wide");
        for (int i = 0; i < 257; ++i) {
            wide.variant("V" + std::to_string(i));
        }
        CHECK(error_of([&] { (void)derive(wide.build()); }) == config_errc::discriminant_out_of_range);
    }

    TEST_CASE("skipped variants leave the dispatch") {
        const auto p = derive(enum_builder("E")
            .variant("A")
            .variant("Hidden", { flag("skip") })
            .variant("C")
            .build());
        REQUIRE(p.arms.size() == 2);
        CHECK(p.arms[0].name == "A");
        CHECK(p.arms[1].name == "C");
        CHECK(p.arms[1].discriminant == 2);
        REQUIRE(p.excluded_variants.size() == 1);
        CHECK(p.is_excluded("Hidden"));
        CHECK(p.find_arm(std::uint64_t{ 1 }) == nullptr);
    }

    TEST_CASE("duplicate discriminants are rejected") {
        try {
            (void)derive(enum_builder("E")
                .variant("A")
                .variant("B", { integer("value", 0) })
                .build());
            FAIL("expected duplicate discriminant");
        }
        catch (const config_error& e) {
            CHECK(e.code() == config_errc::duplicate_discriminant);
            CHECK(e.where().member == "B");
        }
    }

    TEST_CASE("a skipped variant may share a discriminant") {
        const auto p = derive(enum_builder("E")
            .variant("A")
            .variant("B", { integer("value", 0), flag("skip") })
            .build());
        CHECK(p.arms.size() == 1);
    }

    TEST_CASE("variant payload fields") {
        model::catalog cat;
        cat.add(model::struct_builder("Point").field("x", primitive::u32).build());

        const auto spec = enum_builder("Shape", { ident("crate", "geo") })
            .variant("Empty")
            .variant("Circle")
                .field("center", model::type_ref::named("Point"))
                .field("radius", primitive::u32)
                .field("cache", primitive::u64, { flag("skip") })
            .build();
        const auto p = plan::derive_enum(spec, cat);
        REQUIRE(p.arms.size() == 2);
        CHECK(p.arms[0].fields.empty());
        const auto& circle = p.arms[1];
        REQUIRE(circle.fields.size() == 3);
        CHECK(circle.fields[0].name == "center");
        CHECK(circle.fields[0].codec_namespace == "geo");
        CHECK(circle.fields[2].skip);

        const auto bad = enum_builder("Shape")
            .variant("Circle").field("center", model::type_ref::named("Nowhere"))
            .build();
        CHECK(error_of([&] { (void)plan::derive_enum(bad, cat); }) == config_errc::unknown_type);
    }

    TEST_CASE("variant fields accept the variant keys") {
        const auto p = derive(enum_builder("E")
            .variant("A")
                .field("x", primitive::u8, { integer("value", 3) })
                .field("y", primitive::u8, { flag("by_value") })
            .build());
        REQUIRE(p.arms[0].fields.size() == 2);
        CHECK(p.arms[0].discriminant == 0);

        CHECK(error_of([] {
            (void)derive(enum_builder("E").variant("A").field("x", primitive::u8, { ident("repr", "u16") }).build());
            }) == config_errc::prohibited_key_present);
        CHECK(error_of([] {
            (void)derive(enum_builder("E").variant("A")
                .field("x", primitive::u8, { flag("by_value"), flag("by_order") }).build());
            }) == config_errc::mutually_exclusive_keys);
    }

    TEST_CASE("attribute errors") {
        CHECK(error_of([] {
            (void)derive(enum_builder("E", { flag("skip") }).variant("A").build());
            }) == config_errc::prohibited_key_present);
        CHECK(error_of([] {
            (void)derive(enum_builder("E", { flag("by_value"), flag("by_order") }).variant("A").build());
            }) == config_errc::mutually_exclusive_keys);
        CHECK(error_of([] {
            (void)derive(enum_builder("E", { ident("repr", "u12") }).variant("A").build());
            }) == config_errc::invalid_repr_kind);
        CHECK(error_of([] {
            (void)derive(enum_builder("E").variant("A", { ident("repr", "u16") }).build());
            }) == config_errc::prohibited_key_present);
    }
}
