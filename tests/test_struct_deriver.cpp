// tests/test_struct_deriver.cpp
#include "tests.hpp"

#include "strictenc/model/builder.hpp"
#include "strictenc/model/catalog.hpp"
#include "strictenc/plan/derive.hpp"

using namespace strictenc;
using namespace strictenc::config;
using model::primitive;
using model::struct_builder;
using model::enum_builder;
using model::type_ref;

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

}

TEST_SUITE("plan: struct deriver") {

    TEST_CASE("fields follow declaration order") {
        auto spec = struct_builder("Point")
            .field("x", primitive::u32)
            .field("y", primitive::u32)
            .field("z", primitive::i16)
            .build();
        // stored order must not matter
        std::swap(spec.fields[0], spec.fields[2]);

        const auto p = plan::derive_struct(spec, model::empty_catalog{});
        CHECK(p.type_name == "Point");
        CHECK(p.codec_namespace == "strict_encoding");
        REQUIRE(p.fields.size() == 3);
        CHECK(p.fields[0].name == "x");
        CHECK(p.fields[1].name == "y");
        CHECK(p.fields[2].name == "z");
        CHECK(p.fields[2].type == type_ref(primitive::i16));
        CHECK(p.wire_field_count() == 3);
    }

    TEST_CASE("skip and crate") {
        const auto spec = struct_builder("Point", { ident("crate", "my::codec") })
            .field("x", primitive::u32)
            .field("y", primitive::u32, { flag("skip") })
            .build();
        const auto p = plan::derive_struct(spec, model::empty_catalog{});
        CHECK(p.codec_namespace == "my::codec");
        REQUIRE(p.fields.size() == 2);
        CHECK_FALSE(p.fields[0].skip);
        CHECK(p.fields[1].skip);
        CHECK(p.fields[0].codec_namespace == "my::codec");
        CHECK(p.wire_field_count() == 1);
    }

    TEST_CASE("tuple struct fields are named by position") {
        const auto spec = struct_builder("Pair")
            .field(primitive::u8)
            .field(primitive::string)
            .build();
        const auto p = plan::derive_struct(spec, model::empty_catalog{});
        REQUIRE(p.fields.size() == 2);
        CHECK(p.fields[0].name == "0");
        CHECK(p.fields[1].name == "1");
    }

    TEST_CASE("empty struct") {
        const auto p = plan::derive_struct(struct_builder("Unit").build(), model::empty_catalog{});
        CHECK(p.fields.empty());
        CHECK(p.wire_field_count() == 0);
    }

    TEST_CASE("named field types come from the catalog") {
        model::catalog cat;
        cat.add(struct_builder("Inner").field("v", primitive::u8).build());
        cat.add(struct_builder("Defaulted").field("v", primitive::u8).with_default().build());

        SUBCASE("known type") {
            const auto spec = struct_builder("Outer").field("inner", type_ref::named("Inner")).build();
            const auto p = plan::derive_struct(spec, cat);
            CHECK(p.fields[0].type.name() == "Inner");
        }
        SUBCASE("unknown type") {
            const auto spec = struct_builder("Outer").field("inner", type_ref::named("Missing")).build();
            CHECK(error_of([&] { (void)plan::derive_struct(spec, cat); }) == config_errc::unknown_type);
        }
        SUBCASE("skip needs a default") {
            const auto spec = struct_builder("Outer")
                .field("inner", type_ref::named("Inner"), { flag("skip") })
                .build();
            CHECK(error_of([&] { (void)plan::derive_struct(spec, cat); }) == config_errc::missing_default);

            const auto ok = struct_builder("Outer")
                .field("inner", type_ref::named("Defaulted"), { flag("skip") })
                .build();
            CHECK(plan::derive_struct(ok, cat).fields[0].skip);
        }
    }

    TEST_CASE("attribute errors") {
        SUBCASE("skip on the type") {
            const auto spec = struct_builder("Point", { flag("skip") }).field("x", primitive::u8).build();
            CHECK(error_of([&] { (void)plan::derive_struct(spec, model::empty_catalog{}); })
                == config_errc::prohibited_key_present);
        }
        SUBCASE("repr on a struct") {
            const auto spec = struct_builder("Point", { ident("repr", "u16") }).build();
            CHECK(error_of([&] { (void)plan::derive_struct(spec, model::empty_catalog{}); })
                == config_errc::prohibited_key_present);
        }
        SUBCASE("crate on a field") {
            const auto spec = struct_builder("Point").field("x", primitive::u8, { ident("crate", "x") }).build();
            try {
                (void)plan::derive_struct(spec, model::empty_catalog{});
                FAIL("expected prohibited key");
            }
            catch (const config_error& e) {
                CHECK(e.code() == config_errc::prohibited_key_present);
                CHECK(e.where().member == ".x");
                CHECK(e.where().scope == scope::local);
            }
        }
    }

    TEST_CASE("derive dispatches on kind") {
        const auto s = plan::derive(struct_builder("Point").field("x", primitive::u8).build(), model::empty_catalog{});
        CHECK(std::holds_alternative<plan::struct_plan>(s));
        CHECK(plan::type_name_of(s) == "Point");

        const auto e = plan::derive(enum_builder("Flag").variant("Off").variant("On").build(), model::empty_catalog{});
        CHECK(std::holds_alternative<plan::enum_plan>(e));

        model::type_spec u;
        u.name = "Raw";
        u.kind = model::type_kind::union_type;
        CHECK(error_of([&] { (void)plan::derive(u, model::empty_catalog{}); }) == config_errc::unsupported_type_kind);
        CHECK(error_of([&] {
            (void)plan::derive_struct(enum_builder("Flag").variant("Off").build(), model::empty_catalog{});
            }) == config_errc::unsupported_type_kind);
    }
}
