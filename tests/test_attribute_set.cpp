// tests/test_attribute_set.cpp
#include "tests.hpp"

#include "strictenc/config/attribute_set.hpp"

using namespace strictenc::config;

namespace {

    const location type_loc{ "Shape", {}, scope::global };

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

TEST_SUITE("config: attribute_set") {

    TEST_CASE("from: keys are unique") {
        auto set = attribute_set::from({ flag("skip"), integer("value", 7) }, type_loc);
        CHECK(set.size() == 2);
        CHECK(set.contains("skip"));
        REQUIRE(set.find("value") != nullptr);
        CHECK(std::get<std::uint64_t>(*set.find("value")) == 7);
        CHECK(set.find("repr") == nullptr);

        CHECK(error_of([] {
            (void)attribute_set::from({ flag("skip"), flag("skip") }, type_loc);
            }) == config_errc::duplicate_key);
    }

    TEST_CASE("with/without return new sets") {
        const auto base = attribute_set::from({ ident("crate", "a::b") }, type_loc);
        const auto more = base.with("repr", identifier{ "u16" });
        CHECK(base.size() == 1);
        CHECK(more.size() == 2);
        const auto less = more.without({ "crate", "missing" });
        CHECK(less.size() == 1);
        CHECK(less.contains("repr"));
        CHECK(more.contains("crate"));
    }

    TEST_CASE("merge: inner shadows outer") {
        const auto outer = attribute_set::from({ ident("crate", "outer"), flag("by_value") }, type_loc);
        const auto inner = attribute_set::from({ ident("crate", "inner") }, type_loc);
        const auto merged = merge(outer, inner);
        CHECK(merged.size() == 2);
        CHECK(std::get<identifier>(*merged.find("crate")).path == "inner");
        CHECK(merged.contains("by_value"));
    }

    TEST_CASE("check: enum type table") {
        const auto& table = local_requirements(context::enum_type);

        SUBCASE("defaults are filled in") {
            const auto checked = check({}, table, type_loc);
            CHECK(std::get<identifier>(*checked.find("crate")).path == default_codec_namespace);
            CHECK(std::get<identifier>(*checked.find("repr")).path == default_repr);
            CHECK_FALSE(checked.contains("by_value"));
        }
        SUBCASE("explicit values are kept") {
            const auto raw = attribute_set::from({ ident("repr", "u32"), flag("by_order") }, type_loc);
            const auto checked = check(raw, table, type_loc);
            CHECK(std::get<identifier>(*checked.find("repr")).path == "u32");
            CHECK(checked.contains("by_order"));
        }
        SUBCASE("unrecognized key") {
            const auto raw = attribute_set::from({ flag("compact") }, type_loc);
            CHECK(error_of([&] { (void)check(raw, table, type_loc); }) == config_errc::unrecognized_key);
        }
        SUBCASE("skip is not allowed on the type") {
            const auto raw = attribute_set::from({ flag("skip") }, type_loc);
            CHECK(error_of([&] { (void)check(raw, table, type_loc); }) == config_errc::prohibited_key_present);
        }
        SUBCASE("value is not allowed on the type") {
            const auto raw = attribute_set::from({ integer("value", 1) }, type_loc);
            CHECK(error_of([&] { (void)check(raw, table, type_loc); }) == config_errc::prohibited_key_present);
        }
        SUBCASE("flag given a value") {
            const auto raw = attribute_set::from({ integer("by_value", 1) }, type_loc);
            CHECK(error_of([&] { (void)check(raw, table, type_loc); }) == config_errc::wrong_value_class);
        }
        SUBCASE("repr given an integer") {
            const auto raw = attribute_set::from({ integer("repr", 8) }, type_loc);
            CHECK(error_of([&] { (void)check(raw, table, type_loc); }) == config_errc::wrong_value_class);
        }
    }

    TEST_CASE("check: variant table") {
        const auto& table = local_requirements(context::enum_variant);
        const auto where = type_loc.nested("Circle", false);

        const auto ok = attribute_set::from({ integer("value", 200) }, where);
        CHECK(check(ok, table, where).size() == 1);

        const auto ident_value = attribute_set::from({ ident("value", "abc") }, where);
        CHECK(error_of([&] { (void)check(ident_value, table, where); }) == config_errc::wrong_value_class);

        const auto with_crate = attribute_set::from({ ident("crate", "x") }, where);
        CHECK(error_of([&] { (void)check(with_crate, table, where); }) == config_errc::prohibited_key_present);
    }

    TEST_CASE("check_exclusive") {
        const auto both = attribute_set::from({ flag("by_value"), flag("by_order") }, type_loc);
        try {
            check_exclusive(both, type_loc);
            FAIL("expected mutually exclusive keys");
        }
        catch (const config_error& e) {
            CHECK(e.code() == config_errc::mutually_exclusive_keys);
            CHECK(e.key() == "by_value");
            CHECK(e.where().type_name == "Shape");
        }
        CHECK_NOTHROW(check_exclusive(attribute_set::from({ flag("by_order") }, type_loc), type_loc));
    }

    TEST_CASE("location: readable paths") {
        CHECK(type_loc.str() == "Shape (global)");
        const auto variant = type_loc.nested("Circle", false);
        CHECK(variant.str() == "Shape::Circle (local)");
        CHECK(variant.nested("radius", true).str() == "Shape::Circle.radius (local)");
        const location point{ "Point", {}, scope::global };
        CHECK(point.nested("x", true).str() == "Point.x (local)");
    }
}
