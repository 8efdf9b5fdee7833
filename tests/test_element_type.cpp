/**
 * @file test_element_type.cpp
 * @brief Unit tests for the element type tag table.
 */

#include <catch2/catch_test_macros.hpp>
#include <biofile/element_type.hpp>

#include <string>

using namespace biofile;

TEST_CASE("resolve_type accepts every tag", "[element_type]") {
    struct Row {
        char tag;
        ElementType type;
        std::size_t width;
        ElementKind kind;
    };
    const Row table[] = {
        {'?', ElementType::Bool, 1, ElementKind::Boolean},
        {'b', ElementType::Int8, 1, ElementKind::SignedInt},
        {'B', ElementType::UInt8, 1, ElementKind::UnsignedInt},
        {'h', ElementType::Int16, 2, ElementKind::SignedInt},
        {'H', ElementType::UInt16, 2, ElementKind::UnsignedInt},
        {'i', ElementType::Int32, 4, ElementKind::SignedInt},
        {'I', ElementType::UInt32, 4, ElementKind::UnsignedInt},
        {'q', ElementType::Int64, 8, ElementKind::SignedInt},
        {'Q', ElementType::UInt64, 8, ElementKind::UnsignedInt},
        {'f', ElementType::Float32, 4, ElementKind::Float},
        {'d', ElementType::Float64, 8, ElementKind::Float},
    };

    for (const auto& row : table) {
        ElementType type = ElementType::Float32;
        REQUIRE(resolve_type(row.tag, type) == Error::Ok);
        REQUIRE(type == row.type);
        REQUIRE(element_width(type) == row.width);
        REQUIRE(element_kind(type) == row.kind);
        REQUIRE(type_tag(type) == row.tag);
    }
}

TEST_CASE("resolve_type rejects unknown tags", "[element_type]") {
    SECTION("output untouched on failure") {
        ElementType type = ElementType::Int16;
        REQUIRE(resolve_type('x', type) == Error::UnknownType);
        REQUIRE(type == ElementType::Int16);
    }

    SECTION("case matters for float tags") {
        ElementType type = ElementType::Int16;
        REQUIRE(resolve_type('F', type) == Error::UnknownType);
        REQUIRE(resolve_type('D', type) == Error::UnknownType);
    }

    SECTION("tags from other struct formats") {
        ElementType type = ElementType::Int16;
        REQUIRE(resolve_type('e', type) == Error::UnknownType); // half float
        REQUIRE(resolve_type('l', type) == Error::UnknownType);
        REQUIRE(resolve_type('s', type) == Error::UnknownType);
        REQUIRE(resolve_type('\0', type) == Error::UnknownType);
    }
}

TEST_CASE("resolve_type is usable at compile time", "[element_type]") {
    constexpr auto resolved = [] {
        ElementType type = ElementType::Bool;
        return resolve_type('d', type) == Error::Ok ? type : ElementType::Bool;
    }();
    STATIC_REQUIRE(resolved == ElementType::Float64);
    STATIC_REQUIRE(element_width(ElementType::UInt16) == 2);
}

TEST_CASE("ElementTraits maps storage types", "[element_type]") {
    STATIC_REQUIRE(element_type_of<bool> == ElementType::Bool);
    STATIC_REQUIRE(element_type_of<std::int8_t> == ElementType::Int8);
    STATIC_REQUIRE(element_type_of<std::uint8_t> == ElementType::UInt8);
    STATIC_REQUIRE(element_type_of<std::int16_t> == ElementType::Int16);
    STATIC_REQUIRE(element_type_of<std::uint16_t> == ElementType::UInt16);
    STATIC_REQUIRE(element_type_of<std::int32_t> == ElementType::Int32);
    STATIC_REQUIRE(element_type_of<std::uint32_t> == ElementType::UInt32);
    STATIC_REQUIRE(element_type_of<std::int64_t> == ElementType::Int64);
    STATIC_REQUIRE(element_type_of<std::uint64_t> == ElementType::UInt64);
    STATIC_REQUIRE(element_type_of<float> == ElementType::Float32);
    STATIC_REQUIRE(element_type_of<double> == ElementType::Float64);
}

TEST_CASE("type names", "[element_type]") {
    REQUIRE(std::string(type_name(ElementType::Float32)) == "float32");
    REQUIRE(std::string(type_name(ElementType::UInt64)) == "uint64");
    REQUIRE(std::string(type_name(ElementType::Bool)) == "bool");
    REQUIRE(ALL_ELEMENT_TYPES.size() == 11);
}
