/**
 * @file element_type.hpp
 * @brief Element type tags of the .bio format.
 *
 * Each user signal declares one element type with a single character tag.
 * The tag set is closed: resolve_type() is the only way to turn a raw tag
 * byte into an ElementType, and it rejects anything outside the table.
 *
 * | tag | type    | width |
 * |-----|---------|-------|
 * | ?   | bool    | 1     |
 * | b B | int8    | 1     |
 * | h H | int16   | 2     |
 * | i I | int32   | 4     |
 * | q Q | int64   | 8     |
 * | f   | float32 | 4     |
 * | d   | float64 | 8     |
 */

#ifndef BIOFILE_ELEMENT_TYPE_HPP
#define BIOFILE_ELEMENT_TYPE_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>

namespace biofile {

/**
 * @brief Element storage types, valued by their tag character.
 */
enum class ElementType : char {
    Bool = '?',
    Int8 = 'b',
    UInt8 = 'B',
    Int16 = 'h',
    UInt16 = 'H',
    Int32 = 'i',
    UInt32 = 'I',
    Int64 = 'q',
    UInt64 = 'Q',
    Float32 = 'f',
    Float64 = 'd'
};

/**
 * @brief Numeric interpretation of an element.
 */
enum class ElementKind { Boolean, SignedInt, UnsignedInt, Float };

/// Every element type, in tag-table order
inline constexpr std::array<ElementType, 11> ALL_ELEMENT_TYPES = {
    ElementType::Bool,   ElementType::Int8,   ElementType::UInt8,  ElementType::Int16,
    ElementType::UInt16, ElementType::Int32,  ElementType::UInt32, ElementType::Int64,
    ElementType::UInt64, ElementType::Float32, ElementType::Float64};

/**
 * @brief Resolve a raw tag byte.
 *
 * @param tag Tag character read from a header
 * @param[out] type Resolved element type (untouched on failure)
 * @return Error::Ok on success, Error::UnknownType otherwise
 */
inline constexpr Error resolve_type(char tag, ElementType& type) noexcept {
    switch (tag) {
    case '?':
        type = ElementType::Bool;
        return Error::Ok;
    case 'b':
        type = ElementType::Int8;
        return Error::Ok;
    case 'B':
        type = ElementType::UInt8;
        return Error::Ok;
    case 'h':
        type = ElementType::Int16;
        return Error::Ok;
    case 'H':
        type = ElementType::UInt16;
        return Error::Ok;
    case 'i':
        type = ElementType::Int32;
        return Error::Ok;
    case 'I':
        type = ElementType::UInt32;
        return Error::Ok;
    case 'q':
        type = ElementType::Int64;
        return Error::Ok;
    case 'Q':
        type = ElementType::UInt64;
        return Error::Ok;
    case 'f':
        type = ElementType::Float32;
        return Error::Ok;
    case 'd':
        type = ElementType::Float64;
        return Error::Ok;
    default:
        return Error::UnknownType;
    }
}

/**
 * @brief Tag character written to a header.
 */
inline constexpr char type_tag(ElementType type) noexcept {
    return static_cast<char>(type);
}

/**
 * @brief Width of one element in bytes.
 */
inline constexpr std::size_t element_width(ElementType type) noexcept {
    switch (type) {
    case ElementType::Bool:
    case ElementType::Int8:
    case ElementType::UInt8:
        return 1;
    case ElementType::Int16:
    case ElementType::UInt16:
        return 2;
    case ElementType::Int32:
    case ElementType::UInt32:
    case ElementType::Float32:
        return 4;
    case ElementType::Int64:
    case ElementType::UInt64:
    case ElementType::Float64:
        return 8;
    }
    return 0;
}

/**
 * @brief Numeric kind of an element type.
 */
inline constexpr ElementKind element_kind(ElementType type) noexcept {
    switch (type) {
    case ElementType::Bool:
        return ElementKind::Boolean;
    case ElementType::Int8:
    case ElementType::Int16:
    case ElementType::Int32:
    case ElementType::Int64:
        return ElementKind::SignedInt;
    case ElementType::UInt8:
    case ElementType::UInt16:
    case ElementType::UInt32:
    case ElementType::UInt64:
        return ElementKind::UnsignedInt;
    case ElementType::Float32:
    case ElementType::Float64:
        return ElementKind::Float;
    }
    return ElementKind::Float;
}

/**
 * @brief Short type name for diagnostics ("int16", "float32", ...).
 */
inline constexpr const char* type_name(ElementType type) noexcept {
    switch (type) {
    case ElementType::Bool:
        return "bool";
    case ElementType::Int8:
        return "int8";
    case ElementType::UInt8:
        return "uint8";
    case ElementType::Int16:
        return "int16";
    case ElementType::UInt16:
        return "uint16";
    case ElementType::Int32:
        return "int32";
    case ElementType::UInt32:
        return "uint32";
    case ElementType::Int64:
        return "int64";
    case ElementType::UInt64:
        return "uint64";
    case ElementType::Float32:
        return "float32";
    case ElementType::Float64:
        return "float64";
    }
    return "unknown";
}

/**
 * @brief Compile-time mapping from a C++ storage type to its ElementType.
 *
 * Only the eleven storage types of the format are specialized; any other
 * type fails to compile.
 */
template <typename T> struct ElementTraits;

template <> struct ElementTraits<bool> {
    static constexpr ElementType type = ElementType::Bool;
};
template <> struct ElementTraits<std::int8_t> {
    static constexpr ElementType type = ElementType::Int8;
};
template <> struct ElementTraits<std::uint8_t> {
    static constexpr ElementType type = ElementType::UInt8;
};
template <> struct ElementTraits<std::int16_t> {
    static constexpr ElementType type = ElementType::Int16;
};
template <> struct ElementTraits<std::uint16_t> {
    static constexpr ElementType type = ElementType::UInt16;
};
template <> struct ElementTraits<std::int32_t> {
    static constexpr ElementType type = ElementType::Int32;
};
template <> struct ElementTraits<std::uint32_t> {
    static constexpr ElementType type = ElementType::UInt32;
};
template <> struct ElementTraits<std::int64_t> {
    static constexpr ElementType type = ElementType::Int64;
};
template <> struct ElementTraits<std::uint64_t> {
    static constexpr ElementType type = ElementType::UInt64;
};
template <> struct ElementTraits<float> {
    static constexpr ElementType type = ElementType::Float32;
};
template <> struct ElementTraits<double> {
    static constexpr ElementType type = ElementType::Float64;
};

template <typename T> inline constexpr ElementType element_type_of = ElementTraits<T>::type;

static_assert(sizeof(bool) == 1, "bool elements are stored as one byte");
static_assert(sizeof(float) == 4, "float32 elements require a 32-bit float");
static_assert(sizeof(double) == 8, "float64 elements require a 64-bit double");

} // namespace biofile

#endif // BIOFILE_ELEMENT_TYPE_HPP
