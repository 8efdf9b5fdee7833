/**
 * @file test_signal_matrix.cpp
 * @brief Unit tests for SignalMatrix.
 */

#include <catch2/catch_test_macros.hpp>
#include <biofile/signal_matrix.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace biofile;

TEST_CASE("SignalMatrix construction", "[signal_matrix]") {
    SECTION("default is empty float32") {
        SignalMatrix m;
        REQUIRE(m.type() == ElementType::Float32);
        REQUIRE(m.rows() == 0);
        REQUIRE(m.cols() == 0);
        REQUIRE(m.empty());
    }

    SECTION("zero-initialized") {
        SignalMatrix m(ElementType::Int16, 4, 3);
        REQUIRE(m.rows() == 4);
        REQUIRE(m.cols() == 3);
        REQUIRE(m.size() == 12);
        REQUIRE(m.size_bytes() == 24);

        std::int16_t value = 99;
        REQUIRE(m.get(3, 2, value) == Error::Ok);
        REQUIRE(value == 0);
    }

    SECTION("column from values") {
        auto m = SignalMatrix::column(std::vector<double>{0.0, 0.5, 1.0});
        REQUIRE(m.type() == ElementType::Float64);
        REQUIRE(m.rows() == 3);
        REQUIRE(m.cols() == 1);

        double value = 0.0;
        REQUIRE(m.get(1, 0, value) == Error::Ok);
        REQUIRE(value == 0.5);
    }

    SECTION("row-major values") {
        SignalMatrix m;
        std::vector<std::int32_t> values = {1, 2, 3, 4, 5, 6};
        REQUIRE(SignalMatrix::from_row_major<std::int32_t>(3, 2, values, m) == Error::Ok);
        REQUIRE(m.rows() == 3);
        REQUIRE(m.cols() == 2);

        std::int32_t value = 0;
        REQUIRE(m.get(0, 1, value) == Error::Ok);
        REQUIRE(value == 2);
        REQUIRE(m.get(2, 0, value) == Error::Ok);
        REQUIRE(value == 5);
    }

    SECTION("row-major size mismatch") {
        SignalMatrix m(ElementType::UInt8, 1, 1);
        std::vector<float> values = {1.0F, 2.0F, 3.0F};
        REQUIRE(SignalMatrix::from_row_major<float>(2, 2, values, m) == Error::InvalidSignal);
        REQUIRE(m.type() == ElementType::UInt8);
    }
}

TEST_CASE("SignalMatrix checked access", "[signal_matrix]") {
    SignalMatrix m(ElementType::Float32, 2, 2);

    SECTION("set then get") {
        REQUIRE(m.set(1, 0, 3.25F) == Error::Ok);
        float value = 0.0F;
        REQUIRE(m.get(1, 0, value) == Error::Ok);
        REQUIRE(value == 3.25F);
    }

    SECTION("type mismatch") {
        REQUIRE(m.set(0, 0, 1.0) == Error::InvalidSignal);
        std::int32_t value = 0;
        REQUIRE(m.get(0, 0, value) == Error::InvalidSignal);
    }

    SECTION("out of range") {
        REQUIRE(m.set(2, 0, 1.0F) == Error::InvalidSignal);
        REQUIRE(m.set(0, 2, 1.0F) == Error::InvalidSignal);
        float value = 0.0F;
        REQUIRE(m.get(5, 5, value) == Error::InvalidSignal);
    }
}

TEST_CASE("SignalMatrix bool elements", "[signal_matrix]") {
    SignalMatrix m(ElementType::Bool, 1, 2);
    REQUIRE(m.set(0, 1, true) == Error::Ok);

    bool value = false;
    REQUIRE(m.get(0, 1, value) == Error::Ok);
    REQUIRE(value);
    REQUIRE(m.data()[1] == 1);

    // Any non-zero byte reads as true but is kept as is
    m.data()[0] = 0x02;
    REQUIRE(m.get(0, 0, value) == Error::Ok);
    REQUIRE(value);
    REQUIRE(m.data()[0] == 0x02);
}

TEST_CASE("SignalMatrix as_double", "[signal_matrix]") {
    SECTION("signed") {
        SignalMatrix m(ElementType::Int8, 1, 1);
        REQUIRE(m.set(0, 0, static_cast<std::int8_t>(-5)) == Error::Ok);
        REQUIRE(m.as_double(0, 0) == -5.0);
    }

    SECTION("unsigned 64-bit") {
        SignalMatrix m(ElementType::UInt64, 1, 1);
        REQUIRE(m.set(0, 0, static_cast<std::uint64_t>(1) << 40) == Error::Ok);
        REQUIRE(m.as_double(0, 0) == 1099511627776.0);
    }

    SECTION("bool") {
        SignalMatrix m(ElementType::Bool, 1, 1);
        REQUIRE(m.set(0, 0, true) == Error::Ok);
        REQUIRE(m.as_double(0, 0) == 1.0);
    }

    SECTION("out of range is zero") {
        SignalMatrix m(ElementType::Float64, 1, 1);
        REQUIRE(m.as_double(3, 3) == 0.0);
    }
}

TEST_CASE("SignalMatrix column_values", "[signal_matrix]") {
    SignalMatrix m;
    REQUIRE(SignalMatrix::from_row_major<std::uint16_t>(3, 2, {10, 20, 11, 21, 12, 22}, m) ==
            Error::Ok);

    std::vector<std::uint16_t> column;
    REQUIRE(m.column_values(1, column) == Error::Ok);
    REQUIRE(column == std::vector<std::uint16_t>{20, 21, 22});

    std::vector<float> wrong;
    REQUIRE(m.column_values(0, wrong) == Error::InvalidSignal);
    REQUIRE(m.column_values(2, column) == Error::InvalidSignal);
}

TEST_CASE("SignalMatrix append_rows", "[signal_matrix]") {
    SECTION("same shape") {
        SignalMatrix a;
        SignalMatrix b;
        REQUIRE(SignalMatrix::from_row_major<std::int16_t>(1, 2, {1, 2}, a) == Error::Ok);
        REQUIRE(SignalMatrix::from_row_major<std::int16_t>(2, 2, {3, 4, 5, 6}, b) == Error::Ok);

        REQUIRE(a.append_rows(b) == Error::Ok);
        REQUIRE(a.rows() == 3);

        std::int16_t value = 0;
        REQUIRE(a.get(2, 1, value) == Error::Ok);
        REQUIRE(value == 6);
    }

    SECTION("shapeless matrix adopts first block") {
        SignalMatrix a;
        auto b = SignalMatrix::column(std::vector<std::uint32_t>{7, 8});
        REQUIRE(a.append_rows(b) == Error::Ok);
        REQUIRE(a.type() == ElementType::UInt32);
        REQUIRE(a == b);
    }

    SECTION("column mismatch") {
        SignalMatrix a(ElementType::Float32, 0, 4);
        SignalMatrix b(ElementType::Float32, 1, 3);
        REQUIRE(a.append_rows(b) == Error::InvalidSignal);
        REQUIRE(a.rows() == 0);
    }

    SECTION("type mismatch") {
        SignalMatrix a(ElementType::Float32, 0, 1);
        SignalMatrix b(ElementType::Float64, 1, 1);
        REQUIRE(a.append_rows(b) == Error::InvalidSignal);
    }

    SECTION("clear_rows keeps shape") {
        SignalMatrix a(ElementType::Int32, 5, 2);
        a.clear_rows();
        REQUIRE(a.rows() == 0);
        REQUIRE(a.cols() == 2);
        REQUIRE(a.size_bytes() == 0);
    }
}

TEST_CASE("SignalMatrix equality is bit exact", "[signal_matrix]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    auto a = SignalMatrix::column(std::vector<float>{nan});
    auto b = SignalMatrix::column(std::vector<float>{nan});
    REQUIRE(a == b);

    auto zero = SignalMatrix::column(std::vector<float>{0.0F});
    auto neg_zero = SignalMatrix::column(std::vector<float>{-0.0F});
    REQUIRE(zero != neg_zero);

    SignalMatrix wide(ElementType::Float32, 1, 2);
    SignalMatrix tall(ElementType::Float32, 2, 1);
    REQUIRE(wide != tall);
}

TEST_CASE("SignalMatrix refuses shapes that cannot be addressed", "[signal_matrix]") {
    const std::size_t half = std::size_t{1} << (std::numeric_limits<std::size_t>::digits / 2 - 1);

    SECTION("fits") {
        REQUIRE(SignalMatrix::fits(ElementType::Float64, 1000, 64));
        REQUIRE(SignalMatrix::fits(ElementType::Float64, half, 0));
        REQUIRE_FALSE(SignalMatrix::fits(ElementType::Float32, half, half));
        REQUIRE_FALSE(
            SignalMatrix::fits(ElementType::UInt8, std::numeric_limits<std::size_t>::max(), 2));
    }

    SECTION("constructor gives an empty shape") {
        SignalMatrix m(ElementType::Float32, half, half);
        REQUIRE(m.rows() == 0);
        REQUIRE(m.cols() == 0);
        REQUIRE(m.size_bytes() == 0);

        float value = 0.0F;
        REQUIRE(m.set(0, 0, 1.0F) == Error::InvalidSignal);
        REQUIRE(m.get(0, 0, value) == Error::InvalidSignal);
    }

    SECTION("row-major values") {
        SignalMatrix m;
        REQUIRE(SignalMatrix::from_row_major<float>(half, half, {}, m) == Error::InvalidSignal);
        REQUIRE(m.empty());
    }
}
