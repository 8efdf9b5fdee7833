/**
 * @file test_edge_cases.cpp
 * @brief Edge-case tests: empty containers, empty blocks, unusual names.
 */

#include <catch2/catch_test_macros.hpp>
#include <biofile/biofile.hpp>

#include "test_support.hpp"

#include <chrono>
#include <sstream>
#include <string>

using namespace biofile;
using biofile_test::Bytes;

namespace {

Container roundtrip(const Container& input) {
    std::stringstream buffer;
    REQUIRE(encode(input, buffer) == Error::Ok);

    Container output;
    REQUIRE(decode(buffer, output) == Error::Ok);
    return output;
}

} // namespace

TEST_CASE("Container with no user signals", "[edge]") {
    Container c;
    c.set_timestamp(500.0F, std::vector<double>{0.0, 0.002, 0.004});
    c.set_trigger(std::vector<std::uint32_t>{1, 1, 2});

    const Container decoded = roundtrip(c);
    REQUIRE(decoded == c);
    REQUIRE(decoded.signals().empty());
}

TEST_CASE("Zero base samples with trigger", "[edge]") {
    Container c;
    c.set_timestamp(500.0F, std::vector<double>{});
    c.set_trigger(std::vector<std::uint32_t>{});
    c.add_signal("emg", 2000.0F, SignalMatrix(ElementType::Int16, 5, 2));

    const Container decoded = roundtrip(c);
    REQUIRE(decoded == c);
    REQUIRE(decoded.has_trigger());
    REQUIRE(decoded.trigger()->data.rows() == 0);
}

TEST_CASE("Signal with zero samples keeps its channel count", "[edge]") {
    Container c;
    c.set_timestamp(10.0F, std::vector<double>{0.0});
    c.add_signal("idle", 10.0F, SignalMatrix(ElementType::UInt64, 0, 6));

    const Container decoded = roundtrip(c);
    const Signal* idle = decoded.find("idle");
    REQUIRE(idle != nullptr);
    REQUIRE(idle->data.rows() == 0);
    REQUIRE(idle->data.cols() == 6);
    REQUIRE(idle->data.type() == ElementType::UInt64);
}

TEST_CASE("Signal rates are independent of the base rate", "[edge]") {
    Container c;
    c.set_timestamp(1.0F, std::vector<double>{0.0});
    c.add_signal("fast", 1e6F, SignalMatrix(ElementType::Int8, 3, 1));
    c.add_signal("slow", 0.001F, SignalMatrix(ElementType::Int8, 0, 1));

    const Container decoded = roundtrip(c);
    REQUIRE(decoded.find("fast")->sampling_rate == 1e6F);
    REQUIRE(decoded.find("slow")->sampling_rate == 0.001F);
}

TEST_CASE("Names are opaque bytes", "[edge]") {
    Container c;
    c.set_timestamp(100.0F, std::vector<double>{});

    const std::string utf8 = "\xCE\xBC" "V";
    const std::string spaced = "left arm emg";
    const std::string with_nul("a\0b", 3);
    c.add_signal(utf8, 100.0F, SignalMatrix(ElementType::Float32, 0, 1));
    c.add_signal(spaced, 100.0F, SignalMatrix(ElementType::Float32, 0, 1));
    c.add_signal(with_nul, 100.0F, SignalMatrix(ElementType::Float32, 0, 1));

    const Container decoded = roundtrip(c);
    REQUIRE(decoded == c);
    REQUIRE(decoded.find(utf8) != nullptr);
    REQUIRE(decoded.find(with_nul) != nullptr);
    REQUIRE(decoded.find(std::string("a")) == nullptr);
}

TEST_CASE("Names near the length limit", "[edge]") {
    Container c;
    c.set_timestamp(100.0F, std::vector<double>{});

    SECTION("at the limit") {
        c.add_signal(std::string(MAX_NAME_LENGTH, 'n'), 1.0F,
                     SignalMatrix(ElementType::UInt8, 0, 1));
        REQUIRE(roundtrip(c) == c);
    }

    SECTION("above the limit") {
        c.add_signal(std::string(MAX_NAME_LENGTH + 1, 'n'), 1.0F,
                     SignalMatrix(ElementType::UInt8, 0, 1));
        REQUIRE(validate(c) == Error::InvalidSignal);
    }
}

TEST_CASE("Reserved names are case sensitive", "[edge]") {
    Container c;
    c.set_timestamp(100.0F, std::vector<double>{0.0});
    c.add_signal("Trigger", 100.0F, SignalMatrix(ElementType::UInt32, 1, 1));
    c.add_signal("TIMESTAMP", 100.0F, SignalMatrix(ElementType::Float64, 1, 1));

    const Container decoded = roundtrip(c);
    REQUIRE_FALSE(decoded.has_trigger());
    REQUIRE(decoded.signals().size() == 2);
}

TEST_CASE("Signal count larger than the descriptors present", "[edge]") {
    // Claims a billion descriptors, carries one
    Bytes b;
    b.u32(1000000000U).f32(500.0F).u32(0);
    b.descriptor("emg", 500.0F, 0, 1, 'f');

    std::istringstream stream(b.str());
    Container c;
    REQUIRE(decode(stream, c) == Error::MalformedHeader);
}

TEST_CASE("Header-only inspection of a truncated file", "[edge]") {
    Container c;
    c.set_timestamp(100.0F, std::vector<double>{0.0, 0.01});
    c.add_signal("x", 100.0F, SignalMatrix(ElementType::Float64, 2, 2));

    std::stringstream full;
    REQUIRE(encode(c, full) == Error::Ok);
    const std::string bytes = full.str();

    // The header parses even though the payload is cut short
    std::istringstream cut(bytes.substr(0, bytes.size() - 10));
    ByteReader reader(cut);
    Header header;
    REQUIRE(read_header(reader, header) == Error::Ok);
    REQUIRE(header.file_size() == bytes.size());

    std::istringstream again(bytes.substr(0, bytes.size() - 10));
    REQUIRE(decode(again, c) == Error::TruncatedPayload);
}

TEST_CASE("Empty blocks with huge channel counts decode at once", "[edge]") {
    // 85 bytes declaring four 0 x 0xFFFFFFFF float64 signals
    Bytes b;
    b.u32(4).f32(500.0F).u32(0);
    for (const char* name : {"a", "b", "c", "d"}) {
        b.descriptor(name, 500.0F, 0, 0xFFFFFFFFU, 'd');
    }
    b.u8(0);
    REQUIRE(b.size() == 85);

    std::istringstream stream(b.str());
    Container c;
    auto start = std::chrono::steady_clock::now();
    REQUIRE(decode(stream, c) == Error::Ok);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < std::chrono::seconds(1));

    REQUIRE(c.signals().size() == 4);
    for (const auto& signal : c.signals()) {
        REQUIRE(signal.data.rows() == 0);
        REQUIRE(signal.data.cols() == 0xFFFFFFFFU);
        REQUIRE(signal.data.size_bytes() == 0);
    }
}
