#include <gtest/gtest.h>
#include <wastgen/codec.hpp>

#include <bit>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <random>
#include <string>

using namespace Wastgen;

namespace {
	// Evaluate a finite float literal the way a C++ compiler would
	float ParseF32(std::string literal) {
		EXPECT_EQ(literal.back(), 'f');
		literal.pop_back();
		return std::strtof(literal.c_str(), nullptr);
	}

	double ParseF64(const std::string& literal) {
		return std::strtod(literal.c_str(), nullptr);
	}
}

TEST(Codec, Integers) {
	EXPECT_EQ(Codec::BareLiteral(Value::I32(5)), "static_cast<int32_t>(5)");
	EXPECT_EQ(Codec::BareLiteral(Value::I32(INT32_MIN)), "static_cast<int32_t>(-2147483648)");
	EXPECT_EQ(Codec::BareLiteral(Value::I64(-5)), "static_cast<int64_t>(-5LL)");
	EXPECT_EQ(Codec::BareLiteral(Value::I64(INT64_MAX)),
		"static_cast<int64_t>(9223372036854775807LL)");
	// -9223372036854775808LL is not a valid literal
	EXPECT_EQ(Codec::BareLiteral(Value::I64(INT64_MIN)), "INT64_MIN");

	EXPECT_EQ(Codec::Literal(Value::I32(-1)), "Wastgen::Value::I32(static_cast<int32_t>(-1))");
	EXPECT_EQ(Codec::Literal(Value::I64(0)), "Wastgen::Value::I64(static_cast<int64_t>(0LL))");
}

TEST(Codec, FiniteFloats) {
	EXPECT_EQ(Codec::BareLiteral(Value::F32(1.0f)), "1.0f");
	EXPECT_EQ(Codec::BareLiteral(Value::F32(0.1f)), "0.1f");
	EXPECT_EQ(Codec::BareLiteral(Value::F32(-0.0f)), "-0.0f");
	EXPECT_EQ(Codec::BareLiteral(Value::F64(0.5)), "0.5");
	EXPECT_EQ(Codec::BareLiteral(Value::F64(-2.0)), "-2.0");
	EXPECT_EQ(Codec::Literal(Value::F64(0.5)), "Wastgen::Value::F64(0.5)");
	EXPECT_EQ(Codec::Literal(Value::F32(2.5f)), "Wastgen::Value::F32(2.5f)");
}

// Test that every finite literal evaluates back to the same bits
TEST(Codec, FiniteFloatsAreExact) {
	std::mt19937 rng(1);
	auto bits32 = std::uniform_int_distribution<uint32_t> {};
	auto bits64 = std::uniform_int_distribution<uint64_t> {};

	std::vector<uint32_t> f32_cases = {
		0x00000000,
		0x80000000,
		0x00000001, // Smallest subnormal
		0x007FFFFF, // Largest subnormal
		0x00800000,
		0x7F7FFFFF, // Largest finite
		0x3EAAAAAB,
	};
	std::vector<uint64_t> f64_cases = {
		0x0000000000000000,
		0x8000000000000000,
		0x0000000000000001,
		0x000FFFFFFFFFFFFF,
		0x7FEFFFFFFFFFFFFF,
		0x3FD5555555555555,
	};
	for(int i = 0; i < 1000; i++) {
		f32_cases.push_back(bits32(rng));
		f64_cases.push_back(bits64(rng));
	}

	for(uint32_t bits : f32_cases) {
		if(Nan::IsNanBits(bits) || Nan::IsInfinityBits(bits)) {
			continue;
		}
		float parsed = ParseF32(Codec::BareLiteral(Value::F32Bits(bits)));
		EXPECT_EQ(std::bit_cast<uint32_t>(parsed), bits);
	}

	for(uint64_t bits : f64_cases) {
		if(Nan::IsNanBits(bits) || Nan::IsInfinityBits(bits)) {
			continue;
		}
		double parsed = ParseF64(Codec::BareLiteral(Value::F64Bits(bits)));
		EXPECT_EQ(std::bit_cast<uint64_t>(parsed), bits);
	}
}

TEST(Codec, Infinities) {
	EXPECT_EQ(Codec::BareLiteral(Value::F32(std::numeric_limits<float>::infinity())),
		"std::numeric_limits<float>::infinity()");
	EXPECT_EQ(Codec::BareLiteral(Value::F32(-std::numeric_limits<float>::infinity())),
		"-std::numeric_limits<float>::infinity()");
	EXPECT_EQ(Codec::BareLiteral(Value::F64(-std::numeric_limits<double>::infinity())),
		"-std::numeric_limits<double>::infinity()");
	EXPECT_EQ(Codec::Literal(Value::F64(std::numeric_limits<double>::infinity())),
		"Wastgen::Value::F64(std::numeric_limits<double>::infinity())");
}

// NaNs are emitted as raw bits so non-canonical payloads and signaling NaNs survive
TEST(Codec, NanBits) {
	EXPECT_EQ(Codec::BareLiteral(Value::F32Bits(0x7FA00000)),
		"std::bit_cast<float>(UINT32_C(0x7fa00000))");
	EXPECT_EQ(Codec::Literal(Value::F32Bits(0x7FA00000)),
		"Wastgen::Value::F32Bits(UINT32_C(0x7fa00000))");
	EXPECT_EQ(Codec::Literal(Value::F32Bits(0xFFC00000)),
		"Wastgen::Value::F32Bits(UINT32_C(0xffc00000))");
	EXPECT_EQ(Codec::BareLiteral(Value::F64Bits(0x7FF8000000000000)),
		"std::bit_cast<double>(UINT64_C(0x7ff8000000000000))");
	EXPECT_EQ(Codec::Literal(Value::F64Bits(0xFFF0000000000001)),
		"Wastgen::Value::F64Bits(UINT64_C(0xfff0000000000001))");
}

TEST(Codec, Classification) {
	EXPECT_TRUE(Codec::IsNan(Value::F32Bits(0x7F800001)));
	EXPECT_FALSE(Codec::IsNan(Value::F32Bits(0x7F800000)));
	EXPECT_FALSE(Codec::IsNan(Value::I32(-1)));

	EXPECT_EQ(Codec::TypeTag(Value::I64(1)), "i64");
	EXPECT_EQ(Codec::TypeTag(Value::F32(1.0f)), "f32");
	EXPECT_EQ(Codec::TypeEnumerator(Value::F64(1.0)), "Wastgen::ValueType::F64");
}

TEST(Codec, Literals) {
	EXPECT_EQ(Codec::Literals({}), "");
	EXPECT_EQ(Codec::Literals({ Value::I32(1), Value::F64(2.0) }),
		"Wastgen::Value::I32(static_cast<int32_t>(1)), Wastgen::Value::F64(2.0)");
}

TEST(Codec, EscapeString) {
	EXPECT_EQ(Codec::EscapeString("add", ""), "\"add\"");
	EXPECT_EQ(Codec::EscapeString("", "\t"), "\t\"\"");
	EXPECT_EQ(Codec::EscapeString("a\"b\\c", ""), "\"a\\\"b\\\\c\"");
	EXPECT_EQ(Codec::EscapeString("(module\n  (func))\n", "\t"),
		"\t\"(module\\n\"\n\t\"  (func))\\n\"");
	EXPECT_EQ(Codec::EscapeString("a\tb\x01", ""), "\"a\\tb\\001\"");
	// Bytes outside printable ASCII never reach the source file raw
	EXPECT_EQ(Codec::EscapeString("caf\xC3\xA9\x7F", ""), "\"caf\\303\\251\\177\"");
}

TEST(Codec, StringView) {
	using namespace std::string_literals;
	EXPECT_EQ(Codec::StringView("add", "\t"), "std::string_view(\"add\", 3)");
	EXPECT_EQ(Codec::StringView("a\0b"s, ""), "std::string_view(\"a\\000b\", 3)");
	EXPECT_EQ(Codec::StringView("", ""), "std::string_view(\"\", 0)");
	// Multi-line text starts on its own line
	EXPECT_EQ(Codec::StringView("(module\n)", "\t"),
		"std::string_view(\n\t\"(module\\n\"\n\t\")\", 9)");
}

TEST(Codec, ByteList) {
	EXPECT_EQ(Codec::ByteList({}, "\t"), "{}");
	EXPECT_EQ(Codec::ByteList({ 0x00, 0x61 }, "\t"), "{\n\t\t0x00, 0x61,\n\t}");

	std::vector<uint8_t> bytes(17, 0xFF);
	std::string list = Codec::ByteList(bytes, "");
	// Second line holds the 17th byte alone
	EXPECT_NE(list.find("0xff,\n\t0xff,\n}"), std::string::npos);
}
