#pragma once

#include <wastgen/nan.hpp>

#include <bit>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace Wastgen {
	enum class ValueType {
		I32,
		I64,
		F32,
		F64,
	};

	constexpr std::string_view TypeName(ValueType type) {
		switch(type) {
		case ValueType::I32:
			return "i32";
		case ValueType::I64:
			return "i64";
		case ValueType::F32:
			return "f32";
		case ValueType::F64:
			return "f64";
		}
		return "unknown";
	}

	// Scalar wasm value. Floats keep their exact bit pattern so NaN payloads survive
	class Value {
	public:
		static constexpr Value I32(int32_t value) {
			return Value(ValueType::I32, static_cast<uint32_t>(value));
		}

		static constexpr Value I64(int64_t value) {
			return Value(ValueType::I64, static_cast<uint64_t>(value));
		}

		static constexpr Value F32(float value) {
			return Value(ValueType::F32, std::bit_cast<uint32_t>(value));
		}

		static constexpr Value F64(double value) {
			return Value(ValueType::F64, std::bit_cast<uint64_t>(value));
		}

		static constexpr Value F32Bits(uint32_t bits) {
			return Value(ValueType::F32, bits);
		}

		static constexpr Value F64Bits(uint64_t bits) {
			return Value(ValueType::F64, bits);
		}

		constexpr ValueType Type() const {
			return type;
		}

		// Raw bits, zero extended for 32 bit types
		constexpr uint64_t Bits() const {
			return bits;
		}

		constexpr int32_t AsI32() const {
			return static_cast<int32_t>(static_cast<uint32_t>(bits));
		}

		constexpr int64_t AsI64() const {
			return static_cast<int64_t>(bits);
		}

		float AsF32() const {
			return std::bit_cast<float>(static_cast<uint32_t>(bits));
		}

		double AsF64() const {
			return std::bit_cast<double>(bits);
		}

		constexpr bool IsFloat() const {
			return type == ValueType::F32 || type == ValueType::F64;
		}

		constexpr bool IsNan() const {
			switch(type) {
			case ValueType::F32:
				return Nan::IsNanBits(static_cast<uint32_t>(bits));
			case ValueType::F64:
				return Nan::IsNanBits(bits);
			default:
				return false;
			}
		}

		constexpr bool SignBit() const {
			switch(type) {
			case ValueType::I32:
			case ValueType::F32:
				return (bits & Nan::F32_SIGN_BIT) != 0;
			default:
				return (bits & Nan::F64_SIGN_BIT) != 0;
			}
		}

		constexpr bool operator==(const Value& other) const {
			return type == other.type && bits == other.bits;
		}

	private:
		constexpr Value(ValueType type, uint64_t bits)
			: type { type }
			, bits { bits } { }

		ValueType type;
		uint64_t bits;
	};

	inline bool IsQuietNan(const Value& value) {
		switch(value.Type()) {
		case ValueType::F32:
			return Nan::IsQuietNanBits(static_cast<uint32_t>(value.Bits()));
		case ValueType::F64:
			return Nan::IsQuietNanBits(value.Bits());
		default:
			return false;
		}
	}

	inline bool IsCanonicalNan(const Value& value) {
		switch(value.Type()) {
		case ValueType::F32:
			return Nan::IsCanonicalNanBits(static_cast<uint32_t>(value.Bits()));
		case ValueType::F64:
			return Nan::IsCanonicalNanBits(value.Bits());
		default:
			return false;
		}
	}

	// Used by GoogleTest to print mismatches
	inline std::ostream& operator<<(std::ostream& out, const Value& value) {
		out << TypeName(value.Type()) << ":";
		switch(value.Type()) {
		case ValueType::I32:
			return out << value.AsI32();
		case ValueType::I64:
			return out << value.AsI64();
		case ValueType::F32:
			return out << value.AsF32() << " (0x" << std::hex << value.Bits() << std::dec << ")";
		case ValueType::F64:
			return out << value.AsF64() << " (0x" << std::hex << value.Bits() << std::dec << ")";
		}
		return out;
	}
}
