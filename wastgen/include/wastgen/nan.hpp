#pragma once

#include <bit>
#include <cstdint>

// Bit pattern of an f32 value:
//     1-bit sign + 8-bit exponent + 23-bit mantissa = 32 bits
//
// Bit pattern of an f64 value:
//     1-bit sign + 11-bit exponent + 52-bit mantissa = 64 bits
//
// NOTE: On some old platforms (PA-RISC, some MIPS) quiet NaNs have their mantissa MSB unset
// and signaling NaNs have it set. Wasm always uses the IEEE 754-2008 convention.
namespace Wastgen {
	namespace Nan {
		constexpr uint32_t F32_EXPONENT_MASK = 0x7F800000;
		constexpr uint32_t F32_MANTISSA_MASK = 0x007FFFFF;
		constexpr uint32_t F32_SIGN_BIT      = 0x80000000;
		// MSB of the mantissa
		constexpr uint32_t F32_QUIET_BIT = 1u << 22;
		// Sign, then every mantissa bit except the quiet bit
		constexpr uint32_t F32_CANONICAL_MASK = 0b1'00000000'01111111111111111111111;

		constexpr uint64_t F64_EXPONENT_MASK = 0x7FF0000000000000;
		constexpr uint64_t F64_MANTISSA_MASK = 0x000FFFFFFFFFFFFF;
		constexpr uint64_t F64_SIGN_BIT      = 0x8000000000000000;
		constexpr uint64_t F64_QUIET_BIT     = 1ull << 51;
		constexpr uint64_t F64_CANONICAL_MASK
			= 0b1'00000000000'0111111111111111111111111111111111111111111111111111;

		constexpr bool IsNanBits(uint32_t bits) {
			return (bits & F32_EXPONENT_MASK) == F32_EXPONENT_MASK && (bits & F32_MANTISSA_MASK) != 0;
		}

		constexpr bool IsNanBits(uint64_t bits) {
			return (bits & F64_EXPONENT_MASK) == F64_EXPONENT_MASK && (bits & F64_MANTISSA_MASK) != 0;
		}

		constexpr bool IsInfinityBits(uint32_t bits) {
			return (bits & ~F32_SIGN_BIT) == F32_EXPONENT_MASK;
		}

		constexpr bool IsInfinityBits(uint64_t bits) {
			return (bits & ~F64_SIGN_BIT) == F64_EXPONENT_MASK;
		}

		// The MSB of the mantissa must be set for a NaN to be a quiet NaN
		constexpr bool IsQuietNanBits(uint32_t bits) {
			return IsNanBits(bits) && (bits & F32_QUIET_BIT) == F32_QUIET_BIT;
		}

		constexpr bool IsQuietNanBits(uint64_t bits) {
			return IsNanBits(bits) && (bits & F64_QUIET_BIT) == F64_QUIET_BIT;
		}

		// Only the quiet bit may be set in the mantissa, sign is free
		constexpr bool IsCanonicalNanBits(uint32_t bits) {
			uint32_t masked = bits ^ F32_CANONICAL_MASK;
			return masked == 0xFFFFFFFF || masked == 0x7FFFFFFF;
		}

		constexpr bool IsCanonicalNanBits(uint64_t bits) {
			uint64_t masked = bits ^ F64_CANONICAL_MASK;
			return masked == 0xFFFFFFFFFFFFFFFF || masked == 0x7FFFFFFFFFFFFFFF;
		}

		inline bool IsQuietNan(float value) {
			return IsQuietNanBits(std::bit_cast<uint32_t>(value));
		}

		inline bool IsQuietNan(double value) {
			return IsQuietNanBits(std::bit_cast<uint64_t>(value));
		}

		inline bool IsCanonicalNan(float value) {
			return IsCanonicalNanBits(std::bit_cast<uint32_t>(value));
		}

		inline bool IsCanonicalNan(double value) {
			return IsCanonicalNanBits(std::bit_cast<uint64_t>(value));
		}
	}
}
