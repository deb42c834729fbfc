#pragma once

#include <wastgen/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Wastgen {
	namespace Codec {
		// "i32", "i64", "f32" or "f64"
		std::string TypeTag(const Value& value);
		// Enumerator naming the type in generated code, like Wastgen::ValueType::F32
		std::string TypeEnumerator(const Value& value);

		// C++ expression that reconstructs the exact value as a Wastgen::Value
		std::string Literal(const Value& value);
		// Same, but as the bare scalar (int32_t, int64_t, float or double)
		std::string BareLiteral(const Value& value);
		std::string Literals(const std::vector<Value>& values);

		bool IsNan(const Value& value);

		// Splits text into adjacent C++ string literals, one per source line, each line
		// prefixed with indent
		std::string EscapeString(std::string_view text, std::string_view indent);
		// std::string_view over the escaped literal with its explicit length, so embedded
		// NULs are kept
		std::string StringView(std::string_view text, std::string_view indent);
		// Bytes as a braced initializer list, 16 per line
		std::string ByteList(const std::vector<uint8_t>& bytes, std::string_view indent);
	}
}
