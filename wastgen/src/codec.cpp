#include <wastgen/codec.hpp>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace Wastgen {
	namespace Codec {
		namespace {
			// Shortest decimal form that parses back to the same bits. fmt may omit the
			// decimal point, which would turn "1f" into an invalid literal
			template <typename T> std::string FiniteFloat(T value) {
				std::string out = fmt::format("{}", value);
				if(out.find_first_of(".e") == std::string::npos) {
					out += ".0";
				}
				return out;
			}

			std::string F32Bare(uint32_t bits) {
				if(Nan::IsInfinityBits(bits)) {
					return (bits & Nan::F32_SIGN_BIT) ? "-std::numeric_limits<float>::infinity()"
													  : "std::numeric_limits<float>::infinity()";
				}
				if(Nan::IsNanBits(bits)) {
					// Support for non-canonical NaNs
					return fmt::format("std::bit_cast<float>(UINT32_C({:#010x}))", bits);
				}
				return FiniteFloat(std::bit_cast<float>(bits)) + "f";
			}

			std::string F64Bare(uint64_t bits) {
				if(Nan::IsInfinityBits(bits)) {
					return (bits & Nan::F64_SIGN_BIT) ? "-std::numeric_limits<double>::infinity()"
													  : "std::numeric_limits<double>::infinity()";
				}
				if(Nan::IsNanBits(bits)) {
					return fmt::format("std::bit_cast<double>(UINT64_C({:#018x}))", bits);
				}
				return FiniteFloat(std::bit_cast<double>(bits));
			}
		}

		std::string TypeTag(const Value& value) {
			return std::string(TypeName(value.Type()));
		}

		std::string TypeEnumerator(const Value& value) {
			switch(value.Type()) {
			case ValueType::I32:
				return "Wastgen::ValueType::I32";
			case ValueType::I64:
				return "Wastgen::ValueType::I64";
			case ValueType::F32:
				return "Wastgen::ValueType::F32";
			case ValueType::F64:
				return "Wastgen::ValueType::F64";
			}
			return "";
		}

		std::string BareLiteral(const Value& value) {
			switch(value.Type()) {
			case ValueType::I32:
				// -2147483648 is a long literal, so the cast still yields INT32_MIN
				return fmt::format("static_cast<int32_t>({})", value.AsI32());
			case ValueType::I64:
				if(value.AsI64() == INT64_MIN) {
					return "INT64_MIN";
				}
				return fmt::format("static_cast<int64_t>({}LL)", value.AsI64());
			case ValueType::F32:
				return F32Bare(static_cast<uint32_t>(value.Bits()));
			case ValueType::F64:
				return F64Bare(value.Bits());
			}
			return "";
		}

		std::string Literal(const Value& value) {
			switch(value.Type()) {
			case ValueType::I32:
				return fmt::format("Wastgen::Value::I32({})", BareLiteral(value));
			case ValueType::I64:
				return fmt::format("Wastgen::Value::I64({})", BareLiteral(value));
			case ValueType::F32:
				if(value.IsNan()) {
					// Passing a signaling NaN through a float may quiet it, keep the bits
					return fmt::format("Wastgen::Value::F32Bits(UINT32_C({:#010x}))", value.Bits());
				}
				return fmt::format("Wastgen::Value::F32({})", BareLiteral(value));
			case ValueType::F64:
				if(value.IsNan()) {
					return fmt::format("Wastgen::Value::F64Bits(UINT64_C({:#018x}))", value.Bits());
				}
				return fmt::format("Wastgen::Value::F64({})", BareLiteral(value));
			}
			return "";
		}

		std::string Literals(const std::vector<Value>& values) {
			std::vector<std::string> literals;
			for(auto& value : values) {
				literals.push_back(Literal(value));
			}
			return fmt::format("{}", fmt::join(literals, ", "));
		}

		bool IsNan(const Value& value) {
			return value.IsNan();
		}

		std::string EscapeString(std::string_view text, std::string_view indent) {
			std::string out;
			std::string line;
			auto flush_line = [&](bool newline) {
				if(!out.empty()) {
					out += "\n";
				}
				out += fmt::format("{}\"{}{}\"", indent, line, newline ? "\\n" : "");
				line.clear();
			};

			for(char c : text) {
				switch(c) {
				case '\n':
					flush_line(true);
					break;
				case '\\':
					line += "\\\\";
					break;
				case '"':
					line += "\\\"";
					break;
				case '\t':
					line += "\\t";
					break;
				case '\r':
					line += "\\r";
					break;
				default:
					if(static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x7F) {
						// Octal keeps following hex digits from joining the escape
						line += fmt::format("\\{:03o}", static_cast<unsigned char>(c));
					} else {
						line += c;
					}
				}
			}
			if(!line.empty() || out.empty()) {
				flush_line(false);
			}
			return out;
		}

		std::string StringView(std::string_view text, std::string_view indent) {
			std::string literal = EscapeString(text, indent);
			if(literal.find('\n') == std::string::npos) {
				// Fits on the current line
				return fmt::format("std::string_view({}, {})", EscapeString(text, ""), text.size());
			}
			return fmt::format("std::string_view(\n{}, {})", literal, text.size());
		}

		std::string ByteList(const std::vector<uint8_t>& bytes, std::string_view indent) {
			if(bytes.empty()) {
				return "{}";
			}

			std::string out = "{\n";
			for(size_t i = 0; i < bytes.size(); i += 16) {
				out += indent;
				out += "\t";
				for(size_t j = i; j < bytes.size() && j < i + 16; j++) {
					out += fmt::format("{:#04x},", bytes[j]);
					if(j + 1 < bytes.size() && j + 1 < i + 16) {
						out += " ";
					}
				}
				out += "\n";
			}
			out += indent;
			out += "}";
			return out;
		}
	}
}
