#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Wastgen {
	namespace Wasm {
		class DisassemblyError : public std::runtime_error {
		public:
			using std::runtime_error::runtime_error;
		};

		// Converts a module binary back into text, throws DisassemblyError
		using Disassembler = std::function<std::string(const std::vector<uint8_t>& wasm_bytes)>;

		// Binaryen backed disassembler
		std::string Disassemble(const std::vector<uint8_t>& wasm_bytes);
		void GetExports(const std::vector<uint8_t>& wasm_bytes, std::vector<std::string>& names);
	}
}
