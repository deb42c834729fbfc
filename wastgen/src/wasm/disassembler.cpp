#include <wastgen/wasm/disassembler.hpp>

#include <sstream>

#include <parsing.h>
#include <wasm-binary.h>
#include <wasm.h>

namespace Wastgen {
	namespace Wasm {
		namespace {
			void ReadModule(wasm::Module& wasm, const std::vector<uint8_t>& wasm_bytes) {
				std::vector<char> input(wasm_bytes.begin(), wasm_bytes.end());
				// Spec tests exercise every proposal wabt knows about
				wasm.features = wasm::FeatureSet::All;
				wasm::WasmBinaryBuilder parser(wasm, wasm.features, input);
				parser.setDebugInfo(false);
				parser.setDWARF(false);
				parser.setSkipFunctionBodies(false);
				try {
					parser.read();
				} catch(wasm::ParseException& e) {
					throw DisassemblyError("Can't convert back to text: " + e.text);
				}
			}
		}

		std::string Disassemble(const std::vector<uint8_t>& wasm_bytes) {
			wasm::Module wasm;
			ReadModule(wasm, wasm_bytes);

			std::ostringstream text;
			text << wasm;
			return text.str();
		}

		void GetExports(const std::vector<uint8_t>& wasm_bytes, std::vector<std::string>& names) {
			wasm::Module wasm;
			ReadModule(wasm, wasm_bytes);

			names.clear();
			for(auto& curr : wasm.exports) {
				if(curr->kind == wasm::ExternalKind::Function) {
					names.push_back(std::string(curr->name.str));
				}
			}
		}
	}
}
