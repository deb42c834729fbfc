#pragma once

#include <wastgen/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <wasm.h>
#include <wasmtime.h>

namespace Wastgen {
	namespace Wasm {
		class RuntimeError : public std::runtime_error {
		public:
			using std::runtime_error::runtime_error;
		};

		struct CallResult {
			std::vector<Value> values;
			// Set when the call trapped or could not be dispatched
			std::optional<std::string> error;

			static CallResult Returned(std::vector<Value> values) {
				return CallResult { std::move(values), std::nullopt };
			}

			static CallResult Failed(std::string message) {
				return CallResult { {}, std::move(message) };
			}

			bool Ok() const {
				return !error.has_value();
			}

			bool operator==(const CallResult& other) const = default;
		};

		std::ostream& operator<<(std::ostream& out, const CallResult& result);

		// Engine, store and linker shared by the instances that import from each other
		class Store {
		public:
			Store();
			~Store();

			Store(const Store&) = delete;
			Store& operator=(const Store&) = delete;

			wasm_engine_t* Engine() {
				return engine;
			}

			wasmtime_context_t* Context() {
				return context;
			}

			wasmtime_linker_t* Linker() {
				return linker;
			}

		private:
			wasm_engine_t* engine { nullptr };
			wasmtime_store_t* store { nullptr };
			wasmtime_context_t* context { nullptr };
			wasmtime_linker_t* linker { nullptr };
		};

		class Instance {
		public:
			// Compiles and instantiates against everything registered in store, throws
			// RuntimeError on compile errors, link errors and traps in the start function
			Instance(std::shared_ptr<Store> store, const std::vector<uint8_t>& wasm_bytes);

			CallResult Call(std::string_view field, const std::vector<Value>& args);
			// Makes the exports importable by later instances under name
			void Register(std::string_view name);

		private:
			std::shared_ptr<Store> store;
			wasmtime_instance_t instance;
		};

		// Throws RuntimeError when the text does not parse
		std::vector<uint8_t> Wat2Wasm(std::string_view wat);
		bool Compiles(const std::vector<uint8_t>& wasm_bytes);
		bool CompilesText(std::string_view wat);
	}
}
