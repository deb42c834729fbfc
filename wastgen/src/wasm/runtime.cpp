#include <wastgen/wasm/runtime.hpp>

#include <cstring>

namespace Wastgen {
	namespace Wasm {
		namespace {
			std::string TakeMessage(wasmtime_error_t* error) {
				wasm_name_t message;
				wasmtime_error_message(error, &message);
				wasmtime_error_delete(error);
				std::string text(message.data, message.data + message.size);
				wasm_byte_vec_delete(&message);
				return text;
			}

			std::string TakeMessage(wasm_trap_t* trap) {
				wasm_message_t message;
				wasm_trap_message(trap, &message);
				wasm_trap_delete(trap);
				std::string text(message.data, message.data + message.size);
				wasm_byte_vec_delete(&message);
				// Trap messages are null terminated
				while(!text.empty() && text.back() == '\0') {
					text.pop_back();
				}
				return text;
			}

			void HandleErrors(wasmtime_error_t* error, wasm_trap_t* trap, const std::string& what) {
				if(error) {
					if(trap) {
						wasm_trap_delete(trap);
					}
					throw RuntimeError(what + ": " + TakeMessage(error));
				}
				if(trap) {
					throw RuntimeError(what + ": " + TakeMessage(trap));
				}
			}

			wasmtime_val_t ToWasmtime(const Value& value) {
				wasmtime_val_t out;
				switch(value.Type()) {
				case ValueType::I32:
					out.kind   = WASMTIME_I32;
					out.of.i32 = value.AsI32();
					break;
				case ValueType::I64:
					out.kind   = WASMTIME_I64;
					out.of.i64 = value.AsI64();
					break;
				case ValueType::F32: {
					// Copy the bits, float moves are allowed to quiet signaling NaNs
					uint32_t bits = static_cast<uint32_t>(value.Bits());
					out.kind      = WASMTIME_F32;
					std::memcpy(&out.of.f32, &bits, sizeof(bits));
					break;
				}
				case ValueType::F64: {
					uint64_t bits = value.Bits();
					out.kind      = WASMTIME_F64;
					std::memcpy(&out.of.f64, &bits, sizeof(bits));
					break;
				}
				}
				return out;
			}

			std::optional<Value> FromWasmtime(const wasmtime_val_t& value) {
				switch(value.kind) {
				case WASMTIME_I32:
					return Value::I32(value.of.i32);
				case WASMTIME_I64:
					return Value::I64(value.of.i64);
				case WASMTIME_F32: {
					uint32_t bits;
					std::memcpy(&bits, &value.of.f32, sizeof(bits));
					return Value::F32Bits(bits);
				}
				case WASMTIME_F64: {
					uint64_t bits;
					std::memcpy(&bits, &value.of.f64, sizeof(bits));
					return Value::F64Bits(bits);
				}
				default:
					return std::nullopt;
				}
			}
		}

		std::ostream& operator<<(std::ostream& out, const CallResult& result) {
			if(result.error) {
				return out << "error: " << *result.error;
			}

			out << "[";
			for(size_t i = 0; i < result.values.size(); i++) {
				if(i != 0) {
					out << ", ";
				}
				out << result.values[i];
			}
			return out << "]";
		}

		Store::Store() {
			engine  = wasm_engine_new();
			store   = wasmtime_store_new(engine, NULL, NULL);
			context = wasmtime_store_context(store);
			linker  = wasmtime_linker_new(engine);
			// Scripts may register several modules under the same name
			wasmtime_linker_allow_shadowing(linker, true);
		}

		Store::~Store() {
			if(linker)
				wasmtime_linker_delete(linker);
			if(store)
				wasmtime_store_delete(store);
			if(engine)
				wasm_engine_delete(engine);
		}

		Instance::Instance(std::shared_ptr<Store> store, const std::vector<uint8_t>& wasm_bytes)
			: store(std::move(store)) {
			wasmtime_module_t* module = NULL;
			HandleErrors(wasmtime_module_new(
							 this->store->Engine(), wasm_bytes.data(), wasm_bytes.size(), &module),
				NULL, "WASM can't be compiled");

			// Create instance using imports
			wasm_trap_t* trap       = NULL;
			wasmtime_error_t* error = wasmtime_linker_instantiate(
				this->store->Linker(), this->store->Context(), module, &instance, &trap);
			wasmtime_module_delete(module);
			HandleErrors(error, trap, "WASM can't be instantiated");
		}

		CallResult Instance::Call(std::string_view field, const std::vector<Value>& args) {
			wasmtime_context_t* context = store->Context();

			wasmtime_extern_t item;
			if(!wasmtime_instance_export_get(context, &instance, field.data(), field.size(), &item)) {
				return CallResult::Failed("Could not retrieve \"" + std::string(field) + "\" from exports");
			}
			if(item.kind != WASMTIME_EXTERN_FUNC) {
				return CallResult::Failed("Export \"" + std::string(field) + "\" is not a function");
			}

			wasm_functype_t* type = wasmtime_func_type(context, &item.of.func);
			size_t result_count   = wasm_functype_results(type)->size;
			wasm_functype_delete(type);

			std::vector<wasmtime_val_t> params;
			for(auto& arg : args) {
				params.push_back(ToWasmtime(arg));
			}
			std::vector<wasmtime_val_t> results(result_count);

			wasm_trap_t* trap       = NULL;
			wasmtime_error_t* error = wasmtime_func_call(context, &item.of.func, params.data(),
				params.size(), results.data(), results.size(), &trap);
			if(error) {
				return CallResult::Failed(TakeMessage(error));
			}
			if(trap) {
				return CallResult::Failed(TakeMessage(trap));
			}

			CallResult result;
			for(auto& raw : results) {
				auto value = FromWasmtime(raw);
				if(!value) {
					return CallResult::Failed("Unsupported result type from \"" + std::string(field) + "\"");
				}
				result.values.push_back(*value);
			}
			return result;
		}

		void Instance::Register(std::string_view name) {
			HandleErrors(wasmtime_linker_define_instance(
							 store->Linker(), store->Context(), name.data(), name.size(), &instance),
				NULL, "Could not register instance as \"" + std::string(name) + "\"");
		}

		std::vector<uint8_t> Wat2Wasm(std::string_view wat) {
			wasm_byte_vec_t wasm;
			HandleErrors(wasmtime_wat2wasm(wat.data(), wat.size(), &wasm), NULL,
				"WAST not valid or malformed");
			std::vector<uint8_t> bytes(wasm.data, wasm.data + wasm.size);
			wasm_byte_vec_delete(&wasm);
			return bytes;
		}

		bool Compiles(const std::vector<uint8_t>& wasm_bytes) {
			wasm_engine_t* engine     = wasm_engine_new();
			wasmtime_module_t* module = NULL;
			wasmtime_error_t* error
				= wasmtime_module_new(engine, wasm_bytes.data(), wasm_bytes.size(), &module);

			bool compiled = error == NULL;
			if(error) {
				wasmtime_error_delete(error);
			} else {
				wasmtime_module_delete(module);
			}
			wasm_engine_delete(engine);
			return compiled;
		}

		bool CompilesText(std::string_view wat) {
			std::vector<uint8_t> wasm_bytes;
			try {
				wasm_bytes = Wat2Wasm(wat);
			} catch(RuntimeError&) {
				// Malformed text never produces a module
				return false;
			}
			return Compiles(wasm_bytes);
		}
	}
}
