#include <wastgen/script.hpp>

#include <cJSON.h>

#include <charconv>
#include <fstream>
#include <iterator>
#include <memory>

namespace Wastgen {
	namespace {
		using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

		class CommandReader {
		public:
			CommandReader(const cJSON* command, const std::filesystem::path& directory)
				: command(command)
				, directory(directory) {
				const cJSON* line_item = cJSON_GetObjectItemCaseSensitive(command, "line");
				if(cJSON_IsNumber(line_item) && line_item->valuedouble >= 0) {
					line = static_cast<uint64_t>(line_item->valuedouble);
				}
			}

			uint64_t Line() const {
				return line;
			}

			std::string String(const cJSON* object, const char* key) const {
				const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
				if(!cJSON_IsString(item) || !item->valuestring) {
					throw ScriptError(line, std::string("missing string field \"") + key + "\"");
				}
				return item->valuestring;
			}

			std::optional<std::string> OptionalString(const cJSON* object, const char* key) const {
				const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
				if(!item) {
					return std::nullopt;
				}
				if(!cJSON_IsString(item) || !item->valuestring) {
					throw ScriptError(line, std::string("field \"") + key + "\" is not a string");
				}
				return std::string(item->valuestring);
			}

			const cJSON* Array(const cJSON* object, const char* key) const {
				const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
				if(!cJSON_IsArray(item)) {
					throw ScriptError(line, std::string("missing array field \"") + key + "\"");
				}
				return item;
			}

			template <typename T> T Number(const std::string& text) const {
				T number {};
				auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), number);
				if(error != std::errc() || end != text.data() + text.size()) {
					throw ScriptError(line, "invalid number \"" + text + "\"");
				}
				return number;
			}

			// wast2json writes every value as the unsigned decimal of its bit pattern
			Value ReadValue(const cJSON* item) const {
				std::string type = String(item, "type");
				std::string text = String(item, "value");
				if(type == "i32") {
					return Value::I32(static_cast<int32_t>(Number<uint32_t>(text)));
				} else if(type == "i64") {
					return Value::I64(static_cast<int64_t>(Number<uint64_t>(text)));
				} else if(type == "f32") {
					return Value::F32Bits(Number<uint32_t>(text));
				} else if(type == "f64") {
					return Value::F64Bits(Number<uint64_t>(text));
				}
				throw ScriptError(line, "unsupported value type \"" + type + "\"");
			}

			std::vector<Value> Values(const cJSON* array) const {
				std::vector<Value> values;
				const cJSON* item = nullptr;
				cJSON_ArrayForEach(item, array) {
					values.push_back(ReadValue(item));
				}
				return values;
			}

			Action ReadAction() const {
				const cJSON* action = cJSON_GetObjectItemCaseSensitive(command, "action");
				if(!cJSON_IsObject(action)) {
					throw ScriptError(line, "missing action");
				}

				std::string type = String(action, "type");
				if(type == "invoke") {
					return InvokeAction {
						.module = OptionalString(action, "module"),
						.field  = String(action, "field"),
						.args   = Values(Array(action, "args")),
					};
				} else if(type == "get") {
					return GetAction {
						.module = OptionalString(action, "module"),
						.field  = String(action, "field"),
					};
				}
				throw ScriptError(line, "unsupported action type \"" + type + "\"");
			}

			ModuleBinary ReadModule() const {
				ModuleBinary binary;
				auto module_type = OptionalString(command, "module_type");
				if(module_type && *module_type == "text") {
					binary.format = ModuleBinary::TEXT;
				} else if(module_type && *module_type != "binary") {
					throw ScriptError(line, "unsupported module type \"" + *module_type + "\"");
				}

				std::filesystem::path path = directory / String(command, "filename");
				std::ifstream file(path, std::ios::binary);
				if(!file) {
					throw ScriptError(line, "could not read module " + path.string());
				}
				binary.bytes = std::vector<uint8_t>(
					(std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
				return binary;
			}

			std::string Message() const {
				return OptionalString(command, "text").value_or("");
			}

			CommandKind ReadAssertReturn() const {
				Action action = ReadAction();
				const cJSON* expected_array = Array(command, "expected");

				// Newer wast2json folds the NaN assertions into assert_return
				if(cJSON_GetArraySize(expected_array) == 1) {
					const cJSON* expected = cJSON_GetArrayItem(expected_array, 0);
					auto value            = OptionalString(expected, "value");
					if(value && *value == "nan:canonical") {
						return Commands::AssertReturnCanonicalNan { std::move(action) };
					} else if(value && *value == "nan:arithmetic") {
						return Commands::AssertReturnArithmeticNan { std::move(action) };
					}
				}

				return Commands::AssertReturn { std::move(action), Values(expected_array) };
			}

			CommandKind Read() const {
				std::string type = String(command, "type");
				if(type == "module") {
					return Commands::Module { ReadModule(), OptionalString(command, "name") };
				} else if(type == "assert_return") {
					return ReadAssertReturn();
				} else if(type == "assert_return_canonical_nan") {
					return Commands::AssertReturnCanonicalNan { ReadAction() };
				} else if(type == "assert_return_arithmetic_nan") {
					return Commands::AssertReturnArithmeticNan { ReadAction() };
				} else if(type == "assert_trap") {
					return Commands::AssertTrap { ReadAction(), Message() };
				} else if(type == "assert_exhaustion") {
					return Commands::AssertExhaustion { ReadAction(), Message() };
				} else if(type == "action") {
					return Commands::PerformAction { ReadAction() };
				} else if(type == "assert_invalid") {
					return Commands::AssertInvalid { ReadModule(), Message() };
				} else if(type == "assert_malformed") {
					return Commands::AssertMalformed { ReadModule(), Message() };
				} else if(type == "assert_unlinkable") {
					return Commands::AssertUnlinkable { ReadModule(), Message() };
				} else if(type == "assert_uninstantiable") {
					return Commands::AssertUninstantiable { ReadModule(), Message() };
				} else if(type == "register") {
					return Commands::Register { OptionalString(command, "name"), String(command, "as") };
				}
				throw ScriptError(line, "unsupported command \"" + type + "\"");
			}

		private:
			const cJSON* command;
			const std::filesystem::path& directory;
			uint64_t line { 0 };
		};
	}

	std::vector<Command> ParseScript(std::string_view json, const std::filesystem::path& directory) {
		// cJSON needs a terminated buffer
		std::string source(json);
		JsonPtr root(cJSON_Parse(source.c_str()), &cJSON_Delete);
		if(!root) {
			const char* error = cJSON_GetErrorPtr();
			throw ScriptError(0, std::string("invalid JSON near \"")
									 + std::string(error ? error : "").substr(0, 32) + "\"");
		}

		const cJSON* commands = cJSON_GetObjectItemCaseSensitive(root.get(), "commands");
		if(!cJSON_IsArray(commands)) {
			throw ScriptError(0, "missing \"commands\" array");
		}

		std::vector<Command> script;
		const cJSON* item = nullptr;
		cJSON_ArrayForEach(item, commands) {
			CommandReader reader(item, directory);
			script.push_back(Command { reader.Line(), reader.Read() });
		}
		return script;
	}

	std::vector<Command> LoadScript(const std::filesystem::path& path) {
		std::ifstream file(path, std::ios::binary);
		if(!file) {
			throw ScriptError(0, "could not read script " + path.string());
		}
		std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
		return ParseScript(json, path.parent_path());
	}
}
