#include <wastgen/codec.hpp>
#include <wastgen/fragments.hpp>

#include <fmt/core.h>

namespace Wastgen {
	namespace {
		// Comments must stay on one line
		std::string OneLine(std::string text) {
			for(char& c : text) {
				if(c == '\n' || c == '\r') {
					c = ' ';
				}
			}
			return text;
		}

		struct Renderer {
			const std::string& suite;

			std::string operator()(const Fragments::LineMarker& marker) const {
				return fmt::format("\n// Line {}\n", marker.line);
			}

			std::string operator()(const Fragments::ModuleFactory& factory) const {
				return fmt::format(
					"std::unique_ptr<Wastgen::Wasm::Instance> create_module_{module}() {{\n"
					"\tconst char* module_str =\n"
					"{text};\n"
					"\tstd::cout << module_str << std::endl;\n"
					"\tconst std::vector<uint8_t> wasm_binary {binary};\n"
					"\treturn std::make_unique<Wastgen::Wasm::Instance>(GenerateImports(), wasm_binary);\n"
					"}}\n",
					fmt::arg("module", factory.module),
					// We do this to indent the module text, so it looks aligned to the function body
					fmt::arg("text", Codec::EscapeString(factory.text, "\t\t")),
					fmt::arg("binary", Codec::ByteList(factory.binary, "\t")));
			}

			std::string operator()(const Fragments::StartHook& hook) const {
				return fmt::format(
					"\nWastgen::Wasm::CallResult start_module_{}(Wastgen::Wasm::Instance& instance) {{\n"
					"\t// The start function already ran when the module was instantiated\n"
					"\t(void)instance;\n"
					"\treturn Wastgen::Wasm::CallResult::Returned({{}});\n"
					"}}\n",
					hook.module);
			}

			std::string Invocation(
				const std::string& name, const std::string& field, const std::vector<Value>& args) const {
				return fmt::format("\tstd::cout << \"Executing function {name}\" << std::endl;\n"
								   "\tauto result = instance.Call({field}, {{ {args} }});\n",
					fmt::arg("name", name), fmt::arg("field", Codec::StringView(field, "")),
					fmt::arg("args", Codec::Literals(args)));
			}

			std::string Assertion(const Fragments::ActionUnit& unit) const {
				if(!unit.expected) {
					return "";
				}

				auto& expected = *unit.expected;
				if(!expected.empty() && Codec::IsNan(expected.front())) {
					// Only NaN-ness and sign are compared, runtimes need not propagate payloads
					return fmt::format(
						"\t{{\n"
						"\t\tauto expected = {bare};\n"
						"\t\tEXPECT_TRUE(result.Ok()) << result;\n"
						"\t\tif(result.Ok() && !result.values.empty()) {{\n"
						"\t\t\tconst Wastgen::Value& actual = result.values.front();\n"
						"\t\t\tEXPECT_EQ(actual.Type(), {type}) << \"Expected {tag} result, got \" << actual;\n"
						"\t\t\tEXPECT_TRUE(actual.IsNan()) << actual;\n"
						"\t\t\tEXPECT_EQ(actual.SignBit(), std::signbit(expected)) << actual;\n"
						"\t\t}} else {{\n"
						"\t\t\tADD_FAILURE() << \"Missing result in {name}\";\n"
						"\t\t}}\n"
						"\t}}\n",
						fmt::arg("bare", Codec::BareLiteral(expected.front())),
						fmt::arg("type", Codec::TypeEnumerator(expected.front())),
						fmt::arg("tag", Codec::TypeTag(expected.front())), fmt::arg("name", unit.name));
				}

				return fmt::format("\tEXPECT_EQ(result, Wastgen::Wasm::CallResult::Returned({{ {} }}));\n",
					Codec::Literals(expected));
			}

			std::string operator()(const Fragments::ActionUnit& unit) const {
				return fmt::format("Wastgen::Wasm::CallResult {name}(Wastgen::Wasm::Instance& instance) {{\n"
								   "{invocation}"
								   "{assertion}"
								   "\treturn result;\n"
								   "}}\n",
					fmt::arg("name", unit.name),
					fmt::arg("invocation", Invocation(unit.name, unit.field, unit.args)),
					fmt::arg("assertion", Assertion(unit)));
			}

			std::string operator()(const Fragments::NanUnit& unit) const {
				return fmt::format("Wastgen::Wasm::CallResult {name}(Wastgen::Wasm::Instance& instance) {{\n"
								   "{invocation}"
								   "\tEXPECT_TRUE(result.Ok()) << result;\n"
								   "\tif(!result.values.empty()) {{\n"
								   "\t\t// {note}\n"
								   "\t\tEXPECT_TRUE(IsQuietNan(result.values.front())) << result.values.front();\n"
								   "\t}} else {{\n"
								   "\t\tADD_FAILURE() << \"Missing result in {name}\";\n"
								   "\t}}\n"
								   "\treturn result;\n"
								   "}}\n",
					fmt::arg("name", unit.name),
					fmt::arg("invocation", Invocation(unit.name, unit.field, unit.args)),
					fmt::arg("note", unit.kind == Fragments::NanKind::CANONICAL
										 ? "Canonical NaNs are only checked to be quiet"
										 : "Arithmetic NaNs must be quiet"));
			}

			std::string operator()(const Fragments::TrapTest& test) const {
				std::string expectation;
				if(!test.message.empty()) {
					expectation = fmt::format("\t// Expected trap: {}\n", OneLine(test.message));
				}

				// We don't group trap calls as they may leave the instance memory and globals
				// in an unspecified state. So we test them alone
				return fmt::format("\nTEST({suite}, {name}) {{\n"
								   "\tauto instance = create_module_{module}();\n"
								   "{expectation}"
								   "\tauto result = {unit}(*instance);\n"
								   "\tEXPECT_FALSE(result.Ok()) << \"{unit} should trap\";\n"
								   "}}\n",
					fmt::arg("suite", suite), fmt::arg("name", test.name),
					fmt::arg("module", test.module), fmt::arg("expectation", expectation),
					fmt::arg("unit", test.unit));
			}

			std::string operator()(const Fragments::CompileFailureTest& test) const {
				const char* reason
					= test.reason == Fragments::CompileFailure::INVALID ? "invalid" : "malformed";

				if(test.binary.format == ModuleBinary::TEXT) {
					std::string text(test.binary.bytes.begin(), test.binary.bytes.end());
					return fmt::format("\nTEST({suite}, {name}) {{\n"
									   "\tconst std::string_view module_str =\n"
									   "\t\t{text};\n"
									   "\tEXPECT_FALSE(Wastgen::Wasm::CompilesText(module_str))\n"
									   "\t\t<< \"WASM should not compile as it is {reason}\";\n"
									   "}}\n",
						fmt::arg("suite", suite), fmt::arg("name", test.name),
						fmt::arg("text", Codec::StringView(text, "\t\t\t")),
						fmt::arg("reason", reason));
				}

				return fmt::format("\nTEST({suite}, {name}) {{\n"
								   "\tconst std::vector<uint8_t> wasm_binary {binary};\n"
								   "\tEXPECT_FALSE(Wastgen::Wasm::Compiles(wasm_binary))\n"
								   "\t\t<< \"WASM should not compile as it is {reason}\";\n"
								   "}}\n",
					fmt::arg("suite", suite), fmt::arg("name", test.name),
					fmt::arg("binary", Codec::ByteList(test.binary.bytes, "\t")),
					fmt::arg("reason", reason));
			}

			std::string operator()(const Fragments::ModuleTest& test) const {
				std::string calls;
				for(auto& unit : test.units) {
					calls += fmt::format("\tEXPECT_TRUE({0}(*instance).Ok()) << \"{0}\";\n", unit);
				}

				return fmt::format("\nTEST({suite}, test_module_{module}) {{\n"
								   "\tauto instance = create_module_{module}();\n"
								   "\t// We group the calls together\n"
								   "{calls}"
								   "}}\n",
					fmt::arg("suite", suite), fmt::arg("module", test.module),
					fmt::arg("calls", calls));
			}

			std::string operator()(const Fragments::Skipped& skipped) const {
				return fmt::format("// Skipped: {}\n", OneLine(skipped.reason));
			}
		};
	}

	std::string Render(const Fragment& fragment, const std::string& suite) {
		return std::visit(Renderer { suite }, fragment);
	}
}
