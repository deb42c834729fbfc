#include <gtest/gtest.h>
#include <wastgen/script.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

using namespace Wastgen;

namespace {
	const std::vector<uint8_t> EMPTY_MODULE = { 0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00 };

	// Scratch directory holding a script and the module files it references
	class ScriptTest : public ::testing::Test {
	protected:
		void SetUp() override {
			directory = std::filesystem::temp_directory_path()
						/ ("wastgen_script_" + std::string(::testing::UnitTest::GetInstance()
																 ->current_test_info()
																 ->name()));
			std::filesystem::create_directories(directory);
			Write("sample.0.wasm", EMPTY_MODULE);
			std::string text = "(module (func (result i32)))";
			Write("sample.1.wat", std::vector<uint8_t>(text.begin(), text.end()));
		}

		void TearDown() override {
			std::filesystem::remove_all(directory);
		}

		void Write(const std::string& name, const std::vector<uint8_t>& bytes) {
			std::ofstream file(directory / name, std::ios::binary);
			file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
		}

		std::filesystem::path directory;
	};

	const char* SAMPLE_SCRIPT = R"json({"source_filename": "sample.wast",
 "commands": [
  {"type": "module", "line": 1, "name": "$M1", "filename": "sample.0.wasm"},
  {"type": "assert_return", "line": 3, "action": {"type": "invoke", "field": "add", "args": [{"type": "i32", "value": "4294967295"}, {"type": "i64", "value": "9223372036854775808"}]}, "expected": [{"type": "i32", "value": "0"}]},
  {"type": "assert_return", "line": 4, "action": {"type": "invoke", "field": "neg", "args": [{"type": "f32", "value": "2141192192"}]}, "expected": [{"type": "f32", "value": "nan:canonical"}]},
  {"type": "assert_return", "line": 5, "action": {"type": "invoke", "field": "neg", "args": []}, "expected": [{"type": "f64", "value": "nan:arithmetic"}]},
  {"type": "assert_return_arithmetic_nan", "line": 6, "action": {"type": "invoke", "field": "add", "args": []}, "expected": [{"type": "f64"}]},
  {"type": "assert_trap", "line": 7, "action": {"type": "invoke", "module": "$M1", "field": "div", "args": []}, "text": "integer divide by zero", "expected": [{"type": "i32"}]},
  {"type": "assert_malformed", "line": 8, "filename": "sample.1.wat", "text": "unknown operator", "module_type": "text"},
  {"type": "assert_invalid", "line": 9, "filename": "sample.0.wasm", "text": "type mismatch", "module_type": "binary"},
  {"type": "register", "line": 10, "name": "$M1", "as": "M"},
  {"type": "action", "line": 11, "action": {"type": "get", "field": "g"}, "expected": []},
  {"type": "assert_exhaustion", "line": 12, "action": {"type": "invoke", "field": "loop", "args": []}, "text": "call stack exhausted", "expected": []}
 ]})json";
}

TEST_F(ScriptTest, Commands) {
	auto script = ParseScript(SAMPLE_SCRIPT, directory);
	ASSERT_EQ(script.size(), 11u);

	auto& module = std::get<Commands::Module>(script[0].kind);
	EXPECT_EQ(script[0].line, 1u);
	EXPECT_EQ(module.name, "$M1");
	EXPECT_EQ(module.binary.format, ModuleBinary::BINARY);
	EXPECT_EQ(module.binary.bytes, EMPTY_MODULE);

	auto& assert_return = std::get<Commands::AssertReturn>(script[1].kind);
	auto& invoke        = std::get<InvokeAction>(assert_return.action);
	EXPECT_FALSE(invoke.module.has_value());
	EXPECT_EQ(invoke.field, "add");
	ASSERT_EQ(invoke.args.size(), 2u);
	// Values are written as unsigned bit patterns
	EXPECT_EQ(invoke.args[0], Value::I32(-1));
	EXPECT_EQ(invoke.args[1], Value::I64(INT64_MIN));
	EXPECT_EQ(assert_return.expected, std::vector<Value> { Value::I32(0) });

	auto& canonical = std::get<Commands::AssertReturnCanonicalNan>(script[2].kind);
	// Signaling NaN argument keeps its payload
	EXPECT_EQ(std::get<InvokeAction>(canonical.action).args.front(), Value::F32Bits(0x7FA00000));

	EXPECT_TRUE(std::holds_alternative<Commands::AssertReturnArithmeticNan>(script[3].kind));
	EXPECT_TRUE(std::holds_alternative<Commands::AssertReturnArithmeticNan>(script[4].kind));

	auto& trap = std::get<Commands::AssertTrap>(script[5].kind);
	EXPECT_EQ(trap.message, "integer divide by zero");
	EXPECT_EQ(std::get<InvokeAction>(trap.action).module, "$M1");

	auto& malformed = std::get<Commands::AssertMalformed>(script[6].kind);
	EXPECT_EQ(malformed.binary.format, ModuleBinary::TEXT);
	EXPECT_EQ(std::string(malformed.binary.bytes.begin(), malformed.binary.bytes.end()),
		"(module (func (result i32)))");
	EXPECT_EQ(malformed.message, "unknown operator");

	EXPECT_TRUE(std::holds_alternative<Commands::AssertInvalid>(script[7].kind));

	auto& register_command = std::get<Commands::Register>(script[8].kind);
	EXPECT_EQ(register_command.name, "$M1");
	EXPECT_EQ(register_command.as, "M");

	auto& action = std::get<Commands::PerformAction>(script[9].kind);
	EXPECT_EQ(std::get<GetAction>(action.action).field, "g");

	EXPECT_TRUE(std::holds_alternative<Commands::AssertExhaustion>(script[10].kind));
	EXPECT_EQ(script[10].line, 12u);
}

TEST_F(ScriptTest, LoadFromFile) {
	std::string json = SAMPLE_SCRIPT;
	Write("sample.json", std::vector<uint8_t>(json.begin(), json.end()));

	// Module files are found next to the script
	auto script = LoadScript(directory / "sample.json");
	EXPECT_EQ(script.size(), 11u);
}

TEST_F(ScriptTest, MissingFiles) {
	EXPECT_THROW(LoadScript(directory / "missing.json"), ScriptError);

	try {
		ParseScript(R"({"commands": [{"type": "module", "line": 4, "filename": "missing.wasm"}]})",
			directory);
		FAIL() << "Expected ScriptError";
	} catch(const ScriptError& e) {
		EXPECT_EQ(e.Line(), 4u);
	}
}

TEST_F(ScriptTest, InvalidScripts) {
	EXPECT_THROW(ParseScript("{\"commands\": [", directory), ScriptError);
	EXPECT_THROW(ParseScript("{}", directory), ScriptError);
	EXPECT_THROW(ParseScript(R"({"commands": [{"type": "assert_fancy", "line": 1}]})", directory),
		ScriptError);
	EXPECT_THROW(ParseScript(R"({"commands": [{"type": "action", "line": 1, "action": {"type": "invoke", "field": "f", "args": [{"type": "i32", "value": "12x"}]}}]})",
					 directory),
		ScriptError);
	EXPECT_THROW(ParseScript(R"({"commands": [{"type": "action", "line": 1, "action": {"type": "invoke", "field": "f", "args": [{"type": "i32", "value": "4294967296"}]}}]})",
					 directory),
		ScriptError);

	try {
		ParseScript(R"({"commands": [{"type": "action", "line": 9, "action": {"type": "invoke", "field": "f", "args": [{"type": "v128", "value": "0"}]}}]})",
			directory);
		FAIL() << "Expected ScriptError";
	} catch(const ScriptError& e) {
		EXPECT_EQ(e.Line(), 9u);
		EXPECT_NE(std::string(e.what()).find("v128"), std::string::npos);
	}
}

TEST(Script, SampleFixture) {
	auto commands = LoadScript(std::filesystem::path(WASTGEN_TEST_DATA_DIR) / "sample.json");
	ASSERT_EQ(commands.size(), 23u);
	EXPECT_TRUE(std::holds_alternative<Commands::Module>(commands.front().kind));
	EXPECT_TRUE(std::holds_alternative<Commands::AssertReturnCanonicalNan>(commands[11].kind));
	EXPECT_TRUE(std::holds_alternative<Commands::AssertReturnArithmeticNan>(commands[12].kind));
	EXPECT_TRUE(std::holds_alternative<Commands::AssertTrap>(commands[16].kind));
	EXPECT_TRUE(std::holds_alternative<Commands::AssertMalformed>(commands[18].kind));
	EXPECT_EQ(commands.back().line, 48u);
}
