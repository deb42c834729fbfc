#pragma once

#include <wastgen/value.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Wastgen {
	class ScriptError : public std::runtime_error {
	public:
		ScriptError(uint64_t line, const std::string& message)
			: std::runtime_error(line ? "line " + std::to_string(line) + ": " + message : message)
			, line { line } { }

		uint64_t Line() const {
			return line;
		}

	private:
		uint64_t line;
	};

	struct ModuleBinary {
		enum Format {
			BINARY, // Encoded module
			TEXT,   // Quoted WAT source, only used by module assertions
		};

		Format format { BINARY };
		std::vector<uint8_t> bytes;
	};

	struct InvokeAction {
		// Defaults to the most recently defined module
		std::optional<std::string> module;
		std::string field;
		std::vector<Value> args;
	};

	struct GetAction {
		std::optional<std::string> module;
		std::string field;
	};

	using Action = std::variant<InvokeAction, GetAction>;

	namespace Commands {
		struct Module {
			ModuleBinary binary;
			std::optional<std::string> name;
		};

		struct AssertReturn {
			Action action;
			std::vector<Value> expected;
		};

		struct AssertReturnCanonicalNan {
			Action action;
		};

		struct AssertReturnArithmeticNan {
			Action action;
		};

		struct AssertTrap {
			Action action;
			std::string message;
		};

		struct AssertInvalid {
			ModuleBinary binary;
			std::string message;
		};

		struct AssertMalformed {
			ModuleBinary binary;
			std::string message;
		};

		struct AssertUninstantiable {
			ModuleBinary binary;
			std::string message;
		};

		struct AssertExhaustion {
			Action action;
			std::string message;
		};

		struct AssertUnlinkable {
			ModuleBinary binary;
			std::string message;
		};

		struct Register {
			std::optional<std::string> name;
			std::string as;
		};

		struct PerformAction {
			Action action;
		};
	}

	using CommandKind = std::variant<Commands::Module, Commands::AssertReturn,
		Commands::AssertReturnCanonicalNan, Commands::AssertReturnArithmeticNan,
		Commands::AssertTrap, Commands::AssertInvalid, Commands::AssertMalformed,
		Commands::AssertUninstantiable, Commands::AssertExhaustion, Commands::AssertUnlinkable,
		Commands::Register, Commands::PerformAction>;

	struct Command {
		uint64_t line { 0 };
		CommandKind kind;
	};

	// Reads the JSON written by wabt's wast2json, module files are resolved against directory
	std::vector<Command> ParseScript(std::string_view json, const std::filesystem::path& directory);
	std::vector<Command> LoadScript(const std::filesystem::path& path);
}
