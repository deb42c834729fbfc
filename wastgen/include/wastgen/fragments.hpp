#pragma once

#include <wastgen/script.hpp>
#include <wastgen/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Wastgen {
	// Pieces of generated code, rendered by Render. Names are already unique per script
	namespace Fragments {
		struct LineMarker {
			uint64_t line;
		};

		struct ModuleFactory {
			int module;
			std::string text;
			std::vector<uint8_t> binary;
		};

		struct StartHook {
			int module;
		};

		struct ActionUnit {
			std::string name;
			std::string field;
			std::vector<Value> args;
			std::optional<std::vector<Value>> expected;
		};

		enum class NanKind {
			CANONICAL,
			ARITHMETIC,
		};

		struct NanUnit {
			std::string name;
			std::string field;
			std::vector<Value> args;
			NanKind kind;
		};

		struct TrapTest {
			std::string name;
			int module;
			std::string unit;
			std::string message;
		};

		enum class CompileFailure {
			INVALID,
			MALFORMED,
		};

		struct CompileFailureTest {
			std::string name;
			ModuleBinary binary;
			CompileFailure reason;
		};

		struct ModuleTest {
			int module;
			std::vector<std::string> units;
		};

		struct Skipped {
			std::string reason;
		};
	}

	using Fragment = std::variant<Fragments::LineMarker, Fragments::ModuleFactory,
		Fragments::StartHook, Fragments::ActionUnit, Fragments::NanUnit, Fragments::TrapTest,
		Fragments::CompileFailureTest, Fragments::ModuleTest, Fragments::Skipped>;

	// suite is the GoogleTest suite name the script's tests are registered under
	std::string Render(const Fragment& fragment, const std::string& suite);
}
