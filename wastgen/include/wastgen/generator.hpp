#pragma once

#include <wastgen/fragments.hpp>
#include <wastgen/script.hpp>
#include <wastgen/wasm/disassembler.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Wastgen {
	// Scripts with more commands than this are left out of the generated tests
	constexpr uint64_t FAT_TEST_THRESHOLD = 200;

	// Units waiting to be run together against one instance of their module
	class ModuleCalls {
	public:
		// Order is kept, later commands may depend on state left by earlier ones
		void Register(int module, std::string unit);
		// Nothing is returned when no unit is pending
		std::optional<Fragments::ModuleTest> Flush(int module);
		size_t Pending(int module) const;

	private:
		std::map<int, std::vector<std::string>> calls;
	};

	// What generate would make of a script
	struct ScriptStats {
		size_t commands { 0 };
		size_t modules { 0 };
		// Actions and assertions that produce code
		size_t checks { 0 };
		size_t ignored { 0 };
		bool fat { false };
	};

	ScriptStats Summarize(
		const std::vector<Command>& commands, uint64_t fat_threshold = FAT_TEST_THRESHOLD);

	class Generator {
	public:
		Generator(std::string suite, Wasm::Disassembler disassembler = Wasm::Disassemble)
			: suite(std::move(suite))
			, disassembler(std::move(disassembler)) { }

		void Consume(const std::vector<Command>& commands);

		bool IsFat(uint64_t threshold = FAT_TEST_THRESHOLD) const {
			return command_count > threshold;
		}

		const std::string& Finalize() const {
			return buffer;
		}

		int LastModule() const {
			return last_module;
		}

		uint64_t CommandCount() const {
			return command_count;
		}

	private:
		struct Visitor;

		void VisitCommand(const CommandKind& kind);
		void VisitModule(const Commands::Module& command);
		void VisitAssertReturn(const Commands::AssertReturn& command);
		void VisitAssertReturnNan(const Action& action, Fragments::NanKind kind);
		void VisitAssertTrap(const Commands::AssertTrap& command);
		void VisitAssertCompileFailure(const ModuleBinary& binary, Fragments::CompileFailure reason);
		void VisitPerformAction(const Commands::PerformAction& command);
		std::optional<std::string> VisitAction(
			const Action& action, const std::vector<Value>* expected);
		// The invocation to emit, or nullptr for actions that produce no unit
		const InvokeAction* Invocation(const Action& action);

		// Fails for scripts that act before defining a module or name unknown modules
		bool TargetsCurrentModule(const std::optional<std::string>& module);
		std::string CommandName() const;
		void FlushModuleCalls(int module);
		void Emit(const Fragment& fragment);

		std::string suite;
		Wasm::Disassembler disassembler;
		int last_module { 0 };
		uint64_t last_line { 0 };
		uint64_t command_count { 0 };
		ModuleCalls module_calls;
		std::unordered_map<std::string, int> module_names;
		std::string buffer;
	};
}
