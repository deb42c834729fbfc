#include <wastgen/generator.hpp>

#include <fmt/core.h>

namespace Wastgen {
	// Every command kind needs an overload here, std::visit rejects the variant otherwise
	struct Generator::Visitor {
		Generator& generator;

		void operator()(const Commands::Module& command) {
			generator.VisitModule(command);
		}

		void operator()(const Commands::AssertReturn& command) {
			generator.VisitAssertReturn(command);
		}

		void operator()(const Commands::AssertReturnCanonicalNan& command) {
			generator.VisitAssertReturnNan(command.action, Fragments::NanKind::CANONICAL);
		}

		void operator()(const Commands::AssertReturnArithmeticNan& command) {
			generator.VisitAssertReturnNan(command.action, Fragments::NanKind::ARITHMETIC);
		}

		void operator()(const Commands::AssertTrap& command) {
			generator.VisitAssertTrap(command);
		}

		void operator()(const Commands::AssertInvalid& command) {
			generator.VisitAssertCompileFailure(command.binary, Fragments::CompileFailure::INVALID);
		}

		void operator()(const Commands::AssertMalformed& command) {
			generator.VisitAssertCompileFailure(command.binary, Fragments::CompileFailure::MALFORMED);
		}

		void operator()(const Commands::AssertUninstantiable&) {
			// Do nothing for now
		}

		void operator()(const Commands::AssertExhaustion&) {
			// Do nothing for now
		}

		void operator()(const Commands::AssertUnlinkable&) {
			// Do nothing for now
		}

		void operator()(const Commands::Register&) {
			// Do nothing for now, every module only links against spectest
		}

		void operator()(const Commands::PerformAction& command) {
			generator.VisitPerformAction(command);
		}
	};

	namespace {
		struct CommandCounter {
			ScriptStats& stats;

			void operator()(const Commands::Module&) {
				stats.modules++;
			}

			void operator()(const Commands::AssertUninstantiable&) {
				stats.ignored++;
			}

			void operator()(const Commands::AssertExhaustion&) {
				stats.ignored++;
			}

			void operator()(const Commands::AssertUnlinkable&) {
				stats.ignored++;
			}

			void operator()(const Commands::Register&) {
				stats.ignored++;
			}

			template <typename T> void operator()(const T&) {
				stats.checks++;
			}
		};
	}

	ScriptStats Summarize(const std::vector<Command>& commands, uint64_t fat_threshold) {
		ScriptStats stats;
		stats.commands = commands.size();
		// Every command counts towards the limit, ignored ones included
		stats.fat = commands.size() > fat_threshold;
		for(auto& command : commands) {
			std::visit(CommandCounter { stats }, command.kind);
		}
		return stats;
	}

	void Generator::Consume(const std::vector<Command>& commands) {
		for(auto& command : commands) {
			last_line = command.line;
			command_count++;
			Emit(Fragments::LineMarker { last_line });
			VisitCommand(command.kind);
		}

		for(int module = 1; module <= last_module; module++) {
			FlushModuleCalls(module);
		}
	}

	void Generator::VisitCommand(const CommandKind& kind) {
		std::visit(Visitor { *this }, kind);
	}

	std::string Generator::CommandName() const {
		return fmt::format("c{}_l{}", command_count, last_line);
	}

	void Generator::Emit(const Fragment& fragment) {
		buffer += Render(fragment, suite);
	}

	void Generator::FlushModuleCalls(int module) {
		if(auto test = module_calls.Flush(module)) {
			Emit(*test);
		}
	}

	bool Generator::TargetsCurrentModule(const std::optional<std::string>& module) {
		if(last_module == 0) {
			throw ScriptError(last_line, "action before any module was defined");
		}
		if(!module) {
			return true;
		}

		auto entry = module_names.find(*module);
		if(entry == module_names.end()) {
			throw ScriptError(last_line, "action on unknown module " + *module);
		}
		return entry->second == last_module;
	}

	void Generator::VisitModule(const Commands::Module& command) {
		// The text is only embedded for debugging, but failing to produce it means the
		// binary is corrupt
		std::string text = disassembler(command.binary.bytes);

		FlushModuleCalls(last_module);
		last_module++;
		if(command.name) {
			module_names[*command.name] = last_module;
		}

		Emit(Fragments::ModuleFactory { last_module, std::move(text), command.binary.bytes });

		// We set the start call to the module
		Emit(Fragments::StartHook { last_module });
		module_calls.Register(last_module, fmt::format("start_module_{}", last_module));
	}

	const InvokeAction* Generator::Invocation(const Action& action) {
		auto* invoke = std::get_if<InvokeAction>(&action);
		if(!invoke) {
			// Reading globals is not supported yet
			return nullptr;
		}

		if(!TargetsCurrentModule(invoke->module)) {
			Emit(Fragments::Skipped { fmt::format(
				"{} invokes \"{}\" on {}, which is no longer the current module", CommandName(),
				invoke->field, *invoke->module) });
			fmt::print(stderr, "{}: skipping line {}, module {} is no longer current\n", suite,
				last_line, *invoke->module);
			return nullptr;
		}
		return invoke;
	}

	std::optional<std::string> Generator::VisitAction(
		const Action& action, const std::vector<Value>* expected) {
		auto* invoke = Invocation(action);
		if(!invoke) {
			return std::nullopt;
		}

		std::string name = fmt::format("{}_action_invoke", CommandName());
		std::optional<std::vector<Value>> expected_values;
		if(expected) {
			expected_values = *expected;
		}

		Emit(Fragments::ActionUnit { name, invoke->field, invoke->args, std::move(expected_values) });
		return name;
	}

	void Generator::VisitAssertReturn(const Commands::AssertReturn& command) {
		if(auto name = VisitAction(command.action, &command.expected)) {
			module_calls.Register(last_module, std::move(*name));
		}
	}

	void Generator::VisitPerformAction(const Commands::PerformAction& command) {
		if(auto name = VisitAction(command.action, nullptr)) {
			module_calls.Register(last_module, std::move(*name));
		}
	}

	void Generator::VisitAssertReturnNan(const Action& action, Fragments::NanKind kind) {
		auto* invoke = Invocation(action);
		if(!invoke) {
			return;
		}

		std::string name = fmt::format("{}_{}", CommandName(),
			kind == Fragments::NanKind::CANONICAL ? "assert_return_canonical_nan"
												  : "assert_return_arithmetic_nan");
		Emit(Fragments::NanUnit { name, invoke->field, invoke->args, kind });
		module_calls.Register(last_module, std::move(name));
	}

	void Generator::VisitAssertTrap(const Commands::AssertTrap& command) {
		auto unit = VisitAction(command.action, nullptr);
		if(!unit) {
			return;
		}

		// Not registered: a trap may leave memory and globals unusable for later calls
		Emit(Fragments::TrapTest {
			fmt::format("{}_assert_trap", CommandName()), last_module, *unit, command.message });
	}

	void Generator::VisitAssertCompileFailure(
		const ModuleBinary& binary, Fragments::CompileFailure reason) {
		std::string name = fmt::format("{}_{}", CommandName(),
			reason == Fragments::CompileFailure::INVALID ? "assert_invalid" : "assert_malformed");
		Emit(Fragments::CompileFailureTest { std::move(name), binary, reason });
	}
}
