#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <wastgen.hpp>

namespace {
	uint64_t MillisecondsSince(std::chrono::time_point<std::chrono::steady_clock> start) {
		auto stop = std::chrono::steady_clock::now();
		return std::chrono::duration_cast<std::chrono::milliseconds>(stop - start).count();
	}
}

int main(int argc, char** argv) {
	CLI::App app { "Generates GoogleTest suites from WebAssembly spec test scripts" };
	app.require_subcommand(1, 1);

	auto& generate_sub
		= *app.add_subcommand("generate", "Convert wast2json scripts into one C++ test file");
	std::vector<std::string> script_paths;
	generate_sub.add_option("scripts", script_paths, "Scripts written by wast2json (.json)");
	std::string spectests_dir;
	generate_sub.add_option(
		"--spectests-dir", spectests_dir, "Directory holding {suite}.json for every known suite");
	std::string output_path;
	generate_sub.add_option("-o,--output", output_path, "Generated test file (.cpp)");
	std::string out_dir;
	generate_sub
		.add_option("--out-dir", out_dir, "Directory spectests.cpp is written to when -o is not given")
		->envname("WASTGEN_OUT_DIR");
	uint64_t fat_threshold = Wastgen::FAT_TEST_THRESHOLD;
	generate_sub.add_option("--fat-threshold", fat_threshold, "Scripts with more commands are left out")
		->capture_default_str();
	unsigned int jobs = 1;
	generate_sub.add_option("-j,--jobs", jobs, "Scripts generated in parallel")
		->capture_default_str()
		->check(CLI::Range(1u, 256u));

	auto& stats_sub = *app.add_subcommand("stats", "Summarize wast2json scripts");
	std::vector<std::string> stats_paths;
	stats_sub.add_option("scripts", stats_paths, "Scripts written by wast2json (.json)")->required();
	stats_sub.add_option("--fat-threshold", fat_threshold, "Scripts with more commands are reported as too large")
		->capture_default_str();

	CLI11_PARSE(app, argc, argv);

	std::chrono::time_point<std::chrono::steady_clock> start;

	if(generate_sub) {
		std::vector<Wastgen::ScriptSource> sources;
		for(auto& path : script_paths) {
			sources.push_back({ std::filesystem::path(path).stem().string(), path });
		}
		if(!spectests_dir.empty()) {
			for(auto& suite : Wastgen::SPECTESTS) {
				sources.push_back({ suite, std::filesystem::path(spectests_dir) / (suite + ".json") });
			}
		}
		if(sources.empty()) {
			fmt::print(stderr, "No scripts given, pass paths or --spectests-dir\n");
			return 1;
		}

		if(output_path.empty()) {
			if(out_dir.empty()) {
				fmt::print(stderr, "No output given, pass -o, --out-dir or set WASTGEN_OUT_DIR\n");
				return 1;
			}
			output_path = (std::filesystem::path(out_dir) / "spectests.cpp").string();
		}

		// Written next to the destination and renamed once every script succeeded
		std::string temporary_path = output_path + ".tmp";
		std::ofstream out(temporary_path, std::ios::out | std::ios::binary);
		if(!out) {
			fmt::print(stderr, "Could not open {}\n", temporary_path);
			return 1;
		}

		start = std::chrono::steady_clock::now();
		size_t skipped = 0;
		bool failed    = false;
		try {
			Wastgen::BundleEmitter emitter(out, fat_threshold);
			skipped = emitter.GenerateAll(sources, jobs);
		} catch(std::exception& e) {
			// The failing script was already reported by GenerateAll
			fmt::print(stderr, "Generation stopped: {}\n", e.what());
			failed = true;
		}

		out.close();
		if(failed || !out) {
			std::error_code ignored;
			std::filesystem::remove(temporary_path, ignored);
			return 1;
		}

		std::error_code error;
		std::filesystem::rename(temporary_path, output_path, error);
		if(error) {
			fmt::print(stderr, "Could not write {}: {}\n", output_path, error.message());
			return 1;
		}

		fmt::print("Wrote {} ({} scripts, {} skipped, {}ms)\n", output_path, sources.size(), skipped,
			MillisecondsSince(start));
	} else if(stats_sub) {
		for(auto& path : stats_paths) {
			start = std::chrono::steady_clock::now();
			std::vector<Wastgen::Command> commands;
			try {
				commands = Wastgen::LoadScript(path);
			} catch(Wastgen::ScriptError& e) {
				fmt::print(stderr, "Failed to read {}: {}\n", path, e.what());
				return 1;
			}

			auto stats = Wastgen::Summarize(commands, fat_threshold);
			fmt::print("{} ({}ms)\n", path, MillisecondsSince(start));
			fmt::print("    commands: {}{}\n", stats.commands,
				stats.fat ? " (too large, left out by generate)" : "");
			fmt::print("    modules: {}\n", stats.modules);
			fmt::print("    actions and assertions: {}\n", stats.checks);
			fmt::print("    ignored: {}\n", stats.ignored);

			int module = 0;
			for(auto& command : commands) {
				auto* definition = std::get_if<Wastgen::Commands::Module>(&command.kind);
				if(!definition) {
					continue;
				}

				module++;
				std::vector<std::string> exported_functions;
				try {
					Wastgen::Wasm::GetExports(definition->binary.bytes, exported_functions);
				} catch(Wastgen::Wasm::DisassemblyError& e) {
					fmt::print(stderr, "    module {} (line {}): {}\n", module, command.line, e.what());
					return 1;
				}
				fmt::print("    module {} (line {}):\n", module, command.line);
				for(auto& name : exported_functions) {
					fmt::print("        {}\n", name);
				}
			}
		}
	}

	return 0;
}
