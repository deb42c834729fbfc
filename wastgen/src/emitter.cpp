#include <wastgen/emitter.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <exception>
#include <thread>

#include <fmt/core.h>

namespace Wastgen {
	const std::string_view PREAMBLE = R"preamble(// C++ test file autogenerated by wastgen from the WebAssembly spec tests.
// Please do NOT modify it by hand, as it will be reset on next build.
#include <wastgen/wasm/runtime.hpp>

#include <gtest/gtest.h>

#include <bit>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string_view>
#include <vector>

using Wastgen::IsCanonicalNan;
using Wastgen::IsQuietNan;

static const char* IMPORT_MODULE = R"wast(
(module
  (func (export "print"))
  (func (export "print_i32") (param i32))
  (func (export "print_i64") (param i64))
  (func (export "print_f32") (param f32))
  (func (export "print_f64") (param f64))
  (func (export "print_i32_f32") (param i32 f32))
  (func (export "print_f64_f64") (param f64 f64))
  (table (export "table") 10 20 funcref)
  (memory (export "memory") 1 2)
  (global (export "global_i32") i32 (i32.const 666))
  (global (export "global_i64") i64 (i64.const 666))
  (global (export "global_f32") f32 (f32.const 666.6))
  (global (export "global_f64") f64 (f64.const 666.6)))
)wast";

// Every module is instantiated in a fresh store that already has "spectest" defined
std::shared_ptr<Wastgen::Wasm::Store> GenerateImports() {
	static const std::vector<uint8_t> wasm_binary = Wastgen::Wasm::Wat2Wasm(IMPORT_MODULE);
	auto store = std::make_shared<Wastgen::Wasm::Store>();
	Wastgen::Wasm::Instance imports(store, wasm_binary);
	imports.Register("spectest");
	return store;
}
)preamble";

	std::string SanitizeName(std::string_view name) {
		std::string out;
		for(char c : name) {
			out += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
		}
		if(out.empty() || std::isdigit(static_cast<unsigned char>(out.front()))) {
			out.insert(out.begin(), '_');
		}
		return out;
	}

	BundleEmitter::BundleEmitter(
		std::ostream& out, uint64_t fat_threshold, Wasm::Disassembler disassembler)
		: out(out)
		, fat_threshold { fat_threshold }
		, disassembler(std::move(disassembler)) {
		Append(PREAMBLE);
	}

	std::optional<std::string> BundleEmitter::Render(
		std::string_view test_name, const std::vector<Command>& commands) const {
		std::string name = SanitizeName(test_name);
		Generator generator("spectest_" + name, disassembler);
		generator.Consume(commands);

		if(generator.IsFat(fat_threshold)) {
			// Bounds the size and compile time of the generated file
			fmt::print(stderr, "Skipping {}: {} commands is over the limit of {}\n", test_name,
				generator.CommandCount(), fat_threshold);
			return std::nullopt;
		}

		return fmt::format("\nnamespace test_{} {{\n{}\n}}\n", name, generator.Finalize());
	}

	bool BundleEmitter::Generate(std::string_view test_name, const std::vector<Command>& commands) {
		auto block = Render(test_name, commands);
		if(!block) {
			return false;
		}
		Append(*block);
		return true;
	}

	size_t BundleEmitter::GenerateAll(const std::vector<ScriptSource>& sources, unsigned int jobs) {
		std::vector<std::optional<std::string>> blocks(sources.size());
		std::atomic<size_t> next { 0 };
		std::atomic<bool> failed { false };
		std::exception_ptr error;
		std::mutex log_mutex;

		auto worker = [&]() {
			while(!failed) {
				size_t index = next++;
				if(index >= sources.size()) {
					return;
				}

				auto& source = sources[index];
				auto start   = std::chrono::steady_clock::now();
				try {
					auto commands = LoadScript(source.path);
					blocks[index] = Render(source.name, commands);

					auto stop = std::chrono::steady_clock::now();
					std::lock_guard<std::mutex> lock(log_mutex);
					fmt::print("{} {}: {} commands ({}ms)\n", blocks[index] ? "Generated" : "Skipped",
						source.name, commands.size(),
						std::chrono::duration_cast<std::chrono::milliseconds>(stop - start).count());
				} catch(std::exception& e) {
					std::lock_guard<std::mutex> lock(log_mutex);
					fmt::print(stderr, "Failed to generate {}: {}\n", source.path.string(), e.what());
					if(!failed.exchange(true)) {
						error = std::current_exception();
					}
				}
			}
		};

		std::vector<std::thread> workers;
		for(unsigned int i = 1; i < jobs; i++) {
			workers.emplace_back(worker);
		}
		worker();
		for(auto& thread : workers) {
			thread.join();
		}

		if(error) {
			std::rethrow_exception(error);
		}

		// Threads finish in any order, the file must not
		size_t skipped = 0;
		for(auto& block : blocks) {
			if(block) {
				Append(*block);
			} else {
				skipped++;
			}
		}
		return skipped;
	}

	void BundleEmitter::Append(std::string_view block) {
		std::lock_guard<std::mutex> lock(out_mutex);
		out.write(block.data(), block.size());
		out.flush();
	}
}
