#pragma once

#include <wastgen/generator.hpp>
#include <wastgen/script.hpp>
#include <wastgen/wasm/disassembler.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Wastgen {
	// Shared by every script in one output file: includes, NaN helpers and spectest imports
	extern const std::string_view PREAMBLE;

	// Valid identifier derived from a script name, like "left_to_right" for "left-to-right"
	std::string SanitizeName(std::string_view name);

	struct ScriptSource {
		// Test name, sanitized into the namespace and suite names
		std::string name;
		std::filesystem::path path;
	};

	class BundleEmitter {
	public:
		// Writes the preamble immediately
		BundleEmitter(std::ostream& out, uint64_t fat_threshold = FAT_TEST_THRESHOLD,
			Wasm::Disassembler disassembler = Wasm::Disassemble);

		// Returns false when the script was too large and left out. Safe to call from
		// several threads, blocks are never interleaved
		bool Generate(std::string_view test_name, const std::vector<Command>& commands);
		// The namespace block for one script without writing it, empty when it is fat
		std::optional<std::string> Render(
			std::string_view test_name, const std::vector<Command>& commands) const;

		// Loads and renders the scripts on up to jobs threads, then appends the blocks in
		// input order. On failure the first error is rethrown and nothing is appended.
		// Returns how many scripts were left out as fat
		size_t GenerateAll(const std::vector<ScriptSource>& sources, unsigned int jobs = 1);

	private:
		void Append(std::string_view block);

		std::ostream& out;
		uint64_t fat_threshold;
		Wasm::Disassembler disassembler;
		std::mutex out_mutex;
	};
}
