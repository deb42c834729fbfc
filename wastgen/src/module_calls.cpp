#include <wastgen/generator.hpp>

namespace Wastgen {
	void ModuleCalls::Register(int module, std::string unit) {
		calls[module].push_back(std::move(unit));
	}

	std::optional<Fragments::ModuleTest> ModuleCalls::Flush(int module) {
		auto entry = calls.find(module);
		if(entry == calls.end()) {
			return std::nullopt;
		}

		std::vector<std::string> units = std::move(entry->second);
		calls.erase(entry);
		if(units.empty()) {
			return std::nullopt;
		}
		return Fragments::ModuleTest { module, std::move(units) };
	}

	size_t ModuleCalls::Pending(int module) const {
		auto entry = calls.find(module);
		return entry == calls.end() ? 0 : entry->second.size();
	}
}
