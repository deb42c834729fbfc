#pragma once

#include <wastgen/codec.hpp>
#include <wastgen/emitter.hpp>
#include <wastgen/fragments.hpp>
#include <wastgen/generator.hpp>
#include <wastgen/nan.hpp>
#include <wastgen/script.hpp>
#include <wastgen/value.hpp>
#include <wastgen/wasm/disassembler.hpp>

#include <string>
#include <vector>

namespace Wastgen {
	// Spec test suites converted by a default build, as wast2json outputs named {suite}.json
	static const std::vector<std::string> SPECTESTS {
		"address",
		"align",
		"binary",
		"block",
		"br",
		"br_if",
		"br_table",
		"break-drop",
		"call",
		"call_indirect",
		"comments",
		"const",
		"conversions",
		"custom",
		"data",
		"elem",
		"endianness",
		"exports",
		"f32",
		"f32_bitwise",
		"f32_cmp",
		"f64",
		"f64_bitwise",
		"f64_cmp",
		"fac",
		"float_exprs",
		"float_literals",
		"float_memory",
		"float_misc",
		"forward",
		"func",
		"func_ptrs",
		"get_local",
		"globals",
		"i32",
		"i64",
		"if",
		"int_exprs",
		"int_literals",
		"labels",
		"left-to-right",
		"loop",
		"memory",
		"memory_grow",
		"memory_redundancy",
		"memory_trap",
		"nop",
		"return",
		"select",
		"set_local",
		"stack",
		"start",
		"store_retval",
		"switch",
		"tee_local",
		"token",
		"traps",
		"typecheck",
		"types",
		"unwind",
	};
}
