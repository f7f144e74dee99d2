#pragma once

#include <diagnostic.hpp>

#include <fmt/format.h>

namespace diagnostic_db
{

#define db_entry(lv, name, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, __COUNTER__, txt); }

#define db_entry_arg(lv, name, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, txt) static const auto name = [](const source_range& range, auto t1, auto t2) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2)); }

#define db_entry_arg3(lv, name, txt) static const auto name = [](const source_range& range, auto t1, auto t2, auto t3) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2, t3)); }

namespace args
{

db_entry_arg(error, unknown_arg, "Unknown command line argument \"{}\".");
db_entry_arg(error, missing_value, "Command line argument \"{}\" expects a value.");
db_entry_arg(error, emit_not_present, "Selected emit class \"{}\" is unknown!");
db_entry_arg(error, not_a_number, "\"{}\" is not a number of cores.");
db_entry(error, num_cores_too_small, "Number of cores smaller than one.");
db_entry(warn, num_cores_too_large, "Number of cores bigger than the number of concurrent threads supported by the implementation.");
db_entry(error, output_with_many_files, "\"-o\" can only be used with a single source file, use \"-d\" instead.");

}

namespace input
{

db_entry_arg(error, not_an_asm_file, "\"{}\" is not an asm-file.");
db_entry_arg(error, cannot_open, "Cannot open \"{}\" for reading.");
db_entry_arg(error, cannot_write, "Cannot open \"{}\" for writing.");
db_entry_arg(warn, duplicate_file, "\"{}\" is given more than once, assembling it once.");

}

namespace assembler
{

db_entry(warn, empty_module, "Module does not contain any instruction.");
db_entry_arg2(error, unresolvable_instruction, "Error parsing instruction {}: \"{}\" is neither an address nor a compute instruction.");
db_entry_arg3(error, unresolved_symbol, "Error parsing instruction {} \"{}\": no symbol table to resolve \"{}\".");
db_entry_arg3(error, address_out_of_range, "Error parsing instruction {} \"{}\": address \"{}\" does not fit into 16 bits.");
db_entry_arg3(error, trailing_input, "Error parsing instruction {} \"{}\": unexpected \"{}\" after compute instruction.");
db_entry_arg2(warn, address_sets_compute_bit, "Instruction {} \"{}\" loads a value above 32767, the word reads as a compute instruction.");
db_entry_arg2(warn, label_redefined, "Label \"{}\" redefined, it now refers to instruction {}.");
db_entry_arg2(warn, label_shadows_predefined, "Label \"{}\" shadows a predefined symbol, it now refers to instruction {}.");
db_entry_arg(warn, variables_overflow, "{} variables do not fit below SCREEN, the last ones alias memory mapped I/O.");

}


#undef db_entry
#undef db_entry_arg
#undef db_entry_arg2
#undef db_entry_arg3

}
