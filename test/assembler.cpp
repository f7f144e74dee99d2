#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <stream_lookup.hpp>
#include <diagnostic.hpp>
#include <assembler.hpp>

#include <sstream>
#include <cstdio>
#include <string>
#include <vector>

static const std::string add_asm =
  "// Computes R0 = 2 + 3\n"
  "\n"
  "@2\n"
  "D=A\n"
  "@3\n"
  "D=D+A\n"
  "@0\n"
  "M=D\n";

static const std::string max_asm =
  "   @R0\n"
  "   D=M              // D = first number\n"
  "   @R1\n"
  "   D=D-M            // D = first number - second number\n"
  "   @OUTPUT_FIRST\n"
  "   D;JGT            // if D>0 (first is greater) goto output_first\n"
  "   @R1\n"
  "   D=M              // D = second number\n"
  "   @OUTPUT_D\n"
  "   0;JMP            // goto output_d\n"
  "(OUTPUT_FIRST)\n"
  "   @R0\n"
  "   D=M              // D = first number\n"
  "(OUTPUT_D)\n"
  "   @R2\n"
  "   M=D              // M[2] = D (greatest number)\n"
  "(INFINITE_LOOP)\n"
  "   @INFINITE_LOOP\n"
  "   0;JMP            // infinite loop\n";

static const std::vector<std::string> max_hack = {
  "0000000000000000",
  "1111110000010000",
  "0000000000000001",
  "1111010011010000",
  "0000000000001010",
  "1110001100000001",
  "0000000000000001",
  "1111110000010000",
  "0000000000001100",
  "1110101010000111",
  "0000000000000000",
  "1111110000010000",
  "0000000000000010",
  "1110001100001000",
  "0000000000001110",
  "1110101010000111",
};

TEST_CASE( "Whole programs", "[assembler]" ) {

  SECTION( "without symbols" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code(add_asm);

    REQUIRE(prog.to_binary_lines() == std::vector<std::string>{
      "0000000000000010",
      "1110110000010000",
      "0000000000000011",
      "1110000010010000",
      "0000000000000000",
      "1110001100001000",
    });
    REQUIRE(prog.failed == 0);
    REQUIRE(diagnostic.empty());
  }

  SECTION( "labels with forward references" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code(max_asm);

    REQUIRE(prog.to_binary_lines() == max_hack);
    REQUIRE(prog.symbols.lookup("OUTPUT_FIRST") == hasm::address_type { 10 });
    REQUIRE(prog.symbols.lookup("OUTPUT_D") == hasm::address_type { 12 });
    REQUIRE(prog.symbols.lookup("INFINITE_LOOP") == hasm::address_type { 14 });
    REQUIRE(prog.symbols.variable_count() == 0);
    REQUIRE(diagnostic.empty());
  }

  SECTION( "label at the top" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code("(LOOP)\n@LOOP\n");

    REQUIRE(prog.to_binary_lines() == std::vector<std::string>{ "0000000000000000" });
  }

  SECTION( "variables in order of first use" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code(
      "@i\nM=1\n@sum\nM=0\n(LOOP)\n@i\nD=M\n@LOOP\n0;JMP\n@n\n");

    auto bin = prog.to_binary_lines();
    REQUIRE(bin.size() == 9);
    REQUIRE(bin[0] == "0000000000010000"); // i
    REQUIRE(bin[2] == "0000000000010001"); // sum
    REQUIRE(bin[4] == "0000000000010000"); // i again
    REQUIRE(bin[6] == "0000000000000100"); // LOOP is a label, not a variable
    REQUIRE(bin[8] == "0000000000010010"); // n
    REQUIRE(prog.symbols.variable_count() == 3);
  }

  SECTION( "instructions keep their position" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code("(A)\n@1\n\n// x\n(B)\nD=A\n@2\n");

    REQUIRE(prog.instructions.size() == 3);
    REQUIRE(prog.instructions[0].line_loc == 1);
    REQUIRE(prog.instructions[0].kind == hasm::instruction_kind::address);
    REQUIRE(prog.instructions[1].line_loc == 2);
    REQUIRE(prog.instructions[1].kind == hasm::instruction_kind::compute);
    REQUIRE(prog.instructions[2].line_loc == 3);
  }
}

TEST_CASE( "Assembling is deterministic", "[assembler]" ) {
  diagnostic.reset();
  auto first = hasm::assembler::parse_code(max_asm + "@x\n@y\n@x\n");
  auto second = hasm::assembler::parse_code(max_asm + "@x\n@y\n@x\n");

  std::stringstream a, b;
  first.write(a);
  second.write(b);

  REQUIRE(a.str() == b.str());
  REQUIRE(first.symbols_to_json() == second.symbols_to_json());
}

TEST_CASE( "Malformed lines are reported and skipped", "[assembler]" ) {
  diagnostic.reset();
  auto prog = hasm::assembler::parse_code(
    "@2\n"
    "(SKIP)\n"
    "D=A\n"
    "garbage here\n"
    "@3\n");

  REQUIRE(prog.to_binary_lines() == std::vector<std::string>{
    "0000000000000010",
    "1110110000010000",
    "0000000000000011",
  });
  REQUIRE(prog.failed == 1);
  REQUIRE(diagnostic.error_code() == 1);
  REQUIRE(diagnostic.count(diag_level::error) == 1);
}

TEST_CASE( "Errors name the failing line", "[assembler]" ) {
  diagnostic.reset();
  auto prog = hasm::assembler::parse_code("@1\n@70000\nD=M;JMPX\n", hasm::parse_options { true });
  REQUIRE(prog.failed == 2);

  std::FILE* tmp = std::tmpfile();
  REQUIRE(tmp != nullptr);
  diagnostic.print(tmp, false);
  std::rewind(tmp);

  std::string text;
  for(int ch = std::fgetc(tmp); ch != EOF; ch = std::fgetc(tmp))
    text.push_back(static_cast<char>(ch));
  std::fclose(tmp);

  REQUIRE(text.find("#TXT#:2:1:") != std::string::npos);
  REQUIRE(text.find("Error parsing instruction 2 \"@70000\": address \"70000\"") != std::string::npos);
  REQUIRE(text.find("Error parsing instruction 3 \"D=M;JMPX\": unexpected \"X\"") != std::string::npos);
}

TEST_CASE( "Strict mode", "[assembler]" ) {
  diagnostic.reset();
  auto lenient = hasm::assembler::parse_code("D=M\nMemory=Address\n");
  REQUIRE(lenient.instructions.size() == 2);
  REQUIRE(diagnostic.empty());

  auto strict = hasm::assembler::parse_code("D=M\nMemory=Address\n", hasm::parse_options { true });
  REQUIRE(strict.instructions.size() == 1);
  REQUIRE(strict.failed == 1);
  REQUIRE(diagnostic.error_code() == 1);
}

TEST_CASE( "Warnings", "[assembler]" ) {

  SECTION( "redefined labels" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code("(SCREEN)\n@SCREEN\n(X)\n(X)\n0;JMP\n");

    REQUIRE(prog.to_binary_lines() == std::vector<std::string>{ "0000000000000000", "1110101010000111" });
    REQUIRE(diagnostic.count(diag_level::warn) == 2);
    REQUIRE(diagnostic.error_code() == 0);
  }

  SECTION( "empty module" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code("// nothing\n\n(END)\n");

    REQUIRE(prog.instructions.empty());
    REQUIRE(diagnostic.count(diag_level::warn) == 1);
    REQUIRE(diagnostic.error_code() == 0);
  }

  SECTION( "literal above 32767" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse_code("@32767\n@40000\n@65535\n");

    REQUIRE(prog.to_binary_lines() == std::vector<std::string>{
      "0111111111111111",
      "1001110001000000",
      "1111111111111111",
    });
    REQUIRE(prog.failed == 0);
    REQUIRE(diagnostic.count(diag_level::warn) == 2);
    REQUIRE(diagnostic.error_code() == 0);
  }

  SECTION( "too many variables" ) {
    diagnostic.reset();
    std::string src;
    for(std::size_t i = hasm::first_variable_address; i <= hasm::screen_address; ++i)
      src += "@v" + std::to_string(i) + "\n";
    auto prog = hasm::assembler::parse_code(src);

    REQUIRE(prog.instructions.back().binary == "0100000000000000");
    REQUIRE(diagnostic.count(diag_level::warn) == 1);
  }
}

TEST_CASE( "Reading modules", "[assembler]" ) {

  SECTION( "test stream" ) {
    diagnostic.reset();
    stream_lookup.write_test("@R2\r\nD=A\r\n");
    auto prog = hasm::assembler::parse("TESTSTREAM");

    REQUIRE(prog.has_value());
    REQUIRE(prog->to_binary_lines() == std::vector<std::string>{ "0000000000000010", "1110110000010000" });
    REQUIRE(diagnostic.empty());
  }

  SECTION( "missing file" ) {
    diagnostic.reset();
    auto prog = hasm::assembler::parse("/nonexistent/dir/prog.asm");

    REQUIRE_FALSE(prog.has_value());
    REQUIRE(diagnostic.error_code() == 1);
  }
}
