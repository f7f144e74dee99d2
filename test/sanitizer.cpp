#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <sanitizer.hpp>

TEST_CASE( "Lines are sanitized", "[sanitizer]" ) {

  SECTION( "whitespace" ) {
    REQUIRE(hasm::sanitize_line("  D = D + 1 ") == "D=D+1");
    REQUIRE(hasm::sanitize_line("\tAM=M-1\r") == "AM=M-1");
    REQUIRE(hasm::sanitize_line("   ").empty());
    REQUIRE(hasm::sanitize_line("").empty());
  }

  SECTION( "no-break space" ) {
    REQUIRE(hasm::sanitize_line("D\xC2\xA0=\xC2\xA0M") == "D=M");
    REQUIRE(hasm::sanitize_line("\xC2\xA0@i\xC2\xA0// tail") == "@i");
    REQUIRE(hasm::sanitize_line("\xC2\xA0").empty());
  }

  SECTION( "comments" ) {
    REQUIRE(hasm::sanitize_line("@i // loop counter") == "@i");
    REQUIRE(hasm::sanitize_line("// only a comment").empty());
    REQUIRE(hasm::sanitize_line("0;JMP//jump // twice") == "0;JMP");
    // a single slash is not a comment
    REQUIRE(hasm::sanitize_line("D/M") == "D/M");
  }
}

TEST_CASE( "Empty lines are dropped", "[sanitizer]" ) {
  std::vector<std::string> lines = {
    "// Adds 1 + 2",
    "",
    "   @2",
    "D=A   // D = 2",
    "\t",
    "(END)",
  };
  auto sane = hasm::sanitize_lines(lines);

  REQUIRE(sane.size() == 3);
  REQUIRE(sane[0].text == "@2");
  REQUIRE(sane[0].row == 3);
  REQUIRE(sane[1].text == "D=A");
  REQUIRE(sane[1].row == 4);
  REQUIRE(sane[2].text == "(END)");
  REQUIRE(sane[2].row == 6);
}

TEST_CASE( "Label declarations", "[sanitizer]" ) {
  REQUIRE(hasm::is_label_declaration("(LOOP)"));
  REQUIRE(hasm::is_label_declaration("()"));
  REQUIRE_FALSE(hasm::is_label_declaration("(LOOP"));
  REQUIRE_FALSE(hasm::is_label_declaration("LOOP)"));
  REQUIRE_FALSE(hasm::is_label_declaration("("));
  REQUIRE_FALSE(hasm::is_label_declaration(""));
}
