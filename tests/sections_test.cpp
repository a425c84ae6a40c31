#include <elfscan/error.hpp>
#include <elfscan/sections.hpp>

#include <gtest/gtest.h>

using namespace elfscan;

namespace {
constexpr std::string_view object_output = R"(There are 12 section headers, starting at offset 0x268:

Section Headers:
  [Nr] Name              Type            Address          Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            0000000000000000 000000 000000 00      0   0  0
  [ 1] .text             PROGBITS        0000000000000000 000040 000015 00  AX  0   0  1
  [ 2] .rela.text        RELA            0000000000000000 0001d8 000018 18   I  9   1  8
  [ 3] .data             PROGBITS        0000000000000000 000055 000000 00  WA  0   0  1
  [ 4] .bss              NOBITS          0000000000000000 000055 000000 00  WA  0   0  1
  [ 5] .comment          PROGBITS        0000000000000000 000055 000041 01  MS  0   0  1
  [ 6] .note.GNU-stack   PROGBITS        0000000000000000 000096 000000 00      0   0  1
  [ 7] .eh_frame         PROGBITS        0000000000000000 000098 000038 00   A  0   0  8
  [ 8] .rela.eh_frame    RELA            0000000000000000 0001f0 000018 18   I  9   7  8
  [ 9] .symtab           SYMTAB          0000000000000000 0000d0 0000f0 18     10   8  8
  [10] .strtab           STRTAB          0000000000000000 0001c0 000011 00      0   0  1
  [11] .shstrtab         STRTAB          0000000000000000 000208 000059 00      0   0  1
Key to Flags:
  W (write), A (alloc), X (execute), M (merge), S (strings), I (info),
  L (link order), O (extra OS processing required), G (group), T (TLS),
  C (compressed), x (unknown), o (OS specific), E (exclude),
  l (large), p (processor specific)
)";

constexpr std::string_view archive_output = R"(
File: libfoo.a(a.o)
There are 4 section headers, starting at offset 0x100:

Section Headers:
  [Nr] Name              Type            Address          Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            0000000000000000 000000 000000 00      0   0  0
  [ 1] .text             PROGBITS        0000000000000000 000040 000010 00  AX  0   0  1
  [ 2] .shstrtab         STRTAB          0000000000000000 000050 000011 00      0   0  1
Key to Flags:
  W (write), A (alloc), X (execute), M (merge), S (strings), I (info),

File: libfoo.a(b.o)
There are 4 section headers, starting at offset 0x100:

Section Headers:
  [Nr] Name              Type            Address          Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            0000000000000000 000000 000000 00      0   0  0
  [ 1] .data             PROGBITS        0000000000000000 000040 000008 00  WA  0   0  8
  [ 2] .rela.data        RELA            0000000000000000 000048 000030 18   I  3   1  8
  [ 3] .shstrtab         STRTAB          0000000000000000 000078 000020 00      0   0  1
Key to Flags:
  W (write), A (alloc), X (execute), M (merge), S (strings), I (info),
)";

constexpr std::string_view non_pic_output = R"(Section Headers:
  [Nr] Name              Type            Address          Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            0000000000000000 000000 000000 00      0   0  0
  [ 1] .text             PROGBITS        0000000000401000 001000 0002ad 00  AX  0   0 16
  [ 2] .rela.plt         RELA            0000000000400418 000418 000018 18  AI  5  21  8
Key to Flags:
)";
} // namespace

TEST(section_report, parses_sizes_and_pic) {
  auto report = section_report::from_output(object_output);
  EXPECT_FALSE(report.parsing_failed());
  ASSERT_EQ(report.elf_files().size(), 1u);
  const auto &sections = report.elf_files()[0];
  ASSERT_EQ(sections.size(), 11u);
  EXPECT_EQ(sections[0], (section{".text", 21}));
  EXPECT_EQ(sections[1], (section{".rela.text", 24}));
  EXPECT_EQ(sections[8].name, ".symtab");
  EXPECT_EQ(sections[8].size, 0xf0u);
  EXPECT_TRUE(report.pic());
  EXPECT_EQ(report.skipped_lines(), 0u);
}

TEST(section_report, text_and_rela_text) {
  constexpr std::string_view excerpt = R"(Section Headers:
  [Nr] Name              Type            Address          Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            0000000000000000 000000 000000 00      0   0  0
  [ 1] .text             PROGBITS        0000000000000000 000040 000015 00  AX  0   0  1
  [ 2] .rela.text        RELA            0000000000000000 0001d8 000018 18   I  9   1  8
Key to Flags:
)";
  auto report = section_report::from_output(excerpt);
  ASSERT_EQ(report.elf_files().size(), 1u);
  EXPECT_EQ(report.elf_files()[0],
            (std::vector<section>{{".text", 21}, {".rela.text", 24}}));
  EXPECT_TRUE(report.pic());
}

TEST(section_report, archive_has_one_group_per_object) {
  auto report = section_report::from_output(archive_output);
  ASSERT_EQ(report.elf_files().size(), 2u);
  EXPECT_EQ(report.elf_files()[0].size(), 2u);
  EXPECT_EQ(report.elf_files()[1].size(), 3u);
  EXPECT_EQ(report.elf_files()[1][1], (section{".rela.data", 0x30}));
  // only the second object is PIC, the flag stays set for the whole report
  EXPECT_TRUE(report.pic());
}

TEST(section_report, rela_plt_is_not_pic) {
  auto report = section_report::from_output(non_pic_output);
  ASSERT_EQ(report.elf_files().size(), 1u);
  EXPECT_FALSE(report.pic());
}

TEST(section_report, rel_text_is_pic) {
  constexpr std::string_view excerpt = R"(Section Headers:
  [Nr] Name              Type            Addr     Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            00000000 000000 000000 00      0   0  0
  [ 1] .rel.text         REL             00000000 0001d8 000010 08   I  9   1  4
Key to Flags:
)";
  EXPECT_TRUE(section_report::from_output(excerpt).pic());
}

TEST(section_report, find_searches_all_objects) {
  auto report = section_report::from_output(archive_output);
  const section *sec = report.find(".data");
  ASSERT_NE(sec, nullptr);
  EXPECT_EQ(sec->size, 8u);
  EXPECT_EQ(report.find(".bss"), nullptr);
}

TEST(section_report, malformed_lines_are_skipped) {
  constexpr std::string_view excerpt = R"(Section Headers:
  [Nr] Name              Type            Address          Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            0000000000000000 000000 000000 00      0   0  0
  [ 1] .text             PROGBITS        0000000000000000 000040 000015 00  AX  0   0  1
  garbage without a bracket
  [ 2] .data             PROGBITS        0000000000000000 000055 000004 00  WA  0   0  1
Key to Flags:
)";
  auto report = section_report::from_output(excerpt);
  ASSERT_EQ(report.elf_files().size(), 1u);
  EXPECT_EQ(report.elf_files()[0],
            (std::vector<section>{{".text", 0x15}, {".data", 4}}));
  EXPECT_EQ(report.skipped_lines(), 1u);
}

TEST(section_report, no_table_yields_no_files) {
  auto report = section_report::from_output(
      "\nThere are no sections in this file.\n");
  EXPECT_FALSE(report.parsing_failed());
  EXPECT_TRUE(report.elf_files().empty());
  EXPECT_FALSE(report.table_found());
  EXPECT_FALSE(report.pic());
}

TEST(section_report, missing_table_differs_from_empty_table) {
  auto missing = section_report::from_output(
      "\nThere are no sections in this file.\n");
  EXPECT_FALSE(missing.table_found());

  constexpr std::string_view null_only = R"(Section Headers:
  [Nr] Name              Type            Address          Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            0000000000000000 000000 000000 00      0   0  0
Key to Flags:
)";
  auto empty = section_report::from_output(null_only);
  EXPECT_TRUE(empty.table_found());
  EXPECT_TRUE(empty.elf_files().empty());
  EXPECT_EQ(empty.skipped_lines(), 0u);

  EXPECT_TRUE(section_report::from_output(object_output).table_found());
}

TEST(section_report, parsing_is_idempotent) {
  auto a = section_report::from_output(archive_output);
  auto b = section_report::from_output(archive_output);
  EXPECT_EQ(a.elf_files(), b.elf_files());
  EXPECT_EQ(a.pic(), b.pic());
}

TEST(section_report, tool_failure_is_soft) {
  section_report report("/nonexistent/object.o", tool{"false"});
  EXPECT_TRUE(report.parsing_failed());
  EXPECT_EQ(report.error(), errc::tool_exit_failure);
  EXPECT_TRUE(report.elf_files().empty());
  EXPECT_FALSE(report.table_found());
  EXPECT_FALSE(report.pic());
}
