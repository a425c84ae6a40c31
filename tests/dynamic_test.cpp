#include <elfscan/dynamic.hpp>
#include <elfscan/error.hpp>

#include <gtest/gtest.h>

using namespace elfscan;

namespace {
constexpr std::string_view libc_output = R"(
Dynamic section at offset 0x1bbb40 contains 27 entries:
  Tag        Type                         Name/Value
 0x0000000000000001 (NEEDED)             Shared library: [ld-linux-x86-64.so.2]
 0x000000000000000e (SONAME)             Library soname: [libc.so.6]
 0x000000000000000c (INIT)               0x26950
 0x0000000000000019 (INIT_ARRAY)         0x1ba330
 0x000000000000001b (INIT_ARRAYSZ)       16 (bytes)
 0x0000000000000004 (HASH)               0x328
 0x000000006ffffef5 (GNU_HASH)           0x37f8
 0x0000000000000005 (STRTAB)             0x151e0
 0x0000000000000006 (SYMTAB)             0x7488
 0x000000000000000a (STRSZ)              24691 (bytes)
 0x000000000000000b (SYMENT)             24 (bytes)
 0x0000000000000003 (PLTGOT)             0x1bcbd0
 0x0000000000000002 (PLTRELSZ)           1152 (bytes)
 0x0000000000000014 (PLTREL)             RELA
 0x0000000000000017 (JMPREL)             0x24538
 0x0000000000000007 (RELA)               0x1c948
 0x0000000000000008 (RELASZ)             31728 (bytes)
 0x0000000000000009 (RELAENT)            24 (bytes)
 0x000000006ffffffc (VERDEF)             0x1c4c8
 0x000000006ffffffd (VERDEFNUM)          31
 0x000000000000001e (FLAGS)              BIND_NOW STATIC_TLS
 0x000000006ffffffb (FLAGS_1)            Flags: NOW
 0x000000006ffffffe (VERNEED)            0x1c918
 0x000000006fffffff (VERNEEDNUM)         1
 0x000000006ffffff0 (VERSYM)             0x1b254
 0x000000006ffffff9 (RELACOUNT)          1232
 0x0000000000000000 (NULL)               0x0
)";

constexpr std::string_view executable_output = R"(
Dynamic section at offset 0x2e10 contains 4 entries:
  Tag        Type                         Name/Value
 0x0000000000000001 (NEEDED)             Shared library: [libm.so.6]
 0x0000000000000001 (NEEDED)             Shared library: [libc.so.6]
 0x000000000000001d (RUNPATH)            Library runpath: [$ORIGIN/../lib]
 0x0000000000000000 (NULL)               0x0
)";

std::string with_sonames(std::initializer_list<std::string_view> values) {
  std::string text = "\nDynamic section at offset 0x2e10 contains 2 "
                     "entries:\n  Tag        Type                         "
                     "Name/Value\n";
  for (auto value : values) {
    text += " 0x000000000000000e (SONAME)             ";
    text += value;
    text += "\n";
  }
  text += " 0x0000000000000000 (NULL)               0x0\n";
  return text;
}
} // namespace

TEST(dynamic_report, parses_all_entries) {
  auto report = dynamic_report::from_output(libc_output);
  EXPECT_FALSE(report.parsing_failed());
  ASSERT_EQ(report.entries().size(), 27u);
  EXPECT_EQ(report.entries().front(),
            (dynamic_entry{"NEEDED", "Shared library: [ld-linux-x86-64.so.2]"}));
  EXPECT_EQ(report.entries().back(), (dynamic_entry{"NULL", "0x0"}));
  EXPECT_EQ(report["FLAGS"], std::vector<std::string>{"BIND_NOW STATIC_TLS"});
  EXPECT_EQ(report["STRSZ"], std::vector<std::string>{"24691 (bytes)"});
  EXPECT_TRUE(report["RPATH"].empty());
}

TEST(dynamic_report, derives_soname) {
  auto report = dynamic_report::from_output(libc_output);
  ASSERT_TRUE(report.soname());
  EXPECT_EQ(*report.soname(), "libc.so.6");
}

TEST(dynamic_report, lookup_keeps_order_of_repeated_keys) {
  auto report = dynamic_report::from_output(executable_output);
  EXPECT_EQ(report["NEEDED"],
            (std::vector<std::string>{"Shared library: [libm.so.6]",
                                      "Shared library: [libc.so.6]"}));
  EXPECT_EQ(report.needed(),
            (std::vector<std::string>{"libm.so.6", "libc.so.6"}));
  EXPECT_FALSE(report.soname());
}

TEST(dynamic_report, soname_requires_exactly_one_entry) {
  auto none = dynamic_report::from_output(with_sonames({}));
  EXPECT_FALSE(none.soname());

  auto one = dynamic_report::from_output(
      with_sonames({"Library soname: [libfoo.so.1]"}));
  ASSERT_TRUE(one.soname());
  EXPECT_EQ(*one.soname(), "libfoo.so.1");

  auto two = dynamic_report::from_output(with_sonames(
      {"Library soname: [libfoo.so.1]", "Library soname: [libbar.so.1]"}));
  EXPECT_FALSE(two.soname());
  EXPECT_EQ(two["SONAME"].size(), 2u);
}

TEST(dynamic_report, unexpected_soname_shape_throws) {
  EXPECT_THROW(dynamic_report::from_output(with_sonames({"libfoo.so.1"})),
               elfscan::exception);
  EXPECT_THROW(dynamic_report::from_output(
                   with_sonames({"Library soname: [libfoo.so.1"})),
               elfscan::exception);
  try {
    dynamic_report::from_output(with_sonames({"Library soname: libfoo"}));
    FAIL() << "expected elfscan::exception";
  } catch (const elfscan::exception &e) {
    EXPECT_EQ(e.code(), errc::unexpected_soname_format);
    EXPECT_EQ(e.code(), error_cause::format_error);
  }
}

TEST(dynamic_report, no_dynamic_section) {
  auto report = dynamic_report::from_output(
      "\nThere is no dynamic section in this file.\n");
  EXPECT_FALSE(report.parsing_failed());
  EXPECT_TRUE(report.entries().empty());
  EXPECT_FALSE(report.table_found());
  EXPECT_FALSE(report.soname());
}

TEST(dynamic_report, section_without_entries_is_found) {
  auto report = dynamic_report::from_output(R"(
Dynamic section at offset 0x2e10 contains 0 entries:
  Tag        Type                         Name/Value
)");
  EXPECT_TRUE(report.table_found());
  EXPECT_TRUE(report.entries().empty());
  EXPECT_TRUE(dynamic_report::from_output(libc_output).table_found());
}

TEST(dynamic_report, archive_entries_form_one_group) {
  constexpr std::string_view archive_output = R"(
File: libfoo.a(a.o)

Dynamic section at offset 0x100 contains 2 entries:
  Tag        Type                         Name/Value
 0x0000000000000001 (NEEDED)             Shared library: [liba.so.1]
 0x0000000000000000 (NULL)               0x0

File: libfoo.a(b.o)

Dynamic section at offset 0x100 contains 2 entries:
  Tag        Type                         Name/Value
 0x0000000000000001 (NEEDED)             Shared library: [libb.so.1]
 0x0000000000000000 (NULL)               0x0
)";
  auto report = dynamic_report::from_output(archive_output);
  EXPECT_EQ(report.entries().size(), 4u);
  EXPECT_EQ(report.needed(),
            (std::vector<std::string>{"liba.so.1", "libb.so.1"}));
}

TEST(dynamic_report, parsing_is_idempotent) {
  auto a = dynamic_report::from_output(libc_output);
  auto b = dynamic_report::from_output(libc_output);
  EXPECT_EQ(a.entries(), b.entries());
  EXPECT_EQ(a.soname(), b.soname());
}

TEST(dynamic_report, tool_failure_skips_derivation) {
  dynamic_report report("/nonexistent/libfoo.so.1", tool{"false"});
  EXPECT_TRUE(report.parsing_failed());
  EXPECT_EQ(report.error(), errc::tool_exit_failure);
  EXPECT_TRUE(report.entries().empty());
  EXPECT_FALSE(report.soname());
}
