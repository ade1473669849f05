#include <gtest/gtest.h>
#include "fsgate/filesystem_ops.hpp"
#include "fsgate/error.hpp"
#include "test_fixtures.hpp"
#include <filesystem>

using namespace fsgate;
using fsgate::testing::TempDir;
using fsgate::testing::make_config;

namespace fs = std::filesystem;

namespace {

/// Filesystem operations sandboxed to <tmp>/root, with <tmp>/outside beside it.
class Sandbox {
public:
    explicit Sandbox(bool write_enabled)
        : root(tmp.mkdir("root")),
          outside(tmp.mkdir("outside")),
          config(make_config(root, write_enabled)),
          normalizer(config),
          policy(config),
          ops(config, normalizer, policy) {}

    TempDir tmp;
    std::string root;
    std::string outside;
    ServerConfig config;
    PathNormalizer normalizer;
    PathSecurityPolicy policy;
    FilesystemOperations ops;
};

} // namespace

class FilesystemOpsTest : public ::testing::Test {
protected:
    Sandbox rw{true};
    Sandbox ro{false};
};

// ---- read / write ----

TEST_F(FilesystemOpsTest, WriteThenReadRoundTrip) {
    auto result = rw.ops.write_file(rw.root + "/a.txt", "hello");
    EXPECT_EQ(result.path, rw.root + "/a.txt");
    EXPECT_EQ(result.size, 5u);
    EXPECT_FALSE(result.backup.has_value());

    nlohmann::json j = result;
    EXPECT_TRUE(j["backup"].is_null());

    EXPECT_EQ(rw.ops.read_file(rw.root + "/a.txt"), "hello");
}

TEST_F(FilesystemOpsTest, RelativePathsResolveAgainstProjectRoot) {
    rw.ops.write_file("notes/../b.txt", "x");
    EXPECT_EQ(rw.tmp.read("root/b.txt"), "x");
    EXPECT_EQ(rw.ops.read_file("b.txt"), "x");
}

TEST_F(FilesystemOpsTest, WriteBackup) {
    rw.tmp.write("root/c.txt", "old");
    auto result = rw.ops.write_file(rw.root + "/c.txt", "new", "UTF-8", true);
    ASSERT_TRUE(result.backup.has_value());
    EXPECT_EQ(*result.backup, rw.root + "/c.txt.backup");
    EXPECT_EQ(rw.tmp.read("root/c.txt.backup"), "old");
    EXPECT_EQ(rw.tmp.read("root/c.txt"), "new");
}

TEST_F(FilesystemOpsTest, WriteLatin1) {
    rw.ops.write_file(rw.root + "/l.txt", "caf\xC3\xA9", "ISO-8859-1");
    EXPECT_EQ(rw.tmp.read("root/l.txt"), "caf\xE9");
    EXPECT_EQ(rw.ops.read_file(rw.root + "/l.txt", "ISO-8859-1"), "caf\xC3\xA9");
}

TEST_F(FilesystemOpsTest, WriteDisabled) {
    EXPECT_THROW(ro.ops.write_file(ro.root + "/a.txt", "x"), SecurityError);
    EXPECT_FALSE(fs::exists(ro.root + "/a.txt"));
}

TEST_F(FilesystemOpsTest, WriteOutsideDenied) {
    EXPECT_THROW(rw.ops.write_file(rw.outside + "/x.txt", "x"), SecurityError);
    EXPECT_THROW(rw.ops.write_file(rw.root + "/../outside/x.txt", "x"), SecurityError);
    EXPECT_FALSE(fs::exists(rw.outside + "/x.txt"));
}

TEST_F(FilesystemOpsTest, WriteMissingParent) {
    EXPECT_THROW(rw.ops.write_file(rw.root + "/no/such/dir/f.txt", "x"), NotFoundError);
}

TEST_F(FilesystemOpsTest, ReadErrors) {
    EXPECT_THROW((void)rw.ops.read_file(rw.root + "/missing.txt"), NotFoundError);
    EXPECT_THROW((void)rw.ops.read_file(rw.root), InvalidArgumentError);
    EXPECT_THROW((void)rw.ops.read_file(rw.outside + "/x"), SecurityError);
    EXPECT_THROW((void)rw.ops.read_file(""), FormatError);
    EXPECT_THROW((void)rw.ops.read_file(rw.root + "/a.txt", "KOI8-R"), InvalidArgumentError);
}

TEST_F(FilesystemOpsTest, ReadTooLarge) {
    rw.config.max_file_size_mb = 1;
    rw.tmp.write("root/big.bin", std::string(1024 * 1024 + 1, 'x'));
    EXPECT_THROW((void)rw.ops.read_file(rw.root + "/big.bin"), InvalidArgumentError);
}

// ---- list ----

TEST_F(FilesystemOpsTest, ListFlatSorted) {
    rw.tmp.write("root/b.txt", "bb");
    rw.tmp.write("root/a.cpp", "a");
    rw.tmp.mkdir("root/sub");
    rw.tmp.write("root/sub/deep.txt", "d");

    auto entries = rw.ops.list_directory(rw.root);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a.cpp");
    EXPECT_EQ(entries[1].name, "b.txt");
    EXPECT_EQ(entries[1].size, 2u);
    EXPECT_EQ(entries[1].type, "file");
    EXPECT_EQ(entries[2].type, "directory");
    EXPECT_TRUE(entries[1].readable);
    EXPECT_GT(entries[1].last_modified, 0);
}

TEST_F(FilesystemOpsTest, ListPatternAndRecursive) {
    rw.tmp.write("root/a.txt", "");
    rw.tmp.write("root/b.md", "");
    rw.tmp.write("root/sub/c.txt", "");

    auto flat = rw.ops.list_directory(rw.root, std::string(R"(.*\.txt)"));
    ASSERT_EQ(flat.size(), 1u);
    EXPECT_EQ(flat[0].name, "a.txt");

    auto deep = rw.ops.list_directory(rw.root, std::string(R"(.*\.txt)"), true);
    ASSERT_EQ(deep.size(), 2u);
    EXPECT_EQ(deep[1].path, rw.root + "/sub/c.txt");
}

TEST_F(FilesystemOpsTest, ListInvalidPatternMatchesLiterally) {
    rw.tmp.write("root/weird[.txt", "");
    rw.tmp.write("root/normal.txt", "");
    auto entries = rw.ops.list_directory(rw.root, std::string("weird[.txt"));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "weird[.txt");
}

TEST_F(FilesystemOpsTest, ListErrors) {
    rw.tmp.write("root/f.txt", "");
    EXPECT_THROW((void)rw.ops.list_directory(rw.root + "/nope"), NotFoundError);
    EXPECT_THROW((void)rw.ops.list_directory(rw.root + "/f.txt"), InvalidArgumentError);
    EXPECT_THROW((void)rw.ops.list_directory(rw.outside), SecurityError);
}

// ---- search ----

TEST_F(FilesystemOpsTest, SearchDefaultPatternIsCppSources) {
    rw.tmp.write("root/main.cpp", "int main() {\n  return 0;\n}\n");
    rw.tmp.write("root/util.hpp", "// return helpers\n");
    rw.tmp.write("root/readme.txt", "return of the text\n");

    auto hits = rw.ops.search_files(rw.root, "return");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].name, "main.cpp");
    ASSERT_EQ(hits[0].matches.size(), 1u);
    EXPECT_EQ(hits[0].matches[0].line_number, 2u);
    EXPECT_EQ(hits[0].matches[0].line, "  return 0;");
    EXPECT_EQ(hits[1].name, "util.hpp");
}

TEST_F(FilesystemOpsTest, SearchCustomFilePatternAndTruncation) {
    rw.config.max_line_length = 10;
    rw.tmp.write("root/notes.txt", "match here and more\nno\n" + std::string(40, 'm') + " match\n");

    auto hits = rw.ops.search_files(rw.root, "match", std::string(R"(.*\.txt)"));
    ASSERT_EQ(hits.size(), 1u);
    // Text past max_line_length is never searched
    ASSERT_EQ(hits[0].matches.size(), 1u);
    EXPECT_EQ(hits[0].matches[0].line_number, 1u);
    EXPECT_EQ(hits[0].matches[0].line, std::string("match here") + std::string(FilesystemOperations::TRUNCATION_MARKER));
}

TEST_F(FilesystemOpsTest, SearchVeryLongLine) {
    rw.tmp.write("root/huge.txt", std::string(100000, 'a') + "c\nac\n");

    auto hits = rw.ops.search_files(rw.root, "(a|b)*c", std::string(R"(.*\.txt)"));
    ASSERT_EQ(hits.size(), 1u);
    ASSERT_EQ(hits[0].matches.size(), 1u);
    EXPECT_EQ(hits[0].matches[0].line_number, 2u);
    EXPECT_EQ(hits[0].matches[0].line, "ac");

    auto greedy = rw.ops.search_files(rw.root, "a+", std::string(R"(.*\.txt)"));
    ASSERT_EQ(greedy.size(), 1u);
    ASSERT_EQ(greedy[0].matches.size(), 2u);
    const std::string& first = greedy[0].matches[0].line;
    EXPECT_EQ(first.size(), rw.config.max_line_length + FilesystemOperations::TRUNCATION_MARKER.size());
    EXPECT_EQ(first.substr(rw.config.max_line_length), std::string(FilesystemOperations::TRUNCATION_MARKER));
}

TEST_F(FilesystemOpsTest, OverlongPatternRejected) {
    rw.tmp.write("root/a.cpp", "x\n");
    std::string pattern(FilesystemOperations::MAX_PATTERN_LENGTH + 1, 'x');
    EXPECT_THROW((void)rw.ops.search_files(rw.root, pattern), InvalidArgumentError);
    EXPECT_THROW((void)rw.ops.grep_file(rw.root + "/a.cpp", pattern), InvalidArgumentError);
    EXPECT_NO_THROW((void)rw.ops.search_files(rw.root, std::string(FilesystemOperations::MAX_PATTERN_LENGTH, 'x')));
}

TEST_F(FilesystemOpsTest, SearchCapsResults) {
    rw.config.max_search_results = 2;
    for (int i = 0; i < 5; ++i) {
        rw.tmp.write("root/f" + std::to_string(i) + ".cpp", "needle\n");
    }
    EXPECT_EQ(rw.ops.search_files(rw.root, "needle").size(), 2u);
}

// ---- normalize ----

TEST_F(FilesystemOpsTest, NormalizePathNeedsNoPermission) {
    auto r = ro.ops.normalize_path("C:\\Temp\\x");
    EXPECT_EQ(r.normalized, "/mnt/c/Temp/x");
    EXPECT_EQ(r.windows, "C:/Temp/x");
}

// ---- copy / move ----

TEST_F(FilesystemOpsTest, CopyAndOverwrite) {
    rw.tmp.write("root/src.txt", "source");
    rw.tmp.write("root/dst.txt", "existing");

    EXPECT_THROW(rw.ops.copy_file(rw.root + "/src.txt", rw.root + "/dst.txt"), InvalidArgumentError);
    EXPECT_EQ(rw.tmp.read("root/dst.txt"), "existing");

    auto result = rw.ops.copy_file(rw.root + "/src.txt", rw.root + "/dst.txt", true);
    EXPECT_EQ(result.size, 6u);
    EXPECT_EQ(rw.tmp.read("root/dst.txt"), "source");
    EXPECT_EQ(rw.tmp.read("root/src.txt"), "source");
}

TEST_F(FilesystemOpsTest, CopyErrors) {
    rw.tmp.write("root/src.txt", "s");
    EXPECT_THROW(rw.ops.copy_file(rw.root + "/nope.txt", rw.root + "/x.txt"), NotFoundError);
    EXPECT_THROW(rw.ops.copy_file(rw.root + "/src.txt", rw.outside + "/x.txt"), SecurityError);
    EXPECT_THROW(ro.ops.copy_file(ro.root + "/src.txt", ro.root + "/x.txt"), SecurityError);
}

TEST_F(FilesystemOpsTest, Move) {
    rw.tmp.write("root/m.txt", "move me");
    auto result = rw.ops.move_file(rw.root + "/m.txt", rw.root + "/moved.txt");
    EXPECT_EQ(result.destination, rw.root + "/moved.txt");
    EXPECT_FALSE(fs::exists(rw.root + "/m.txt"));
    EXPECT_EQ(rw.tmp.read("root/moved.txt"), "move me");

    rw.tmp.write("root/other.txt", "o");
    EXPECT_THROW(rw.ops.move_file(rw.root + "/other.txt", rw.root + "/moved.txt"), InvalidArgumentError);
    rw.ops.move_file(rw.root + "/other.txt", rw.root + "/moved.txt", true);
    EXPECT_EQ(rw.tmp.read("root/moved.txt"), "o");
}

// ---- delete / mkdir ----

TEST_F(FilesystemOpsTest, DeleteFile) {
    rw.tmp.write("root/d.txt", "x");
    auto result = rw.ops.delete_file(rw.root + "/d.txt");
    EXPECT_TRUE(result.deleted);
    EXPECT_FALSE(fs::exists(rw.root + "/d.txt"));
    EXPECT_THROW(rw.ops.delete_file(rw.root + "/d.txt"), NotFoundError);
}

TEST_F(FilesystemOpsTest, DeleteOutsideDeniedAndFileKept) {
    rw.tmp.write("outside/keep.txt", "k");
    EXPECT_THROW(rw.ops.delete_file(rw.outside + "/keep.txt"), SecurityError);
    EXPECT_TRUE(fs::exists(rw.outside + "/keep.txt"));
}

TEST_F(FilesystemOpsTest, DeleteDirectory) {
    rw.tmp.write("root/tree/a/b/c.txt", "x");
    rw.tmp.write("root/tree/top.txt", "x");
    EXPECT_THROW(rw.ops.delete_file(rw.root + "/tree"), InvalidArgumentError);
    EXPECT_TRUE(fs::exists(rw.root + "/tree/top.txt"));

    auto result = rw.ops.delete_file(rw.root + "/tree", true);
    EXPECT_TRUE(result.deleted);
    EXPECT_FALSE(fs::exists(rw.root + "/tree"));

    rw.tmp.mkdir("root/empty");
    EXPECT_TRUE(rw.ops.delete_file(rw.root + "/empty").deleted);
}

TEST_F(FilesystemOpsTest, CreateDirectory) {
    auto result = rw.ops.create_directory(rw.root + "/x/y/z");
    EXPECT_TRUE(result.created);
    EXPECT_TRUE(result.exists);
    EXPECT_TRUE(fs::is_directory(rw.root + "/x/y/z"));

    auto again = rw.ops.create_directory(rw.root + "/x/y/z");
    EXPECT_FALSE(again.created);
    EXPECT_TRUE(again.exists);

    rw.tmp.write("root/file", "");
    EXPECT_THROW(rw.ops.create_directory(rw.root + "/file"), InvalidArgumentError);
    EXPECT_THROW(ro.ops.create_directory(ro.root + "/n"), SecurityError);
}

// ---- info / watch ----

TEST_F(FilesystemOpsTest, FileInfo) {
    rw.tmp.write("root/i.txt", "1234");
    auto info = rw.ops.get_file_info(rw.root + "/i.txt");
    EXPECT_EQ(info.type, "file");
    EXPECT_EQ(info.size, 4u);
    EXPECT_EQ(info.name, "i.txt");

    nlohmann::json j = info;
    EXPECT_TRUE(j.contains("lastModified"));
    EXPECT_FALSE(j.contains("error"));

    EXPECT_THROW((void)rw.ops.get_file_info(rw.root + "/nope"), NotFoundError);
}

TEST_F(FilesystemOpsTest, WatchAndPoll) {
    auto before = rw.ops.poll_directory_watch(rw.root);
    EXPECT_FALSE(before.watching);

    auto reg = rw.ops.watch_directory(rw.root, {"CREATE", "CREATE", "DELETE"});
    EXPECT_EQ(reg.event_types, (std::vector<std::string>{"CREATE", "DELETE"}));
    EXPECT_EQ(reg.mode, "poll");

    auto after = rw.ops.poll_directory_watch(rw.root);
    EXPECT_TRUE(after.watching);
    EXPECT_TRUE(after.events.empty());

    auto defaults = rw.ops.watch_directory(rw.root);
    EXPECT_EQ(defaults.event_types.size(), 3u);

    EXPECT_THROW(rw.ops.watch_directory(rw.root, {"RENAME"}), InvalidArgumentError);
    EXPECT_THROW(rw.ops.watch_directory(rw.outside), SecurityError);
}

TEST_F(FilesystemOpsTest, AllowedDirectories) {
    EXPECT_EQ(rw.ops.allowed_directories(), std::vector<std::string>{rw.root});
    EXPECT_FALSE(rw.ops.symlinks_allowed());
}

// ---- line-oriented reads ----

TEST_F(FilesystemOpsTest, ReadFileRange) {
    rw.tmp.write("root/five.txt", "1\n2\n3\n4\n5\n");

    auto mid = rw.ops.read_file_range(rw.root + "/five.txt", 2, 2);
    EXPECT_EQ(mid.lines, (std::vector<std::string>{"2", "3"}));
    EXPECT_EQ(mid.start_line, 2u);
    EXPECT_EQ(mid.end_line, 3u);
    EXPECT_EQ(mid.total_lines, 5u);
    EXPECT_TRUE(mid.truncated);

    auto rest = rw.ops.read_file_range(rw.root + "/five.txt", -3, 100);
    EXPECT_EQ(rest.start_line, 1u);
    EXPECT_EQ(rest.lines.size(), 5u);
    EXPECT_FALSE(rest.truncated);

    auto past = rw.ops.read_file_range(rw.root + "/five.txt", 9);
    ASSERT_TRUE(past.error.has_value());
    nlohmann::json j = past;
    EXPECT_EQ(j["totalLines"], 5);
    EXPECT_TRUE(j["lines"].empty());
    EXPECT_FALSE(j.contains("startLine"));
}

TEST_F(FilesystemOpsTest, HeadTailAndCount) {
    rw.tmp.write("root/log.txt", "a\r\nb\nc\nd");

    auto head = rw.ops.head_file(rw.root + "/log.txt", 2);
    EXPECT_EQ(head.lines, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(head.total_lines, 4u);

    auto tail = rw.ops.tail_file(rw.root + "/log.txt", 3);
    EXPECT_EQ(tail.lines, (std::vector<std::string>{"b", "c", "d"}));

    auto all = rw.ops.tail_file(rw.root + "/log.txt", 10);
    EXPECT_EQ(all.lines.size(), 4u);
    nlohmann::json j = all;
    EXPECT_EQ(j["requestedLines"], 10);
    EXPECT_EQ(j["actualLines"], 4);

    auto count = rw.ops.count_lines(rw.root + "/log.txt");
    EXPECT_EQ(count.line_count, 4u);
    EXPECT_EQ(count.size, 8u);

    EXPECT_THROW((void)rw.ops.head_file(rw.root), InvalidArgumentError);
    EXPECT_THROW((void)rw.ops.tail_file(rw.root + "/ghost.txt"), NotFoundError);
    EXPECT_THROW((void)rw.ops.count_lines(rw.outside + "/x"), SecurityError);
}

TEST_F(FilesystemOpsTest, LongLinesClippedInLineReads) {
    rw.config.max_line_length = 8;
    rw.tmp.write("root/wide.txt", std::string(20, 'w') + "\n");
    auto head = rw.ops.head_file(rw.root + "/wide.txt");
    ASSERT_EQ(head.lines.size(), 1u);
    EXPECT_EQ(head.lines[0], std::string(8, 'w') + std::string(FilesystemOperations::TRUNCATION_MARKER));
}

TEST_F(FilesystemOpsTest, GrepFile) {
    rw.tmp.write("root/app.log", "INFO start\nERROR disk\nINFO ok\nERROR net\n");

    auto all = rw.ops.grep_file(rw.root + "/app.log", "^ERROR");
    ASSERT_EQ(all.matches.size(), 2u);
    EXPECT_EQ(all.matches[1].line_number, 4u);
    EXPECT_FALSE(all.truncated);

    auto capped = rw.ops.grep_file(rw.root + "/app.log", "ERROR", 1);
    EXPECT_EQ(capped.matches.size(), 1u);
    EXPECT_TRUE(capped.truncated);

    auto literal = rw.ops.grep_file(rw.root + "/app.log", "disk(");
    EXPECT_TRUE(literal.matches.empty());
}

TEST_F(FilesystemOpsTest, GrepVeryLongLine) {
    rw.tmp.write("root/huge.log", std::string(100000, 'a') + "c\n");
    auto result = rw.ops.grep_file(rw.root + "/huge.log", "(a|b)*c");
    EXPECT_TRUE(result.matches.empty());

    auto any = rw.ops.grep_file(rw.root + "/huge.log", "a");
    ASSERT_EQ(any.matches.size(), 1u);
    EXPECT_EQ(any.matches[0].line.size(),
              rw.config.max_line_length + FilesystemOperations::TRUNCATION_MARKER.size());
}

TEST_F(FilesystemOpsTest, ReadMultipleFiles) {
    rw.config.max_read_multiple = 2;
    rw.tmp.write("root/a.txt", "A");

    auto out = rw.ops.read_multiple_files({rw.root + "/a.txt", rw.outside + "/b.txt", rw.root + "/c.txt"});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].content, "A");
    EXPECT_FALSE(out[1].content.has_value());
    ASSERT_TRUE(out[1].error.has_value());

    nlohmann::json j = out;
    EXPECT_EQ(j[0]["success"], true);
    EXPECT_EQ(j[1]["success"], false);
}

// ---- edits ----

TEST_F(FilesystemOpsTest, AppendCreatesAndExtends) {
    auto first = rw.ops.append_to_file(rw.root + "/logs/run.log", "one\n");
    EXPECT_EQ(first.appended_bytes, 4u);
    EXPECT_EQ(first.file_size, 4u);

    auto second = rw.ops.append_to_file(rw.root + "/logs/run.log", "two\n");
    EXPECT_EQ(second.file_size, 8u);
    EXPECT_EQ(rw.tmp.read("root/logs/run.log"), "one\ntwo\n");
}

TEST_F(FilesystemOpsTest, AppendRequiresWrite) {
    ro.tmp.write("root/keep.txt", "keep");
    EXPECT_THROW(ro.ops.append_to_file(ro.root + "/keep.txt", "more"), SecurityError);
    EXPECT_EQ(ro.tmp.read("root/keep.txt"), "keep");
    EXPECT_THROW(rw.ops.append_to_file(rw.outside + "/x.txt", "more"), SecurityError);
    EXPECT_FALSE(fs::exists(rw.outside + "/x.txt"));
}

TEST_F(FilesystemOpsTest, ReplaceUniqueOccurrence) {
    rw.tmp.write("root/cfg.ini", "name=old\nport=80\n");

    auto r = rw.ops.replace_in_file(rw.root + "/cfg.ini", "port=80", "port=8080", "UTF-8", true);
    EXPECT_EQ(rw.tmp.read("root/cfg.ini"), "name=old\nport=8080\n");
    ASSERT_TRUE(r.backup.has_value());
    EXPECT_EQ(rw.tmp.read("root/cfg.ini.backup"), "name=old\nport=80\n");
    EXPECT_EQ(r.old_length, 7u);
    EXPECT_EQ(r.new_length, 9u);
    EXPECT_EQ(r.file_size, 19u);
}

TEST_F(FilesystemOpsTest, ReplaceRejectsMissingOrRepeatedText) {
    rw.tmp.write("root/dup.txt", "x=1\nx=1\n");
    EXPECT_THROW(rw.ops.replace_in_file(rw.root + "/dup.txt", "y=2", "z"), InvalidArgumentError);
    try {
        rw.ops.replace_in_file(rw.root + "/dup.txt", "x=1", "x=2");
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_NE(std::string(e.what()).find("2 times"), std::string::npos);
    }
    EXPECT_EQ(rw.tmp.read("root/dup.txt"), "x=1\nx=1\n");

    ro.tmp.write("root/dup.txt", "x=1\n");
    EXPECT_THROW(ro.ops.replace_in_file(ro.root + "/dup.txt", "x=1", "x=2"), SecurityError);
    EXPECT_EQ(ro.tmp.read("root/dup.txt"), "x=1\n");
}

// ---- metadata and queries ----

TEST_F(FilesystemOpsTest, FileExistsNeverThrowsForDisallowedPaths) {
    rw.tmp.write("root/here.txt", "x");
    rw.tmp.write("outside/there.txt", "x");

    auto here = rw.ops.file_exists(rw.root + "/here.txt");
    EXPECT_TRUE(here.exists);
    EXPECT_TRUE(here.allowed);
    EXPECT_TRUE(here.is_file);
    EXPECT_FALSE(here.is_directory);

    auto there = rw.ops.file_exists(rw.outside + "/there.txt");
    EXPECT_FALSE(there.allowed);
    EXPECT_FALSE(there.exists);

    auto dir = rw.ops.file_exists(rw.root);
    EXPECT_TRUE(dir.is_directory);
}

TEST_F(FilesystemOpsTest, FileSummary) {
    rw.tmp.write("root/Readme.MD", "# t\n\nbody");
    auto s = rw.ops.get_file_summary(rw.root + "/Readme.MD");
    EXPECT_EQ(s.line_count, 3u);
    EXPECT_EQ(s.extension, "md");

    nlohmann::json j = s;
    EXPECT_EQ(j["sizeKB"], 0);
    EXPECT_EQ(j["type"], "file");

    auto d = rw.ops.get_file_summary(rw.root);
    EXPECT_FALSE(d.line_count.has_value());
    nlohmann::json dj = d;
    EXPECT_FALSE(dj.contains("lineCount"));
    EXPECT_THROW((void)rw.ops.get_file_summary(rw.root + "/ghost"), NotFoundError);
}

TEST_F(FilesystemOpsTest, FindFilesByName) {
    rw.tmp.write("root/a/UserService.cpp", "");
    rw.tmp.write("root/a/b/c/OrderService.cpp", "");
    rw.tmp.write("root/other.cpp", "");

    auto all = rw.ops.find_files_by_name("Service");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "UserService.cpp");
    EXPECT_EQ(all[1].name, "OrderService.cpp");

    auto shallow = rw.ops.find_files_by_name("Service", rw.root, 2);
    ASSERT_EQ(shallow.size(), 1u);
    EXPECT_EQ(shallow[0].name, "UserService.cpp");

    EXPECT_EQ(rw.ops.find_files_by_name("Service", std::nullopt, 5, 1).size(), 1u);
    EXPECT_THROW((void)rw.ops.find_files_by_name("x", rw.outside), SecurityError);
}

TEST_F(FilesystemOpsTest, ListWithSizes) {
    rw.tmp.write("root/small.txt", "1");
    rw.tmp.write("root/big.txt", std::string(100, 'b'));
    rw.tmp.write("root/mid.txt", std::string(10, 'm'));

    auto by_name = rw.ops.list_directory_with_sizes(rw.root);
    ASSERT_EQ(by_name.size(), 3u);
    EXPECT_EQ(by_name[0].name, "big.txt");
    EXPECT_EQ(by_name[2].name, "small.txt");

    auto by_size = rw.ops.list_directory_with_sizes(rw.root, "size");
    EXPECT_EQ(by_size[0].name, "big.txt");
    EXPECT_EQ(by_size[1].name, "mid.txt");
    EXPECT_EQ(by_size[2].name, "small.txt");

    EXPECT_THROW((void)rw.ops.list_directory_with_sizes(rw.root, "age"), InvalidArgumentError);
}

TEST_F(FilesystemOpsTest, DirectoryTreeLimits) {
    rw.config.max_tree_depth = 2;
    rw.tmp.write("root/src/deep/leaf.cpp", "");
    rw.tmp.write("root/src/top.cpp", "");
    rw.tmp.write("root/build/out.o", "");

    auto tree = rw.ops.get_directory_tree(rw.root, {"build"});
    EXPECT_EQ(tree.type, "directory");
    ASSERT_EQ(tree.children.size(), 1u);
    const auto& src = tree.children[0];
    EXPECT_EQ(src.name, "src");
    ASSERT_EQ(src.children.size(), 2u);
    EXPECT_EQ(src.children[0].name, "deep");
    EXPECT_EQ(src.children[0].type, "truncated");
    EXPECT_EQ(src.children[1].type, "file");

    nlohmann::json leaf = src.children[1];
    EXPECT_FALSE(leaf.contains("children"));
}

TEST_F(FilesystemOpsTest, DirectoryTreeFileCap) {
    rw.config.max_tree_files = 3;
    for (int i = 0; i < 6; ++i) rw.tmp.write("root/f" + std::to_string(i) + ".txt", "");

    auto tree = rw.ops.get_directory_tree(rw.root);
    ASSERT_EQ(tree.children.size(), 3u);
    EXPECT_EQ(tree.children.back().type, "truncated");
    ASSERT_TRUE(tree.children.back().message.has_value());
}

TEST_F(FilesystemOpsTest, ListChildrenOnlyBounded) {
    rw.config.max_list_results = 3;
    for (int i = 0; i < 5; ++i) rw.tmp.write("root/f" + std::to_string(i) + ".txt", "");
    rw.tmp.write("root/sub/nested.txt", "");

    EXPECT_EQ(rw.ops.list_children_only(rw.root).size(), 3u);
    EXPECT_EQ(rw.ops.list_children_only(rw.root, std::nullopt, 2).size(), 2u);
    EXPECT_EQ(rw.ops.list_children_only(rw.root, std::nullopt, 50).size(), 3u);

    auto subs = rw.ops.list_children_only(rw.root, std::string("sub"));
    ASSERT_EQ(subs.size(), 1u);
    EXPECT_EQ(subs[0].type, "directory");
}

TEST_F(FilesystemOpsTest, SearchInProjectUsesProjectRoot) {
    rw.config.max_search_results = 2;
    for (int i = 0; i < 4; ++i) rw.tmp.write("root/m" + std::to_string(i) + ".cpp", "needle\n");

    EXPECT_EQ(rw.ops.search_in_project("needle").size(), 2u);
    EXPECT_EQ(rw.ops.search_in_project("needle", std::nullopt, 1).size(), 1u);
    EXPECT_EQ(rw.ops.search_in_project("needle", std::nullopt, 10).size(), 2u);
    EXPECT_EQ(rw.ops.project_root(), rw.root);
}
