#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <mcp_sandbox/tools/file_tools.hpp>

#include "mocks/temp_dir.hpp"

#include <filesystem>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace mcp_sandbox;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace fs = std::filesystem;

namespace {

struct Fixture {
    testing::TempDir root;
    testing::TempDir outside;
    FileToolOptions options;
    SandboxGuard guard;

    Fixture() : guard(MakeGuard(root)) {}

    static SandboxGuard MakeGuard(const testing::TempDir& dir) {
        auto guard = SandboxGuard::Create({dir.Path().string()});
        REQUIRE(guard.IsOk());
        return std::move(guard).Value();
    }
};

std::string Text(const ToolResult& result) {
    REQUIRE(result.content.size() == 1);
    return result.content[0]["text"].get<std::string>();
}

std::string Kind(const ToolResult& result) {
    REQUIRE(result.is_error);
    REQUIRE(result.structured_content.has_value());
    return (*result.structured_content)["error"]["kind"].get<std::string>();
}

} // anonymous namespace

// ===========================================================================
// read_file
// ===========================================================================

TEST_CASE("read_file: returns the whole file", "[tools][read_file]") {
    Fixture f;
    auto file = f.root.WriteFile("notes.txt", "line one\nline two\n");

    auto result = HandleReadFile(f.guard, f.options, {{"path", file.string()}});
    REQUIRE_FALSE(result.is_error);
    CHECK(Text(result) == "line one\nline two\n");
    CHECK((*result.structured_content)["path"] == file.string());
    CHECK((*result.structured_content)["size"] == 18);
}

TEST_CASE("read_file: empty file", "[tools][read_file]") {
    Fixture f;
    auto file = f.root.WriteFile("empty.txt", "");

    auto result = HandleReadFile(f.guard, f.options, {{"path", file.string()}});
    REQUIRE_FALSE(result.is_error);
    CHECK(Text(result).empty());
}

TEST_CASE("read_file: failures", "[tools][read_file]") {
    Fixture f;
    f.root.MakeDir("sub");
    auto secret = f.outside.WriteFile("secret.txt", "s");

    SECTION("missing file") {
        auto result = HandleReadFile(f.guard, f.options, {{"path", f.root / "nope.txt"}});
        CHECK(Kind(result) == "NotFound");
        CHECK_THAT(Text(result), StartsWith("NotFound: File not found: "));
    }
    SECTION("directory") {
        auto result = HandleReadFile(f.guard, f.options, {{"path", f.root / "sub"}});
        CHECK(Kind(result) == "IOFailure");
        CHECK_THAT(Text(result), ContainsSubstring("Is a directory"));
    }
    SECTION("outside the root") {
        auto result = HandleReadFile(f.guard, f.options, {{"path", secret.string()}});
        CHECK(Kind(result) == "AccessDenied");
    }
    SECTION("missing path argument") {
        auto result = HandleReadFile(f.guard, f.options, nlohmann::json::object());
        CHECK(Kind(result) == "InvalidArguments");
        CHECK(Text(result) == "InvalidArguments: Missing required argument: path");
    }
    SECTION("path is not a string") {
        auto result = HandleReadFile(f.guard, f.options, {{"path", 7}});
        CHECK(Kind(result) == "InvalidArguments");
    }
}

TEST_CASE("read_file: size limit", "[tools][read_file]") {
    Fixture f;
    f.options.max_file_size = 4;
    auto small = f.root.WriteFile("small.txt", "abcd");
    auto big = f.root.WriteFile("big.txt", "abcde");

    CHECK_FALSE(HandleReadFile(f.guard, f.options, {{"path", small.string()}}).is_error);

    auto result = HandleReadFile(f.guard, f.options, {{"path", big.string()}});
    CHECK(Kind(result) == "TooLarge");
    CHECK_THAT(Text(result), ContainsSubstring("5 bytes; the limit is 4"));
}

TEST_CASE("read_file: binary content is refused, not mangled", "[tools][read_file]") {
    Fixture f;
    const std::string png_header("\x89PNG\r\n\x1a\n\xff\xfe\x00\x01", 12);
    auto file = f.root.WriteFile("image.png", png_header);

    auto result = HandleReadFile(f.guard, f.options, {{"path", file.string()}});
    CHECK(Kind(result) == "IOFailure");
    CHECK(Text(result) == "IOFailure: Not a UTF-8 text file: " + file.string());
}

TEST_CASE("read_file: the limit holds when the size is not known up front",
          "[tools][read_file]") {
    Fixture f;
    f.options.max_file_size = 10;
    const auto fifo = f.root / "stream";
    REQUIRE(::mkfifo(fifo.c_str(), 0600) == 0);

    // One write of 100 bytes, well below PIPE_BUF, so it lands in the pipe
    // before the reader can give up and close its end.
    std::thread writer([&fifo] {
        const int fd = ::open(fifo.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) return;
        const std::string payload(100, 'x');
        const auto written = ::write(fd, payload.data(), payload.size());
        (void)written;
        ::close(fd);
    });

    auto result = HandleReadFile(f.guard, f.options, {{"path", fifo}});
    writer.join();

    CHECK(Kind(result) == "TooLarge");
    CHECK_THAT(Text(result), ContainsSubstring("larger than 10 bytes"));
}

TEST_CASE("IsValidUtf8: accepts text and rejects malformed sequences", "[tools][utf8]") {
    CHECK(IsValidUtf8(""));
    CHECK(IsValidUtf8("plain ascii\n"));
    CHECK(IsValidUtf8("caf\xc3\xa9"));
    CHECK(IsValidUtf8("\xe2\x82\xac"));
    CHECK(IsValidUtf8("\xf0\x9f\x98\x80"));

    CHECK_FALSE(IsValidUtf8("\xff"));
    CHECK_FALSE(IsValidUtf8("\x80"));
    CHECK_FALSE(IsValidUtf8("\xc0\xaf"));          // overlong '/'
    CHECK_FALSE(IsValidUtf8("\xed\xa0\x80"));      // surrogate
    CHECK_FALSE(IsValidUtf8("\xf4\x90\x80\x80"));  // past U+10FFFF
    CHECK_FALSE(IsValidUtf8("\xe2\x82"));          // truncated
}

// ===========================================================================
// write_file
// ===========================================================================

TEST_CASE("write_file: creates a new file", "[tools][write_file]") {
    Fixture f;
    const auto path = f.root / "out.txt";

    auto result = HandleWriteFile(f.guard, f.options,
                                  {{"path", path}, {"content", "hello"}});
    REQUIRE_FALSE(result.is_error);
    CHECK(Text(result) == "Successfully wrote 5 bytes to " + path);
    CHECK((*result.structured_content)["size"] == 5);
    CHECK(testing::ReadWholeFile(path) == "hello");
}

TEST_CASE("write_file: truncates an existing file", "[tools][write_file]") {
    Fixture f;
    auto file = f.root.WriteFile("out.txt", "a much longer original text");

    auto result = HandleWriteFile(f.guard, f.options,
                                  {{"path", file.string()}, {"content", "short"}});
    REQUIRE_FALSE(result.is_error);
    CHECK(testing::ReadWholeFile(file) == "short");
}

TEST_CASE("write_file: writing twice leaves the same file", "[tools][write_file]") {
    Fixture f;
    const auto path = f.root / "same.txt";
    const nlohmann::json args = {{"path", path}, {"content", "repeat"}};

    REQUIRE_FALSE(HandleWriteFile(f.guard, f.options, args).is_error);
    REQUIRE_FALSE(HandleWriteFile(f.guard, f.options, args).is_error);
    CHECK(testing::ReadWholeFile(path) == "repeat");
}

TEST_CASE("write_file: keeps bytes exactly", "[tools][write_file]") {
    Fixture f;
    const auto path = f.root / "bytes.txt";
    const std::string content = "crlf\r\nutf8 \xc3\xa9\n\ttab";

    REQUIRE_FALSE(HandleWriteFile(f.guard, f.options,
                                  {{"path", path}, {"content", content}}).is_error);
    auto read = HandleReadFile(f.guard, f.options, {{"path", path}});
    CHECK(Text(read) == content);
}

TEST_CASE("write_file: failures", "[tools][write_file]") {
    Fixture f;
    f.root.MakeDir("sub");

    SECTION("outside the root") {
        const auto target = f.outside / "planted.txt";
        auto result = HandleWriteFile(f.guard, f.options,
                                      {{"path", target}, {"content", "x"}});
        CHECK(Kind(result) == "AccessDenied");
        CHECK_FALSE(fs::exists(target));
    }
    SECTION("parent directory missing") {
        auto result = HandleWriteFile(f.guard, f.options,
                                      {{"path", f.root / "no/such/dir.txt"},
                                       {"content", "x"}});
        CHECK(Kind(result) == "AccessDenied");
    }
    SECTION("target is a directory") {
        auto result = HandleWriteFile(f.guard, f.options,
                                      {{"path", f.root / "sub"}, {"content", "x"}});
        CHECK(Kind(result) == "IOFailure");
        CHECK(fs::is_directory(f.root / "sub"));
    }
    SECTION("content missing") {
        auto result = HandleWriteFile(f.guard, f.options, {{"path", f.root / "a.txt"}});
        CHECK(Text(result) == "InvalidArguments: Missing required argument: content");
        CHECK_FALSE(fs::exists(f.root / "a.txt"));
    }
    SECTION("content too large") {
        f.options.max_file_size = 3;
        auto result = HandleWriteFile(f.guard, f.options,
                                      {{"path", f.root / "a.txt"}, {"content", "abcd"}});
        CHECK(Kind(result) == "TooLarge");
        CHECK_FALSE(fs::exists(f.root / "a.txt"));
    }
}

// ===========================================================================
// Authorized I/O after the tree changed under the guard
// ===========================================================================

TEST_CASE("WriteAuthorizedFile: a symlink planted at the leaf is not followed",
          "[tools][write_file][symlink]") {
    Fixture f;
    auto victim = f.outside.WriteFile("victim.txt", "original");
    auto authorized = f.guard.Authorize(f.root / "late.txt");
    REQUIRE(authorized.IsOk());

    fs::create_symlink(victim, authorized.Value());

    auto written = WriteAuthorizedFile(authorized.Value(), "payload");
    REQUIRE(written.IsErr());
    CHECK(written.Error().kind == ToolErrorKind::AccessDenied);
    CHECK(testing::ReadWholeFile(victim) == "original");

    auto read = ReadAuthorizedFile(authorized.Value(), f.options.max_file_size);
    REQUIRE(read.IsErr());
    CHECK(read.Error().kind == ToolErrorKind::AccessDenied);
}

TEST_CASE("WriteAuthorizedFile: a parent swapped for a symlink is not followed",
          "[tools][write_file][symlink]") {
    Fixture f;
    f.root.MakeDir("sub");
    auto authorized = f.guard.Authorize(f.root / "sub/new.txt");
    REQUIRE(authorized.IsOk());

    fs::remove(f.root.Path() / "sub");
    fs::create_directory_symlink(f.outside.Path(), f.root.Path() / "sub");

    auto written = WriteAuthorizedFile(authorized.Value(), "payload");
    REQUIRE(written.IsErr());
    CHECK(written.Error().kind == ToolErrorKind::AccessDenied);
    CHECK_FALSE(fs::exists(f.outside.Path() / "new.txt"));

    auto made = CreateAuthorizedDirectory(f.root.Path() / "sub" / "made");
    REQUIRE(made.IsErr());
    CHECK(made.Error().kind == ToolErrorKind::AccessDenied);
    CHECK_FALSE(fs::exists(f.outside.Path() / "made"));
}

TEST_CASE("CreateAuthorizedDirectory: a symlink at the leaf is not a directory",
          "[tools][create_directory][symlink]") {
    Fixture f;
    auto authorized = f.guard.Authorize(f.root / "link");
    REQUIRE(authorized.IsOk());
    fs::create_directory_symlink(f.outside.Path(), authorized.Value());

    auto made = CreateAuthorizedDirectory(authorized.Value());
    REQUIRE(made.IsErr());
    CHECK(made.Error().kind == ToolErrorKind::IOFailure);
    CHECK_THAT(made.Error().message, ContainsSubstring("not a directory"));
}

// ===========================================================================
// list_directory
// ===========================================================================

TEST_CASE("list_directory: sorted files and directories", "[tools][list_directory]") {
    Fixture f;
    f.root.WriteFile("b.txt", "b");
    f.root.WriteFile("a.txt", "a");
    f.root.MakeDir("zeta");
    f.root.MakeDir("alpha");

    auto result = HandleListDirectory(f.guard, f.options,
                                      {{"path", f.root.Path().string()}});
    REQUIRE_FALSE(result.is_error);

    const std::string expected =
        "Directory: " + f.root.Path().string() + "\n\n"
        "Files (2):\n"
        "  a.txt\n"
        "  b.txt\n"
        "\nDirectories (2):\n"
        "  alpha/\n"
        "  zeta/\n";
    CHECK(Text(result) == expected);

    const auto& entries = (*result.structured_content)["entries"];
    REQUIRE(entries.size() == 4);
    CHECK(entries[0] == nlohmann::json({{"name", "a.txt"}, {"type", "file"}}));
    CHECK(entries[1] == nlohmann::json({{"name", "alpha"}, {"type", "directory"}}));
    CHECK(entries[2] == nlohmann::json({{"name", "b.txt"}, {"type", "file"}}));
    CHECK(entries[3] == nlohmann::json({{"name", "zeta"}, {"type", "directory"}}));
}

TEST_CASE("list_directory: empty directory", "[tools][list_directory]") {
    Fixture f;
    f.root.MakeDir("empty");

    auto result = HandleListDirectory(f.guard, f.options, {{"path", f.root / "empty"}});
    REQUIRE_FALSE(result.is_error);
    CHECK_THAT(Text(result), ContainsSubstring("Files (0):"));
    CHECK_THAT(Text(result), ContainsSubstring("Directories (0):"));
    CHECK((*result.structured_content)["entries"].empty());
}

TEST_CASE("list_directory: failures", "[tools][list_directory]") {
    Fixture f;
    auto file = f.root.WriteFile("file.txt", "x");

    SECTION("not a directory") {
        auto result = HandleListDirectory(f.guard, f.options, {{"path", file.string()}});
        CHECK(Kind(result) == "NotADirectory");
    }
    SECTION("missing") {
        auto result = HandleListDirectory(f.guard, f.options, {{"path", f.root / "gone"}});
        CHECK(Kind(result) == "NotFound");
    }
    SECTION("a file in the middle of the path") {
        // stat fails with ENOTDIR here, which is not a missing directory.
        auto result = HandleListDirectory(f.guard, f.options,
                                          {{"path", f.root / "file.txt/inner"}});
        CHECK(Kind(result) == "NotADirectory");
        CHECK_THAT(Text(result), StartsWith("NotADirectory: Cannot stat "));
    }
    SECTION("outside the root") {
        auto result = HandleListDirectory(f.guard, f.options,
                                          {{"path", f.outside.Path().string()}});
        CHECK(Kind(result) == "AccessDenied");
    }
}

// ===========================================================================
// create_directory
// ===========================================================================

TEST_CASE("create_directory: creates and is idempotent", "[tools][create_directory]") {
    Fixture f;
    const auto path = f.root / "made";

    auto first = HandleCreateDirectory(f.guard, f.options, {{"path", path}});
    REQUIRE_FALSE(first.is_error);
    CHECK(Text(first) == "Created directory: " + path);
    CHECK((*first.structured_content)["created"] == true);
    CHECK(fs::is_directory(path));

    auto second = HandleCreateDirectory(f.guard, f.options, {{"path", path}});
    REQUIRE_FALSE(second.is_error);
    CHECK(Text(second) == "Directory already exists: " + path);
    CHECK((*second.structured_content)["created"] == false);
}

TEST_CASE("create_directory: failures", "[tools][create_directory]") {
    Fixture f;
    auto file = f.root.WriteFile("file.txt", "x");

    SECTION("a file is in the way") {
        auto result = HandleCreateDirectory(f.guard, f.options, {{"path", file.string()}});
        CHECK(Kind(result) == "IOFailure");
        CHECK_THAT(Text(result), ContainsSubstring("not a directory"));
    }
    SECTION("missing parent") {
        auto result = HandleCreateDirectory(f.guard, f.options,
                                            {{"path", f.root / "a/b"}});
        CHECK(Kind(result) == "AccessDenied");
        CHECK_FALSE(fs::exists(f.root / "a"));
    }
    SECTION("outside the root") {
        const auto target = f.outside / "made";
        auto result = HandleCreateDirectory(f.guard, f.options, {{"path", target}});
        CHECK(Kind(result) == "AccessDenied");
        CHECK_FALSE(fs::exists(target));
    }
}
