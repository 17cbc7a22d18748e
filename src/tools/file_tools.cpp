#include <mcp_sandbox/tools/file_tools.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mcp_sandbox {

namespace fs = std::filesystem;

namespace {

ToolResult MakeError(ToolErrorKind kind, const std::string& message) {
    return ToolResult::FromError(ToolError{kind, message});
}

ToolResult MakeArgError(const std::string& message) {
    return MakeError(ToolErrorKind::InvalidArguments, message);
}

// Get a required string argument. Returns nullopt and sets out_error on
// failure.
std::optional<std::string> RequireString(const nlohmann::json& args,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        out_error = MakeArgError("Missing required argument: " + key);
        return std::nullopt;
    }
    return args[key].get<std::string>();
}

// Authorize the `path` argument. On failure out_error holds the tool error.
std::optional<fs::path> AuthorizePath(const SandboxGuard& guard,
                                      const nlohmann::json& args,
                                      ToolResult& out_error) {
    auto requested = RequireString(args, "path", out_error);
    if (!requested) return std::nullopt;

    auto authorized = guard.Authorize(*requested);
    if (authorized.IsErr()) {
        out_error = ToolResult::FromError(authorized.Error());
        return std::nullopt;
    }
    return std::move(authorized).Value();
}

std::error_code LastErrno() {
    return std::error_code(errno, std::generic_category());
}

// Owns a POSIX file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int Get() const { return fd_; }
    [[nodiscard]] bool IsValid() const { return fd_ >= 0; }

    // Close now; false (with errno set) if the kernel reported a failure,
    // which for a written file means the data may not have landed.
    [[nodiscard]] bool Close() {
        const int fd = std::exchange(fd_, -1);
        return fd < 0 || ::close(fd) == 0;
    }

private:
    int fd_ = -1;
};

#ifdef O_PATH
constexpr int kWalkFlags = O_PATH | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
#else
constexpr int kWalkFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
#endif

ToolError Denied(const fs::path& path) {
    return ToolError{ToolErrorKind::AccessDenied,
                     "Access denied: '" + path.string() +
                         "' is outside the allowed directories"};
}

// Name of the entry inside its parent. Only "/" itself has none.
std::string LeafName(const fs::path& path) {
    auto leaf = path.filename().string();
    return leaf.empty() ? "." : leaf;
}

// Open the parent of an authorized path without following any symlink on
// the way. Authorized paths are canonical, so a symlink anywhere in the
// parent chain means the tree changed after the check.
Result<UniqueFd, ToolError> OpenParentDir(const fs::path& path) {
    using R = Result<UniqueFd, ToolError>;
    const auto parent = path.parent_path();

    UniqueFd dir(::open("/", kWalkFlags));
    if (!dir.IsValid()) {
        return R::Err(ToolError::FromErrorCode(LastErrno(), "Cannot open /"));
    }
    for (const auto& part : parent.relative_path()) {
        if (part.empty()) continue;
        UniqueFd next(::openat(dir.Get(), part.c_str(), kWalkFlags));
        if (!next.IsValid()) {
            const auto ec = LastErrno();
            struct stat st {};
            if (::fstatat(dir.Get(), part.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0 &&
                S_ISLNK(st.st_mode)) {
                return R::Err(Denied(path));
            }
            return R::Err(ToolError::FromErrorCode(
                ec, "Cannot open directory " + parent.string()));
        }
        dir = std::move(next);
    }
    return R::Ok(std::move(dir));
}


} // anonymous namespace

bool IsValidUtf8(std::string_view text) {
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min = 0;
        if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; min = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; min = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; min = 0x10000;
        } else {
            return false;
        }
        if (n - i < len) return false;

        for (std::size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

Result<std::string, ToolError> ReadAuthorizedFile(const fs::path& path,
                                                  std::uint64_t max_size) {
    using R = Result<std::string, ToolError>;
    auto dir = OpenParentDir(path);
    if (dir.IsErr()) return R::Err(std::move(dir).Error());

    // Blocks on a FIFO until a writer appears; callers bound this with a timeout.
    UniqueFd fd(::openat(dir.Value().Get(), LeafName(path).c_str(),
                         O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!fd.IsValid()) {
        const auto ec = LastErrno();
        if (ec == std::errc::no_such_file_or_directory) {
            return R::Err(ToolError{ToolErrorKind::NotFound,
                                    "File not found: " + path.string()});
        }
        if (ec == std::errc::too_many_symbolic_link_levels) {
            return R::Err(Denied(path));
        }
        return R::Err(ToolError::FromErrorCode(ec, "Cannot open " + path.string()));
    }

    struct stat st {};
    if (::fstat(fd.Get(), &st) != 0) {
        return R::Err(ToolError::FromErrorCode(LastErrno(),
                                               "Cannot stat " + path.string()));
    }
    if (S_ISDIR(st.st_mode)) {
        return R::Err(ToolError{ToolErrorKind::IOFailure,
                                "Is a directory: " + path.string()});
    }
    const auto limit = std::to_string(max_size);
    if (S_ISREG(st.st_mode) && static_cast<std::uint64_t>(st.st_size) > max_size) {
        return R::Err(ToolError{ToolErrorKind::TooLarge,
                                path.string() + " is " + std::to_string(st.st_size) +
                                    " bytes; the limit is " + limit});
    }

    // The size seen by fstat can be stale (growing files, pipes), so the
    // read itself stops one byte past the limit.
    std::string contents;
    std::array<char, 64 * 1024> buffer{};
    for (;;) {
        const std::uint64_t remaining = max_size - contents.size();
        const std::size_t want = remaining >= buffer.size()
                                     ? buffer.size()
                                     : static_cast<std::size_t>(remaining) + 1;
        const ssize_t n = ::read(fd.Get(), buffer.data(), want);
        if (n < 0) {
            if (errno == EINTR) continue;
            return R::Err(ToolError::FromErrorCode(LastErrno(),
                                                   "Read failed: " + path.string()));
        }
        if (n == 0) break;
        contents.append(buffer.data(), static_cast<std::size_t>(n));
        if (contents.size() > max_size) {
            return R::Err(ToolError{ToolErrorKind::TooLarge,
                                    path.string() + " is larger than " + limit +
                                        " bytes; the limit is " + limit});
        }
    }

    if (!IsValidUtf8(contents)) {
        return R::Err(ToolError{ToolErrorKind::IOFailure,
                                "Not a UTF-8 text file: " + path.string()});
    }
    return R::Ok(std::move(contents));
}

Result<void, ToolError> WriteAuthorizedFile(const fs::path& path,
                                            std::string_view content) {
    using R = Result<void, ToolError>;
    auto dir = OpenParentDir(path);
    if (dir.IsErr()) return R::Err(std::move(dir).Error());

    UniqueFd fd(::openat(dir.Value().Get(), LeafName(path).c_str(),
                         O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                         0666));
    if (!fd.IsValid()) {
        const auto ec = LastErrno();
        if (ec == std::errc::is_a_directory) {
            return R::Err(ToolError{ToolErrorKind::IOFailure,
                                    "Is a directory: " + path.string()});
        }
        if (ec == std::errc::too_many_symbolic_link_levels) {
            return R::Err(Denied(path));
        }
        return R::Err(ToolError::FromErrorCode(
            ec, "Cannot open " + path.string() + " for writing"));
    }

    const char* data = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        const ssize_t n = ::write(fd.Get(), data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return R::Err(ToolError::FromErrorCode(LastErrno(),
                                                   "Write failed: " + path.string()));
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    if (!fd.Close()) {
        return R::Err(ToolError::FromErrorCode(LastErrno(),
                                               "Write failed: " + path.string()));
    }
    return R::Ok();
}

Result<bool, ToolError> CreateAuthorizedDirectory(const fs::path& path) {
    using R = Result<bool, ToolError>;
    auto dir = OpenParentDir(path);
    if (dir.IsErr()) return R::Err(std::move(dir).Error());

    const auto leaf = LeafName(path);
    if (::mkdirat(dir.Value().Get(), leaf.c_str(), 0777) == 0) {
        return R::Ok(true);
    }
    const auto ec = LastErrno();
    if (ec != std::errc::file_exists) {
        return R::Err(ToolError::FromErrorCode(
            ec, "Cannot create directory " + path.string()));
    }

    // mkdirat never follows a symlink at the leaf; neither does this check.
    struct stat st {};
    if (::fstatat(dir.Value().Get(), leaf.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
        return R::Err(ToolError::FromErrorCode(LastErrno(),
                                               "Cannot stat " + path.string()));
    }
    if (!S_ISDIR(st.st_mode)) {
        return R::Err(ToolError{ToolErrorKind::IOFailure,
                                "Path exists and is not a directory: " +
                                    path.string()});
    }
    return R::Ok(false);
}

// ---------------------------------------------------------------------------
// read_file
// ---------------------------------------------------------------------------
ToolResult HandleReadFile(const SandboxGuard& guard,
                          const FileToolOptions& options,
                          const nlohmann::json& args) {
    ToolResult err;
    auto path = AuthorizePath(guard, args, err);
    if (!path) return err;

    auto contents = ReadAuthorizedFile(*path, options.max_file_size);
    if (contents.IsErr()) {
        return ToolResult::FromError(contents.Error());
    }
    const auto size = contents.Value().size();
    return ToolResult::Text(std::move(contents).Value(),
                            {{"path", path->string()}, {"size", size}});
}

// ---------------------------------------------------------------------------
// write_file
// ---------------------------------------------------------------------------
ToolResult HandleWriteFile(const SandboxGuard& guard,
                           const FileToolOptions& options,
                           const nlohmann::json& args) {
    ToolResult err;
    auto content = RequireString(args, "content", err);
    if (!content) return err;
    auto path = AuthorizePath(guard, args, err);
    if (!path) return err;

    if (content->size() > options.max_file_size) {
        return MakeError(ToolErrorKind::TooLarge,
                         "Content is " + std::to_string(content->size()) +
                             " bytes; the limit is " +
                             std::to_string(options.max_file_size));
    }

    auto written = WriteAuthorizedFile(*path, *content);
    if (written.IsErr()) {
        return ToolResult::FromError(written.Error());
    }

    return ToolResult::Text(
        "Successfully wrote " + std::to_string(content->size()) + " bytes to " +
            path->string(),
        {{"path", path->string()}, {"size", content->size()}});
}

// ---------------------------------------------------------------------------
// list_directory
// ---------------------------------------------------------------------------
ToolResult HandleListDirectory(const SandboxGuard& guard,
                               const FileToolOptions& /*options*/,
                               const nlohmann::json& args) {
    ToolResult err;
    auto path = AuthorizePath(guard, args, err);
    if (!path) return err;

    std::error_code ec;
    const auto status = fs::status(*path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return ToolResult::FromError(
            ToolError::FromErrorCode(ec, "Cannot stat " + path->string()));
    }
    if (!fs::exists(status)) {
        return MakeError(ToolErrorKind::NotFound,
                         "Directory not found: " + path->string());
    }
    if (!fs::is_directory(status)) {
        return MakeError(ToolErrorKind::NotADirectory,
                         "Not a directory: " + path->string());
    }

    struct Entry {
        std::string name;
        bool is_directory;
    };
    std::vector<Entry> entries;

    fs::directory_iterator it(*path, ec);
    if (ec) {
        return ToolResult::FromError(
            ToolError::FromErrorCode(ec, "Cannot list " + path->string()));
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        entries.push_back({it->path().filename().string(),
                           it->is_directory(type_ec)});
    }
    if (ec) {
        return ToolResult::FromError(
            ToolError::FromErrorCode(ec, "Cannot list " + path->string()));
    }

    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });

    nlohmann::json items = nlohmann::json::array();
    std::string files_text;
    std::string dirs_text;
    std::size_t file_count = 0;
    std::size_t dir_count = 0;
    for (const auto& entry : entries) {
        items.push_back({{"name", entry.name},
                         {"type", entry.is_directory ? "directory" : "file"}});
        if (entry.is_directory) {
            dirs_text += "  " + entry.name + "/\n";
            ++dir_count;
        } else {
            files_text += "  " + entry.name + "\n";
            ++file_count;
        }
    }

    std::string text = "Directory: " + path->string() + "\n\n";
    text += "Files (" + std::to_string(file_count) + "):\n" + files_text;
    text += "\nDirectories (" + std::to_string(dir_count) + "):\n" + dirs_text;

    return ToolResult::Text(text, {{"directory", path->string()},
                                   {"entries", items}});
}

// ---------------------------------------------------------------------------
// create_directory
// ---------------------------------------------------------------------------
ToolResult HandleCreateDirectory(const SandboxGuard& guard,
                                 const FileToolOptions& /*options*/,
                                 const nlohmann::json& args) {
    ToolResult err;
    auto path = AuthorizePath(guard, args, err);
    if (!path) return err;

    auto created = CreateAuthorizedDirectory(*path);
    if (created.IsErr()) {
        return ToolResult::FromError(created.Error());
    }
    if (!created.Value()) {
        return ToolResult::Text("Directory already exists: " + path->string(),
                                {{"path", path->string()}, {"created", false}});
    }
    return ToolResult::Text("Created directory: " + path->string(),
                            {{"path", path->string()}, {"created", true}});
}

} // namespace mcp_sandbox
