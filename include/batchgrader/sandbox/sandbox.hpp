#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/common/expected.hpp>
#include <batchgrader/config.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace batchgrader {

/// Why a sandbox could not be assembled
struct AssemblyError
{
    enum class Kind {
        MissingFile, ///< A named file does not exist in the source directory
        CopyFailure  ///< Copying into the sandbox failed (permissions, disk space, ...)
    } kind;

    /// The missing file's name, or a description of the failed copy
    std::string detail;

    bool operator==(const AssemblyError&) const = default;
};

std::string to_string(const AssemblyError& from);

/// An ephemeral scratch directory exclusively owned by one grading run (one submission or the
/// solution). The directory is removed on destruction, unless it is kept for inspection.
class Sandbox : NonCopyable
{
public:
    /// Creates a fresh, empty, uniquely named directory under `root`
    /// `label` is only used to make the directory name recognizable
    static Expected<Sandbox, std::string> create(const std::filesystem::path& root, std::string_view label,
                                                 bool keep = false);

    ~Sandbox();
    Sandbox(Sandbox&& other) noexcept;
    Sandbox& operator=(Sandbox&& rhs) noexcept;

    /// Populates the sandbox with every entry of `context_dir` followed by the files of `source_dir`
    /// selected by `selection`. Later copies overwrite earlier ones.
    ///
    /// Every named file is checked for existence before anything is copied.
    Expected<void, AssemblyError> assemble(const std::filesystem::path& context_dir,
                                           const std::filesystem::path& source_dir,
                                           const FileSelection& selection) const;

    const std::filesystem::path& path() const noexcept { return path_; }

    bool is_kept() const noexcept { return keep_; }

private:
    Sandbox(std::filesystem::path path, bool keep);

    void remove() noexcept;

    /// Copies one directory entry (file, symlink, or whole directory) to `dest` inside the sandbox
    void copy_entry(const std::filesystem::path& entry, const std::filesystem::path& dest) const;

    /// Copies every entry of `dir` into the sandbox root
    void copy_all(const std::filesystem::path& dir) const;

    std::filesystem::path path_;
    bool keep_;
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::AssemblyError> : formatter<std::string>
{
    auto format(const ::batchgrader::AssemblyError& from, format_context& ctx) const {
        return formatter<std::string>::format(::batchgrader::to_string(from), ctx);
    }
};
