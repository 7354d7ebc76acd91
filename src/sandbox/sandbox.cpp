#include <batchgrader/sandbox/sandbox.hpp>

#include <batchgrader/common/expected.hpp>
#include <batchgrader/common/overloaded.hpp>
#include <batchgrader/config.hpp>
#include <batchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <range/v3/algorithm/replace_if.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace batchgrader {

namespace fs = std::filesystem;

std::string to_string(const AssemblyError& from) {
    switch (from.kind) {
    case AssemblyError::Kind::MissingFile:
        return fmt::format("missing: {}", from.detail);
    case AssemblyError::Kind::CopyFailure:
        return fmt::format("could not copy files: {}", from.detail);
    }

    return from.detail;
}

Sandbox::Sandbox(fs::path path, bool keep)
    : path_{std::move(path)}
    , keep_{keep} {}

Expected<Sandbox, std::string> Sandbox::create(const fs::path& root, std::string_view label, bool keep) {
    std::string safe_label{label};
    ranges::replace_if(
        safe_label, [](unsigned char chr) { return !std::isalnum(chr) && chr != '-' && chr != '_'; }, '_');

    // mkdtemp(3) requires a mutable, XXXXXX-terminated template
    std::string dir_template = (root / fmt::format("batchgrader-{}-XXXXXX", safe_label)).string();

    if (::mkdtemp(dir_template.data()) == nullptr) {
        return fmt::format("Could not create sandbox directory under {}: {}", root, get_err_msg());
    }

    LOG_DEBUG("Created sandbox {}", dir_template);

    return Sandbox{fs::path{dir_template}, keep};
}

Sandbox::~Sandbox() {
    remove();
}

Sandbox::Sandbox(Sandbox&& other) noexcept
    : path_{std::exchange(other.path_, {})}
    , keep_{other.keep_} {}

Sandbox& Sandbox::operator=(Sandbox&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
        keep_ = rhs.keep_;
    }

    return *this;
}

void Sandbox::remove() noexcept {
    // Moved-from
    if (path_.empty()) {
        return;
    }

    if (keep_) {
        LOG_INFO("Keeping sandbox {}", path_);
        return;
    }

    std::error_code err;
    fs::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove sandbox {}: {}", path_, err.message());
    }

    path_.clear();
}

Expected<void, AssemblyError> Sandbox::assemble(const fs::path& context_dir, const fs::path& source_dir,
                                                const FileSelection& selection) const {
    // Missing files are checked for up front, so that a submission is either fully assembled or rejected
    // without any build being attempted
    if (const auto* named = std::get_if<CollectNamed>(&selection)) {
        for (const std::string& name : named->names) {
            std::error_code err;

            if (!fs::exists(fs::symlink_status(source_dir / name, err))) {
                LOG_DEBUG("Required file '{}' is missing from {}", name, source_dir);
                return AssemblyError{.kind = AssemblyError::Kind::MissingFile, .detail = name};
            }
        }
    }

    try {
        if (!context_dir.empty()) {
            copy_all(context_dir);
        }

        std::visit(Overloaded{
                       [&](const CollectAll&) { copy_all(source_dir); },
                       [&](const CollectNamed& named) {
                           for (const std::string& name : named.names) {
                               const fs::path dest = path_ / name;

                               // Named files may live in a subdirectory (e.g. "src/main.c"), which must not be
                               // a link copied from the context
                               fs::path parent = path_;
                               for (const fs::path& part : fs::path{name}.parent_path()) {
                                   parent /= part;
                                   if (fs::is_symlink(fs::symlink_status(parent))) {
                                       fs::remove(parent);
                                   }
                               }
                               fs::create_directories(dest.parent_path());
                               copy_entry(source_dir / name, dest);
                           }
                       },
                   },
                   selection);
    } catch (const fs::filesystem_error& ex) {
        LOG_DEBUG("Copy into sandbox {} failed: {}", path_, ex.what());
        return AssemblyError{.kind = AssemblyError::Kind::CopyFailure, .detail = ex.what()};
    }

    return {};
}

void Sandbox::copy_all(const fs::path& dir) const {
    for (const fs::directory_entry& entry : fs::directory_iterator{dir}) {
        copy_entry(entry.path(), path_ / entry.path().filename());
    }
}

void Sandbox::copy_entry(const fs::path& entry, const fs::path& dest) const {
    const fs::file_status entry_status = fs::symlink_status(entry);
    const fs::file_status dest_status = fs::symlink_status(dest);

    if (fs::is_symlink(dest_status) || (fs::exists(dest_status) && fs::is_symlink(entry_status))) {
        // Never write through a link already in the sandbox; copy_symlink also refuses to replace an existing entry
        fs::remove_all(dest);
    } else if (fs::is_directory(entry_status) && fs::is_directory(dest_status)) {
        // Merge one entry at a time, so that links nested in `dest` are replaced as well
        for (const fs::directory_entry& child : fs::directory_iterator{entry}) {
            copy_entry(child.path(), dest / child.path().filename());
        }
        return;
    }

    // Symbolic links are copied as links, never followed
    fs::copy(entry, dest,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks | fs::copy_options::overwrite_existing);
}

} // namespace batchgrader
