#include "output/file_sink.hpp"

#include <batchgrader/exceptions.hpp>
#include <batchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <fstream>
#include <ios>
#include <string_view>
#include <utility>

namespace batchgrader {

FileSink::FileSink(std::filesystem::path path)
    : path_{std::move(path)}
    , file_{path_, std::ios::out | std::ios::trunc | std::ios::binary} {
    if (!file_) {
        throw IoError{fmt::format("Could not open {} for writing: {}", path_, get_err_msg())};
    }
}

void FileSink::write(std::string_view str) {
    file_.write(str.data(), static_cast<std::streamsize>(str.size()));

    if (!file_) {
        throw IoError{fmt::format("Could not write to {}: {}", path_, get_err_msg())};
    }
}

void FileSink::flush() {
    file_.flush();

    if (!file_) {
        throw IoError{fmt::format("Could not write to {}: {}", path_, get_err_msg())};
    }
}

void FileSink::close() {
    if (!file_.is_open()) {
        return;
    }

    flush();
    file_.close();

    if (!file_) {
        throw IoError{fmt::format("Could not close {}: {}", path_, get_err_msg())};
    }
}

FileSink::~FileSink() {
    // Errors can't be reported from here; call close() to observe them
    if (file_.is_open()) {
        file_.close();

        if (!file_) {
            LOG_WARN("Failed to close {}", path_);
        }
    }
}

} // namespace batchgrader
