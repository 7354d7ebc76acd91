#pragma once

#include <batchgrader/common/class_traits.hpp>

#include "output/sink.hpp"

#include <filesystem>
#include <fstream>
#include <string_view>

namespace batchgrader {

/// Writes to a file, truncating it on open.
/// Every failure throws `IoError`.
class FileSink : public Sink, NonCopyable
{
public:
    explicit FileSink(std::filesystem::path path);

    void write(std::string_view str) override;
    void flush() override;

    /// Flushes and closes the file; throws if buffered data could not be written
    void close();

    ~FileSink() override;

    const std::filesystem::path& get_path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream file_;
};

} // namespace batchgrader
