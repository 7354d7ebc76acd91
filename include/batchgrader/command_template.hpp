#pragma once

#include <batchgrader/common/expected.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace batchgrader {

/// A shell command with (at most) one named slot for a file path.
///
/// The slot is the shell's positional parameter `$0` (or `${0}`). Commands are run as
/// `/bin/sh -c <text> <path>`, so the path bound to the slot is passed as an argument and is never
/// spliced into the shell source.
class CommandTemplate
{
public:
    enum class SlotPolicy {
        None,    ///< The command takes no file path (build commands)
        Required ///< The command must reference the slot (test commands)
    };

    static constexpr std::string_view SLOT = "$0";
    static constexpr std::string_view SHELL = "/bin/sh";

    /// Validates `text` against `policy`
    /// Returns an error message if a required slot is missing, or if a slot appears where none is allowed
    static Expected<CommandTemplate, std::string> parse(std::string text, SlotPolicy policy);

    /// Whether the template has no command at all; an empty build command means "no build step"
    bool empty() const noexcept { return text_.empty(); }

    const std::string& text() const noexcept { return text_; }

    SlotPolicy policy() const noexcept { return policy_; }

    /// The argument vector passed to `SHELL` (not including `SHELL` itself) to run this command
    /// `slot_value` must be given if and only if the policy is `Required`
    std::vector<std::string> to_shell_args(const std::optional<std::filesystem::path>& slot_value) const;

    /// Human-readable rendition of the command with the slot textually replaced, for diagnostics only
    std::string describe(const std::optional<std::filesystem::path>& slot_value = std::nullopt) const;

    /// Whether `text` references the shell positional parameter 0
    static bool references_slot(std::string_view text);

    bool operator==(const CommandTemplate& rhs) const = default;

private:
    CommandTemplate(std::string text, SlotPolicy policy);

    std::string text_;
    SlotPolicy policy_;
};

} // namespace batchgrader
