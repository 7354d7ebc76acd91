#include <batchgrader/command_template.hpp>

#include <batchgrader/common/expected.hpp>
#include <batchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <libassert/assert.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

namespace {

constexpr std::string_view BRACED_SLOT = "${0}";

struct SlotRef
{
    std::size_t pos;
    std::size_t len;
};

/// Every slot reference in `text` that the shell would expand, in order.
/// Escaped dollars, "$$", and anything inside single quotes are skipped.
std::vector<SlotRef> find_slots(std::string_view text) {
    std::vector<SlotRef> slots;
    bool in_double_quotes = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\') {
            // Skip whatever is escaped, e.g. "\$0"
            ++i;
            continue;
        }

        if (text[i] == '"') {
            in_double_quotes = !in_double_quotes;
            continue;
        }

        if (text[i] == '\'' && !in_double_quotes) {
            const std::size_t closing = text.find('\'', i + 1);

            if (closing == std::string_view::npos) {
                break;
            }

            i = closing;
            continue;
        }

        if (text.substr(i).starts_with("$$")) {
            // The shell's pid
            ++i;
            continue;
        }

        if (text.substr(i).starts_with(CommandTemplate::SLOT)) {
            slots.push_back({.pos = i, .len = CommandTemplate::SLOT.size()});
            i += CommandTemplate::SLOT.size() - 1;
        } else if (text.substr(i).starts_with(BRACED_SLOT)) {
            slots.push_back({.pos = i, .len = BRACED_SLOT.size()});
            i += BRACED_SLOT.size() - 1;
        }
    }

    return slots;
}

} // namespace

CommandTemplate::CommandTemplate(std::string text, SlotPolicy policy)
    : text_{std::move(text)}
    , policy_{policy} {}

Expected<CommandTemplate, std::string> CommandTemplate::parse(std::string text, SlotPolicy policy) {
    const bool has_slot = references_slot(text);

    switch (policy) {
    case SlotPolicy::Required:
        if (text.empty()) {
            return "Test command is empty";
        }
        if (!has_slot) {
            return fmt::format("Test command {:?} does not reference the test file (use {:?})", text, SLOT);
        }
        break;
    case SlotPolicy::None:
        if (has_slot) {
            return fmt::format("Command {:?} references {:?}, but no file is bound to it", text, SLOT);
        }
        break;
    }

    return CommandTemplate{std::move(text), policy};
}

bool CommandTemplate::references_slot(std::string_view text) {
    return !find_slots(text).empty();
}

std::vector<std::string> CommandTemplate::to_shell_args(const std::optional<std::filesystem::path>& slot_value) const {
    ASSERT(slot_value.has_value() == (policy_ == SlotPolicy::Required), "Slot binding does not match the policy",
           text_);

    // sh -c <command_string> [command_name]
    // command_name is assigned to $0 within the command string. See sh(1p)
    std::vector<std::string> args{"-c", text_};

    if (slot_value) {
        args.push_back(slot_value->string());
    }

    return args;
}

std::string CommandTemplate::describe(const std::optional<std::filesystem::path>& slot_value) const {
    if (!slot_value) {
        return text_;
    }

    std::string result;
    std::size_t pos = 0;

    for (const SlotRef& slot : find_slots(text_)) {
        result.append(text_, pos, slot.pos - pos);
        result += slot_value->string();
        pos = slot.pos + slot.len;
    }

    result.append(text_, pos);

    return result;
}

} // namespace batchgrader
