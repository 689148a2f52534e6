#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace cortex::protocol {

    // Call-time options for one agent invocation.
    // Unset fields fall back to the adapter's configured default, else the flag is omitted.
    struct InvocationOptions {
        bool json_output = false;
        std::optional<std::string> model;
        std::optional<bool> auto_approve;
        std::optional<std::string> system_prompt;
        std::optional<std::uint32_t> max_turns;
    };

} // namespace cortex::protocol
