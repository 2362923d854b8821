#pragma once

#include <ftxui/dom/elements.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>

/// Plain-terminal rendering of daemon responses for the CLI
class StatusView {
public:
    /// Server status plus the optional "watchdog" section
    static ftxui::Element status(const nlohmann::json& status);

    static ftxui::Element debug(const nlohmann::json& debug);

    /// Response of the "health" command
    static ftxui::Element health(const nlohmann::json& health);

    /// Render once to a string sized to the element
    static std::string to_text(const ftxui::Element& element, int width = 80);

    static std::string format_duration(double seconds);
    static std::string format_percent(double value);
    static std::string format_mb(double mb);
};
