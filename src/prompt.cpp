#include "prompt.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <istream>
#include <ostream>

ConsolePromptSource::ConsolePromptSource(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

InstallMode ConsolePromptSource::choose_mode() {
    while (true) {
        out_ << get_string("prompt.install_type") << "\n"
             << get_string("prompt.install_type_system") << "\n"
             << get_string("prompt.install_type_user") << "\n"
             << get_string("prompt.install_type_choice") << " " << std::flush;

        std::string choice;
        if (!std::getline(in_, choice)) {
            throw GosetupException(ErrorKind::InputAborted, get_string("error.input_closed"));
        }
        const std::string value = trim(choice);
        if (value == "1") return InstallMode::System;
        if (value == "2") return InstallMode::User;
        out_ << get_string("prompt.invalid_choice") << "\n";
    }
}

std::optional<std::string> ConsolePromptSource::choose_version(const ReleaseVersion& latest) {
    out_ << string_format("prompt.latest_version", latest.str()) << "\n"
         << string_format("prompt.enter_version", latest.str()) << " " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        throw GosetupException(ErrorKind::InputAborted, get_string("error.input_closed"));
    }
    return answer;
}
