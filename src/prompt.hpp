#pragma once

#include "install_plan.hpp"
#include "version.hpp"

#include <iosfwd>
#include <optional>
#include <string>

class PromptSource {
public:
    virtual ~PromptSource() = default;

    virtual InstallMode choose_mode() = 0;
    // nullopt or an empty string selects `latest`.
    virtual std::optional<std::string> choose_version(const ReleaseVersion& latest) = 0;
};

class ConsolePromptSource : public PromptSource {
public:
    ConsolePromptSource(std::istream& in, std::ostream& out);

    InstallMode choose_mode() override;
    std::optional<std::string> choose_version(const ReleaseVersion& latest) override;

private:
    std::istream& in_;
    std::ostream& out_;
};
