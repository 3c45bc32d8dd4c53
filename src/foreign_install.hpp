#pragma once

#include <string>

// A copy of the distribution installed by some other package manager.
// Used for best-effort cleanup only; failures never abort an install.
class ForeignInstallDetector {
public:
    virtual ~ForeignInstallDetector() = default;

    virtual std::string name() const = 0;
    virtual bool is_installed() = 0;
    virtual void remove() = 0;  // throws PreviousRemovalError
};

// `brew list --cask golang` / `brew uninstall --cask golang`
class HomebrewCaskDetector : public ForeignInstallDetector {
public:
    explicit HomebrewCaskDetector(std::string cask = "golang");

    std::string name() const override;
    bool is_installed() override;
    void remove() override;

private:
    std::string cask_;
};
