#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dojo {

// Minimal "--flag" / "--option value" command line parser.
class ArgumentParser {
  public:
    ArgumentParser() = default;

    // Register an option; takesValue options consume the next argv entry.
    void addArgument(const std::string& name, const std::string& description, bool takesValue = false);

    // Returns false on an unknown option or a missing value; see getErrorMsg().
    bool parse(int argc, char* argv[]);
    bool parse(const std::vector<std::string>& args);

    bool hasArgument(const std::string& name) const;
    std::optional<std::string> getValue(const std::string& name) const;

    bool isValid() const;
    const std::string& getErrorMsg() const;

    // One line per registered option, in registration order.
    std::string helpText() const;

  private:
    struct Option {
        std::string name;
        std::string description;
        bool takesValue = false;
    };

    const Option* find(const std::string& name) const;

    std::vector<Option> options_;
    std::unordered_map<std::string, std::string> values_;
    bool valid_ = true;
    std::string errorMsg_;
};

} // namespace dojo
