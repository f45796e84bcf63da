#include "dojo/parser/ArgumentParser.hh"

#include <algorithm>
#include <sstream>

namespace dojo {

void ArgumentParser::addArgument(const std::string& name, const std::string& description, bool takesValue) {
    options_.push_back(Option{name, description, takesValue});
}

bool ArgumentParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

bool ArgumentParser::parse(const std::vector<std::string>& args) {
    values_.clear();
    valid_ = true;
    errorMsg_.clear();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const Option* opt = find(arg);
        if (!opt) {
            valid_ = false;
            errorMsg_ = "Unknown argument: " + arg;
            return false;
        }

        if (!opt->takesValue) {
            values_[arg] = "";
            continue;
        }

        if (i + 1 >= args.size()) {
            valid_ = false;
            errorMsg_ = "Missing value for " + arg;
            return false;
        }
        values_[arg] = args[++i];
    }
    return true;
}

bool ArgumentParser::hasArgument(const std::string& name) const {
    return values_.count(name) > 0;
}

std::optional<std::string> ArgumentParser::getValue(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

bool ArgumentParser::isValid() const {
    return valid_;
}

const std::string& ArgumentParser::getErrorMsg() const {
    return errorMsg_;
}

std::string ArgumentParser::helpText() const {
    size_t width = 0;
    for (const auto& opt : options_) {
        width = std::max(width, opt.name.size() + (opt.takesValue ? 8 : 0));
    }

    std::ostringstream oss;
    for (const auto& opt : options_) {
        std::string left = opt.name + (opt.takesValue ? " <value>" : "");
        oss << "  " << left << std::string(width - left.size() + 4, ' ') << opt.description << "\n";
    }
    return oss.str();
}

const ArgumentParser::Option* ArgumentParser::find(const std::string& name) const {
    auto it = std::find_if(options_.begin(), options_.end(), [&name](const Option& o) { return o.name == name; });
    return it != options_.end() ? &*it : nullptr;
}

} // namespace dojo
