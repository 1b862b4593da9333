#include "argument_parser.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

const std::string KOKKOS_PREFIX = "--kokkos-";

std::string join(const std::vector<std::string>& values, const std::string& quote) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += quote + values[i] + quote;
    }
    return out;
}

// Strip one or two leading dashes
std::string option_name(const std::string& token) {
    size_t dashes = (token.size() > 1 && token[1] == '-') ? 2 : 1;
    return token.substr(dashes);
}

} // namespace

ArgumentParser::ArgumentParser(const std::string& program_name, const std::string& description)
    : program_name_(program_name)
    , description_(description)
{
}

void ArgumentParser::add_argument(const std::string& name, const std::string& help) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.kind = Kind::Positional;
    positional_args_.push_back(arg);
}

void ArgumentParser::add_option(const std::string& name, const std::string& help,
                                const std::string& default_value) {
    add_option(name, help, default_value, {});
}

void ArgumentParser::add_option(const std::string& name, const std::string& help,
                                const std::string& default_value,
                                const std::vector<std::string>& choices) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.kind = Kind::Option;
    arg.default_value = default_value;
    arg.choices = choices;

    if (!default_value.empty() && !accepts(arg, default_value)) {
        std::cerr << "Warning: Default value '" << default_value << "' for option '"
                  << name << "' is not one of " << join(choices, "'") << std::endl;
    }
    options_[name] = arg;
}

void ArgumentParser::add_flag(const std::string& name, const std::string& help) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.kind = Kind::Flag;
    arg.default_value = "false";
    options_[name] = arg;
}

bool ArgumentParser::fail(const std::string& message) const {
    std::cerr << message << std::endl;
    print_help();
    return false;
}

bool ArgumentParser::accepts(const Argument& arg, const std::string& value) const {
    return arg.choices.empty() ||
           std::find(arg.choices.begin(), arg.choices.end(), value) != arg.choices.end();
}

bool ArgumentParser::assign_option(const std::vector<std::string>& args, size_t& i) {
    const std::string& token = args[i];
    std::string name = option_name(token);

    std::string inline_value;
    bool has_inline_value = false;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name = name.substr(0, eq);
        has_inline_value = true;
    }

    auto it = options_.find(name);
    if (it == options_.end()) {
        return fail("Unknown option: " + token);
    }
    Argument& arg = it->second;

    if (arg.kind == Kind::Flag) {
        if (has_inline_value) {
            return fail("Flag --" + name + " does not take a value");
        }
        arg.value = "true";
        return true;
    }

    std::string value;
    if (has_inline_value) {
        value = inline_value;
    } else if (i + 1 < args.size() && args[i + 1].compare(0, 1, "-") != 0) {
        value = args[++i];
    } else {
        return fail("Option " + token + " requires a value");
    }

    if (!accepts(arg, value)) {
        return fail("Error: Invalid value '" + value + "' for option '" + name +
                    "'. Valid values are: " + join(arg.choices, "'"));
    }
    arg.value = value;
    return true;
}

bool ArgumentParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);

    if (std::find_if(args.begin(), args.end(), [](const std::string& a) {
            return a == "-h" || a == "--help";
        }) != args.end()) {
        print_help();
        return false;
    }

    size_t n_positional = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (token.compare(0, KOKKOS_PREFIX.size(), KOKKOS_PREFIX) == 0) {
            continue;
        }
        if (token.compare(0, 1, "-") == 0) {
            if (!assign_option(args, i)) {
                return false;
            }
            continue;
        }
        if (n_positional >= positional_args_.size()) {
            return fail("Too many positional arguments");
        }
        positional_args_[n_positional++].value = token;
    }

    if (n_positional < positional_args_.size()) {
        return fail("Not enough positional arguments");
    }

    for (auto& entry : options_) {
        if (entry.second.value.empty()) {
            entry.second.value = entry.second.default_value;
        }
    }
    return true;
}

std::string ArgumentParser::get_positional(size_t index) const {
    return index < positional_args_.size() ? positional_args_[index].value : std::string();
}

std::string ArgumentParser::get_option(const std::string& name) const {
    auto it = options_.find(name);
    return it != options_.end() ? it->second.value : std::string();
}

double ArgumentParser::get_double(const std::string& name) const {
    std::string value = get_option(name);
    try {
        size_t pos = 0;
        double result = std::stod(value, &pos);
        if (pos == value.size()) {
            return result;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw std::invalid_argument("Option '" + name + "' expects a number, got '" + value + "'");
}

int ArgumentParser::get_int(const std::string& name) const {
    std::string value = get_option(name);
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos == value.size()) {
            return result;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw std::invalid_argument("Option '" + name + "' expects an integer, got '" + value + "'");
}

bool ArgumentParser::get_flag(const std::string& name) const {
    auto it = options_.find(name);
    return it != options_.end() && it->second.kind == Kind::Flag && it->second.value == "true";
}

void ArgumentParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_;
    for (const auto& arg : positional_args_) {
        out << " <" << arg.name << ">";
    }
    out << (options_.empty() ? "" : " [options]") << "\n\n" << description_ << "\n\n";

    if (!positional_args_.empty()) {
        out << "Positional arguments:\n";
        for (const auto& arg : positional_args_) {
            out << "  " << arg.name << "\t" << arg.help << "\n";
        }
        out << "\n";
    }

    out << "Optional arguments:\n";
    out << "  -h, --help\tShow this help message and exit\n";
    for (const auto& entry : options_) {
        const Argument& arg = entry.second;
        out << "  --" << arg.name << (arg.kind == Kind::Flag ? "" : " VALUE") << "\t" << arg.help;
        if (arg.kind == Kind::Option && !arg.default_value.empty()) {
            out << " (default: " << arg.default_value << ")";
        }
        if (!arg.choices.empty()) {
            out << " [choices: " << join(arg.choices, "") << "]";
        }
        out << "\n";
    }
    out << std::flush;
}

ArgumentParser ArgumentParser::kadmos_loop_parser(const std::string& program_name) {
    ArgumentParser parser(program_name, "KADMOS steady-state boiling water loop solver");

    // Core channel operating mode
    parser.add_option("mode", "Core mode", "target-void", {"target-void", "fixed-power"});
    parser.add_option("target_void", "Core exit void fraction target [-]", "0.40");
    parser.add_option("power", "Core power for fixed-power mode, duty guess otherwise [W]", "5e7");
    parser.add_option("friction", "Two-phase friction model", "homogeneous", {"homogeneous", "chisholm"});

    // Newton solver controls
    parser.add_option("max_iter", "Maximum number of Newton iterations", "60");
    parser.add_option("tol", "Scaled residual norm tolerance", "1e-7");
    parser.add_option("xtol", "Newton step norm tolerance", "1e-9");
    parser.add_option("fd_eps", "Relative finite difference step", "1e-6");
    parser.add_flag("no-damping", "Take full Newton steps without line search");
    parser.add_option("verbosity", "Diagnostics level", "1", {"0", "1", "2"});

    parser.add_option("output", "HDF5 file for the converged state", "");

    return parser;
}
