#pragma once

#include <iostream>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Small command-line parser for the KADMOS drivers
 *
 * Options are given as "--name value", "--name=value" or "-name value"; flags take no
 * value. Arguments starting with "--kokkos-" are left for Kokkos::initialize.
 * parse() reports problems on std::cerr together with the help text and returns false.
 */
class ArgumentParser {
public:
    enum class Kind { Positional, Option, Flag };

    struct Argument {
        std::string name;
        std::string help;
        Kind kind = Kind::Option;
        std::string default_value;
        std::string value;
        std::vector<std::string> choices;   // empty when any value is accepted
    };

    ArgumentParser(const std::string& program_name, const std::string& description);

    // Required positional argument, filled in declaration order
    void add_argument(const std::string& name, const std::string& help);
    void add_option(const std::string& name, const std::string& help,
                    const std::string& default_value = "");
    // Option restricted to a list of choices
    void add_option(const std::string& name, const std::string& help,
                    const std::string& default_value,
                    const std::vector<std::string>& choices);
    void add_flag(const std::string& name, const std::string& help);

    bool parse(int argc, char* argv[]);

    std::string get_positional(size_t index) const;
    std::string get_option(const std::string& name) const;
    // Numeric views of an option; throw std::invalid_argument on malformed text
    double get_double(const std::string& name) const;
    int get_int(const std::string& name) const;
    bool get_flag(const std::string& name) const;

    void print_help(std::ostream& out = std::cerr) const;

    // Options of the kadmos_loop driver
    static ArgumentParser kadmos_loop_parser(const std::string& program_name);

private:
    std::string program_name_;
    std::string description_;
    std::vector<Argument> positional_args_;
    std::map<std::string, Argument> options_;

    bool fail(const std::string& message) const;
    bool accepts(const Argument& arg, const std::string& value) const;
    bool assign_option(const std::vector<std::string>& args, size_t& i);
};
