/**
 * @file
 * @brief Argument parser component
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <common/argParser.hpp>

#include <algorithm>
#include <iomanip>
#include <map>

#include <getopt.h>

namespace resprint {

bool Args::has(char short_opt) const {
    return std::any_of(m_named_args.begin(), m_named_args.end(), [=](const NamedArg &arg) { return arg.short_opt == short_opt; });
}

bool Args::has(const std::string &long_opt) const {
    return std::any_of(m_named_args.begin(), m_named_args.end(), [&](const NamedArg &arg) { return arg.long_opt == long_opt; });
}

size_t Args::count(char short_opt) const {
    return std::count_if(m_named_args.begin(), m_named_args.end(), [=](const NamedArg &arg) { return arg.short_opt == short_opt; });
}

std::string Args::get(char short_opt) const {
    auto it = std::find_if(m_named_args.rbegin(), m_named_args.rend(), [&](const NamedArg &arg) { return arg.short_opt == short_opt; });
    if (it == m_named_args.rend()) {
        return "";
    }
    return it->value;
}

std::string Args::get(const std::string &long_opt) const {
    auto it = std::find_if(m_named_args.rbegin(), m_named_args.rend(), [&](const NamedArg &arg) { return arg.long_opt == long_opt; });
    if (it == m_named_args.rend()) {
        return "";
    }
    return it->value;
}

void ArgParser::add(char short_opt, const std::string &long_opt,
    const std::string &value_name, const std::string &help)
{
    m_defs.push_back({short_opt, long_opt, value_name, help});
}

Args ArgParser::parse(int argc, char **argv) const {
    std::string short_opts = ":";
    std::vector<option> long_opts;
    int next_nonchar_val = 256;

    std::map<int, const ArgDef *> val_to_arg_map;

    for (const auto &def : m_defs) {
        if (def.short_opt != 0) {
            short_opts.push_back(def.short_opt);
            if (def.requires_value()) {
                short_opts.append(":");
            }
        }

        if (def.long_opt.empty()) {
            val_to_arg_map.emplace(def.short_opt, &def);
            continue;
        }

        option getopt_option = {};
        getopt_option.name = def.long_opt.c_str();
        getopt_option.has_arg = def.requires_value() ? required_argument : no_argument;
        getopt_option.val = (def.short_opt != 0) ? def.short_opt : next_nonchar_val++;

        long_opts.push_back(getopt_option);
        val_to_arg_map.emplace(getopt_option.val, &def);
    }

    long_opts.push_back({0, 0, 0, 0});

    // Parse args
    Args parsed;
    opterr = 0;
    optind = 1;
    int opt;

    while ((opt = getopt_long(argc, argv, short_opts.c_str(), long_opts.data(), nullptr)) != -1) {
        if (opt == '?') {
            throw ArgParser::UnknownArgument {argv[optind - 1]};
        }
        if (opt == ':') {
            throw ArgParser::MissingArgument {argv[optind - 1]};
        }

        const ArgDef *def = val_to_arg_map[opt];

        Args::NamedArg arg;
        arg.short_opt = def->short_opt;
        arg.long_opt = def->long_opt;
        if (optarg) {
            arg.value = optarg;
        }
        parsed.m_named_args.push_back(arg);
    }

    // Collect remaining positional arguments
    for (int i = optind; i < argc; i++) {
        parsed.m_pos_args.push_back(argv[i]);
    }

    return parsed;
}

void ArgParser::print_options(std::ostream &out) const
{
    for (const auto &def : m_defs) {
        std::string names;

        if (def.short_opt != 0) {
            names.append("-").push_back(def.short_opt);
        }
        if (!def.long_opt.empty()) {
            names.append(names.empty() ? "    --" : ", --").append(def.long_opt);
        }
        if (def.requires_value()) {
            names.append(" ").append(def.value_name);
        }

        out << "  " << std::left << std::setw(32) << names << " " << def.help << "\n";
    }
}

} // resprint
