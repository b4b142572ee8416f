#include "sprig/cli/command.hpp"

#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "sprig/log/logger.hpp"

namespace po = boost::program_options;

namespace sprig::cli {

namespace {

constexpr const char* POSITIONAL = "__args";

po::options_description describe_flags(const std::vector<FlagSpec>& flags) {
    po::options_description visible("Options");
    visible.add_options()("help,h", "Show help message");

    for (const auto& flag : flags) {
        std::string names = flag.name;
        if (!flag.short_name.empty()) {
            names += "," + flag.short_name;
        }
        switch (flag.kind) {
            case FlagKind::BOOL:
                visible.add_options()(names.c_str(), flag.description.c_str());
                break;
            case FlagKind::INT:
                visible.add_options()(names.c_str(), po::value<int>(),
                                      flag.description.c_str());
                break;
            case FlagKind::STRING:
                visible.add_options()(names.c_str(), po::value<std::string>(),
                                      flag.description.c_str());
                break;
        }
    }
    return visible;
}

std::string provided_value(const FlagSpec& flag, const po::variable_value& v) {
    switch (flag.kind) {
        case FlagKind::BOOL:
            return "true";
        case FlagKind::INT:
            return std::to_string(v.as<int>());
        case FlagKind::STRING:
            break;
    }
    return v.as<std::string>();
}

}  // namespace

Command::Command(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Command::add_command(std::shared_ptr<Command> command) {
    command->parent_ = this;
    subcommands_.push_back(std::move(command));
}

std::shared_ptr<Command> Command::find_command(const std::string& name) const {
    auto it = std::find_if(
        subcommands_.begin(), subcommands_.end(),
        [&name](const std::shared_ptr<Command>& c) { return c->name() == name; });
    return it == subcommands_.end() ? nullptr : *it;
}

void Command::add_flag(FlagSpec flag) {
    if (flag.name.empty()) {
        throw std::invalid_argument("Flag of command '" + name_ +
                                    "' has no name");
    }
    flags_.push_back(std::move(flag));
}

void Command::add_string_flag(const std::string& name,
                              const std::string& short_name,
                              const std::string& description,
                              const std::string& default_value) {
    add_flag({name, short_name, description, default_value, FlagKind::STRING});
}

void Command::add_bool_flag(const std::string& name,
                            const std::string& description) {
    add_flag({name, "", description, "false", FlagKind::BOOL});
}

void Command::add_int_flag(const std::string& name,
                           const std::string& description, int default_value) {
    add_flag({name, "", description, std::to_string(default_value),
              FlagKind::INT});
}

std::ostream& Command::out() const {
    if (out_ != nullptr) return *out_;
    if (parent_ != nullptr) return parent_->out();
    return std::cout;
}

int Command::execute(int argc, const char* const argv[]) {
    return execute(std::vector<std::string>(argv + std::min(argc, 1),
                                            argv + argc));
}

int Command::execute(const std::vector<std::string>& args) {
    try {
        return dispatch(args);
    } catch (const std::exception& e) {
        SPRIG_LOG_ERROR << "Command '" << name_ << "' failed: " << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int Command::dispatch(const std::vector<std::string>& args) {
    if (!args.empty()) {
        if (auto sub = find_command(args.front())) {
            SPRIG_LOG_DEBUG << "Dispatching '" << name_ << "' to '"
                            << sub->name() << "'";
            return sub->dispatch(
                std::vector<std::string>(args.begin() + 1, args.end()));
        }
    }

    po::options_description all = describe_flags(flags_);
    all.add_options()(POSITIONAL, po::value<std::vector<std::string>>());
    po::positional_options_description positional;
    positional.add(POSITIONAL, -1);

    po::variables_map vm;
    po::store(
        po::command_line_parser(args).options(all).positional(positional).run(),
        vm);
    po::notify(vm);

    if (vm.count("help") > 0) {
        print_help();
        return 0;
    }

    CommandContext ctx;
    for (const auto& flag : flags_) {
        if (vm.count(flag.name) > 0) {
            ctx.set_provided(flag.name, provided_value(flag, vm[flag.name]));
        } else {
            ctx.set_default(flag.name, flag.default_value);
        }
    }
    if (vm.count(POSITIONAL) > 0) {
        for (const auto& arg : vm[POSITIONAL].as<std::vector<std::string>>()) {
            ctx.add_arg(arg);
        }
    }
    return run(ctx);
}

void Command::print_help() const {
    std::ostream& os = out();
    os << name_ << " - " << description_ << "\n\n";
    os << "Usage: " << name_ << (flags_.empty() ? "" : " [OPTIONS]")
       << (subcommands_.empty() ? "" : " <COMMAND>") << "\n\n";

    if (!subcommands_.empty()) {
        os << "Available Commands:\n";
        for (const auto& sub : subcommands_) {
            os << "  " << std::left << std::setw(12) << sub->name()
               << sub->description() << "\n";
        }
        os << "\n";
    }

    if (!flags_.empty()) {
        os << "Flags:\n";
        for (const auto& flag : flags_) {
            std::string names = "--" + flag.name;
            if (!flag.short_name.empty()) {
                names += ", -" + flag.short_name;
            }
            os << "  " << std::left << std::setw(20) << names
               << flag.description;
            if (flag.kind != FlagKind::BOOL && !flag.default_value.empty()) {
                os << " (default: " << flag.default_value << ")";
            }
            os << "\n";
        }
        os << "\n";
    }

    if (!example_.empty()) {
        os << "Examples:\n" << example_ << "\n\n";
    }
    if (!subcommands_.empty()) {
        os << "Use '" << name_
           << " <command> --help' for more information about a command.\n";
    }
    os.flush();
}

void CommandContext::set_default(const std::string& name, std::string value) {
    values_[name] = std::move(value);
}

void CommandContext::set_provided(const std::string& name, std::string value) {
    values_[name] = std::move(value);
    provided_.insert(name);
}

std::string CommandContext::get_flag(const std::string& name) const {
    auto it = values_.find(name);
    return it == values_.end() ? std::string() : it->second;
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    return get_flag(name) == "true";
}

int CommandContext::get_int_flag(const std::string& name) const {
    const std::string value = get_flag(name);
    try {
        return boost::lexical_cast<int>(value);
    } catch (const boost::bad_lexical_cast&) {
        throw std::invalid_argument("Flag --" + name +
                                    " is not an integer: '" + value + "'");
    }
}

}  // namespace sprig::cli
