#pragma once
#include <iosfwd>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sprig::cli {

class CommandContext;

enum class FlagKind { STRING, BOOL, INT };

/// One `--name` / `-s` option of a command.
struct FlagSpec {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    FlagKind kind = FlagKind::STRING;
};

/**
 * @brief Node of a command tree parsed with Boost.ProgramOptions.
 *
 * The first positional argument that names a subcommand dispatches to it;
 * everything else is parsed against this command's flags and handed to
 * run(). Exceptions escaping run() are logged and turned into exit code 1.
 */
class Command {
public:
    Command(std::string name, std::string description);
    virtual ~Command() = default;

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }

    void add_command(std::shared_ptr<Command> command);
    std::shared_ptr<Command> find_command(const std::string& name) const;

    void add_flag(FlagSpec flag);
    void add_string_flag(const std::string& name, const std::string& short_name,
                         const std::string& description,
                         const std::string& default_value = "");
    void add_bool_flag(const std::string& name, const std::string& description);
    void add_int_flag(const std::string& name, const std::string& description,
                      int default_value);

    Command& set_example(std::string example) {
        example_ = std::move(example);
        return *this;
    }

    virtual int run(CommandContext& ctx) = 0;

    /// argv[0] is the program name.
    int execute(int argc, const char* const argv[]);
    int execute(const std::vector<std::string>& args);

    void print_help() const;

    /// Help and command output; inherited from the parent when unset.
    void set_output(std::ostream& out) { out_ = &out; }
    std::ostream& out() const;

private:
    int dispatch(const std::vector<std::string>& args);

    std::string name_;
    std::string description_;
    std::string example_;
    std::vector<FlagSpec> flags_;
    std::vector<std::shared_ptr<Command>> subcommands_;
    const Command* parent_ = nullptr;
    std::ostream* out_ = nullptr;
};

/// Flag values and positional arguments of one invocation.
class CommandContext {
public:
    void set_default(const std::string& name, std::string value);
    void set_provided(const std::string& name, std::string value);
    void add_arg(std::string arg) { args_.push_back(std::move(arg)); }

    std::string get_flag(const std::string& name) const;
    bool get_bool_flag(const std::string& name) const;
    /// Throws std::invalid_argument when the value is not an integer.
    int get_int_flag(const std::string& name) const;

    /// True when the flag was given on the command line rather than
    /// defaulted.
    bool is_user_provided(const std::string& name) const {
        return provided_.count(name) > 0;
    }

    const std::vector<std::string>& args() const { return args_; }

private:
    std::map<std::string, std::string> values_;
    std::set<std::string> provided_;
    std::vector<std::string> args_;
};

}  // namespace sprig::cli
