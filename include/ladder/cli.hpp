#pragma once
#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace ladder {

// Parse a decimal integer in [minVal, maxVal].
// Throws std::invalid_argument (not a number) or std::out_of_range (outside the bounds).
long long parse_int64(const std::string& s, long long minVal, long long maxVal);

// Small command-line parser shared by the executables under algorithms/.
// Long options (--name VALUE), single-letter short options (-n VALUE), flags,
// defaults, required options, an "inf" token for unbounded sizes, and
// optional trailing positional arguments.
enum class ArgType { Flag, String, Int64, Size };

struct OptionSpec {
    std::string longName;        // "dict"
    char shortName = '\0';       // 'd', or '\0' for none
    ArgType type = ArgType::String;
    std::string valueName;       // "FILE"; unused for flags
    std::string help;
    bool required = false;
    std::string defaultValue;    // empty = no default
    bool allowInfToken = false;  // Size only: "inf" maps to SIZE_MAX
};

class ArgParser {
public:
    explicit ArgParser(std::string description = "");

    void add_option(const OptionSpec& opt);
    void add_flag(const std::string& longName, char shortName, const std::string& help);

    // Accept bare arguments; name is shown in usage ("WORD...").
    void allow_positionals(std::string name, std::string help);

    // Returns false if --help/-h was given. Throws std::runtime_error on bad input.
    bool parse(int argc, char** argv);

    bool provided(const std::string& longName) const;

    std::string get_string(const std::string& longName) const;
    long long get_int64(const std::string& longName) const;
    std::size_t get_size(const std::string& longName) const;
    bool get_flag(const std::string& longName) const;

    const std::vector<std::string>& positionals() const { return positionals_; }

    std::string usage(const std::string& progName) const;
    std::string help(const std::string& progName) const;

private:
    struct InternalOpt {
        OptionSpec spec;
        bool isFlag = false;
    };

    std::string desc_;
    std::vector<InternalOpt> opts_;
    std::unordered_map<std::string, std::size_t> indexByLong_;
    std::unordered_map<char, std::size_t> indexByShort_;
    std::unordered_map<std::string, std::string> values_;
    std::unordered_map<std::string, bool> present_;
    std::vector<std::string> positionals_;
    std::string positionalName_;   // empty = positionals rejected
    std::string positionalHelp_;
    bool helpRequested_ = false;

    const InternalOpt* find_long(const std::string& name) const;
    const InternalOpt* find_short(char c) const;
    const OptionSpec& spec_of(const std::string& longName) const;
    void take_value(const InternalOpt& io, const std::string& shown, int& i, int argc, char** argv);
};

} // namespace ladder
