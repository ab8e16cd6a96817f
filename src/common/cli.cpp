#include "ladder/cli.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>

namespace ladder {

long long parse_int64(const std::string& s, long long minVal, long long maxVal) {
    long long value = 0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        throw std::invalid_argument("invalid integer: '" + s + "'");
    }
    if (value < minVal || value > maxVal) {
        throw std::out_of_range("value " + s + " outside [" + std::to_string(minVal) + ", " +
                                std::to_string(maxVal) + "]");
    }
    return value;
}

static bool is_inf_token(const std::string& s) {
    if (s.size() != 3) return false;
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "inf";
}

// ---------------- ArgParser ----------------

ArgParser::ArgParser(std::string description) : desc_(std::move(description)) {}

void ArgParser::add_option(const OptionSpec& opt) {
    std::size_t idx = opts_.size();
    opts_.push_back(InternalOpt{opt, false});
    indexByLong_[opt.longName] = idx;
    if (opt.shortName) indexByShort_[opt.shortName] = idx;
    if (!opt.defaultValue.empty()) values_[opt.longName] = opt.defaultValue;
}

void ArgParser::add_flag(const std::string& longName, char shortName, const std::string& help) {
    OptionSpec spec;
    spec.longName = longName;
    spec.shortName = shortName;
    spec.type = ArgType::Flag;
    spec.help = help;
    std::size_t idx = opts_.size();
    opts_.push_back(InternalOpt{spec, true});
    indexByLong_[longName] = idx;
    if (shortName) indexByShort_[shortName] = idx;
}

void ArgParser::allow_positionals(std::string name, std::string help) {
    positionalName_ = std::move(name);
    positionalHelp_ = std::move(help);
}

const ArgParser::InternalOpt* ArgParser::find_long(const std::string& name) const {
    auto it = indexByLong_.find(name);
    return it == indexByLong_.end() ? nullptr : &opts_[it->second];
}

const ArgParser::InternalOpt* ArgParser::find_short(char c) const {
    auto it = indexByShort_.find(c);
    return it == indexByShort_.end() ? nullptr : &opts_[it->second];
}

const OptionSpec& ArgParser::spec_of(const std::string& longName) const {
    const InternalOpt* io = find_long(longName);
    if (!io) throw std::logic_error("option --" + longName + " was never declared");
    return io->spec;
}

void ArgParser::take_value(const InternalOpt& io, const std::string& shown, int& i, int argc, char** argv) {
    if (io.isFlag) {
        present_[io.spec.longName] = true;
        if (io.spec.longName == "help") helpRequested_ = true;
        return;
    }
    if (i + 1 >= argc) throw std::runtime_error("missing value for " + shown);
    values_[io.spec.longName] = argv[++i];
    present_[io.spec.longName] = true;
}

bool ArgParser::parse(int argc, char** argv) {
    helpRequested_ = false;
    positionals_.clear();
    if (!find_long("help")) add_flag("help", 'h', "Show this help message and exit");

    bool options_done = false; // set by a bare "--"
    for (int i = 1; i < argc; ++i) {
        std::string tok = argv[i];
        if (!options_done && tok == "--") {
            options_done = true;
        } else if (!options_done && tok.rfind("--", 0) == 0) {
            std::string name = tok.substr(2);
            const InternalOpt* io = find_long(name);
            if (!io) throw std::runtime_error("unknown option '" + tok + "'");
            take_value(*io, tok, i, argc, argv);
        } else if (!options_done && tok.size() >= 2 && tok[0] == '-') {
            // One letter per dash; "-abc" is rejected rather than guessed at.
            if (tok.size() > 2) {
                throw std::runtime_error("invalid short option '" + tok + "'; use --<long> for long options");
            }
            const InternalOpt* io = find_short(tok[1]);
            if (!io) throw std::runtime_error("unknown option '" + tok + "'");
            take_value(*io, tok, i, argc, argv);
        } else {
            if (positionalName_.empty()) throw std::runtime_error("unexpected positional argument: " + tok);
            positionals_.push_back(tok);
        }
    }

    for (const auto& io : opts_) {
        if (io.spec.required && !provided(io.spec.longName) && io.spec.defaultValue.empty()) {
            throw std::runtime_error("missing required option --" + io.spec.longName);
        }
    }
    return !helpRequested_;
}

bool ArgParser::provided(const std::string& longName) const {
    auto it = present_.find(longName);
    return it != present_.end() && it->second;
}

std::string ArgParser::get_string(const std::string& longName) const {
    const OptionSpec& spec = spec_of(longName);
    auto it = values_.find(longName);
    if (it != values_.end()) return it->second;
    if (!spec.defaultValue.empty()) return spec.defaultValue;
    throw std::runtime_error("option --" + longName + " not provided");
}

long long ArgParser::get_int64(const std::string& longName) const {
    return parse_int64(get_string(longName), std::numeric_limits<long long>::min(),
                       std::numeric_limits<long long>::max());
}

std::size_t ArgParser::get_size(const std::string& longName) const {
    const OptionSpec& spec = spec_of(longName);
    const std::string s = get_string(longName);
    if (spec.allowInfToken && is_inf_token(s)) return std::numeric_limits<std::size_t>::max();
    unsigned long long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw std::invalid_argument("invalid value for --" + longName + ": '" + s + "'");
    }
    return static_cast<std::size_t>(value);
}

bool ArgParser::get_flag(const std::string& longName) const {
    return provided(longName);
}

std::string ArgParser::usage(const std::string& progName) const {
    std::ostringstream oss;
    oss << "Usage: " << progName;
    for (const auto& io : opts_) {
        if (io.spec.longName == "help") continue;
        oss << ' ' << (io.spec.required ? "" : "[");
        if (io.spec.shortName) oss << '-' << io.spec.shortName << '|';
        oss << "--" << io.spec.longName;
        if (!io.isFlag) oss << ' ' << (io.spec.valueName.empty() ? "VAL" : io.spec.valueName);
        oss << (io.spec.required ? "" : "]");
    }
    if (!positionalName_.empty()) oss << " [" << positionalName_ << "]";
    return oss.str();
}

std::string ArgParser::help(const std::string& progName) const {
    std::ostringstream oss;
    if (!desc_.empty()) oss << desc_ << "\n";
    oss << usage(progName) << "\n\nOptions:\n";
    for (const auto& io : opts_) {
        if (io.spec.longName == "help") continue; // listed last
        oss << "  ";
        if (io.spec.shortName) oss << '-' << io.spec.shortName << ", "; else oss << "    ";
        oss << "--" << io.spec.longName;
        if (!io.isFlag) oss << ' ' << (io.spec.valueName.empty() ? "VAL" : io.spec.valueName);
        if (!io.spec.help.empty()) oss << "\n      " << io.spec.help;
        if (!io.spec.defaultValue.empty()) oss << " (default: " << io.spec.defaultValue << ")";
        if (io.spec.required) oss << " [required]";
        oss << "\n";
    }
    oss << "  -h, --help\n      Show this help message and exit\n";
    if (!positionalName_.empty()) {
        oss << "\nArguments:\n  " << positionalName_ << "\n      " << positionalHelp_ << "\n";
    }
    return oss.str();
}

} // namespace ladder
