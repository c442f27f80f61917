#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser for `specflow <command> [args] [--options]`.
 *
 * Long options are written `--name`, `--name value` or `--name=value`. The
 * table of known options says which of them take a value; a valued option
 * always consumes the following argument. When no table is given every flag
 * is accepted and a following argument that does not start with `--` is
 * taken as its value. Everything after a bare `--` is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value of each option
    std::map<std::string, std::vector<std::string>> multi_options_; ///< Every value
    std::vector<std::string> positional_;
    std::vector<std::string> unknown_flags_;
    std::vector<std::string> missing_values_; ///< Valued options given without a value
    std::map<std::string, bool> known_;       ///< Flag -> takes a value
    std::map<char, std::string> short_map_;

    void store(const std::string& key, const std::string* value) {
        if (!known_.empty() && !known_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value) {
            options_[key] = *value;
            multi_options_[key].push_back(*value);
        }
    }

  public:
    /**
     * @param argc      Argument count from `main`.
     * @param argv      Argument vector from `main`.
     * @param known     Accepted flags mapped to whether they take a value.
     * @param short_map Single character aliases such as `-h` for `--help`.
     */
    ArgParser(int argc, char* argv[], const std::map<std::string, bool>& known = {},
              const std::map<char, std::string>& short_map = {})
        : known_(known), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                only_positional = true;
                continue;
            }
            if (arg.size() == 2 && arg[0] == '-' && arg[1] != '-') {
                auto it = short_map_.find(arg[1]);
                if (it == short_map_.end()) {
                    unknown_flags_.push_back(arg);
                    continue;
                }
                arg = it->second;
            }
            if (arg.rfind("--", 0) != 0) {
                positional_.push_back(arg);
                continue;
            }
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                std::string value = arg.substr(eq + 1);
                store(arg.substr(0, eq), &value);
                continue;
            }
            bool takes_value;
            if (known_.empty()) {
                takes_value = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
            } else {
                auto it = known_.find(arg);
                takes_value = it != known_.end() && it->second;
            }
            if (!takes_value) {
                store(arg, nullptr);
            } else if (i + 1 < argc) {
                std::string value = argv[++i];
                store(arg, &value);
            } else {
                missing_values_.push_back(arg);
            }
        }
    }

    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return The option's value, or an empty string when absent. */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        return it != options_.end() ? it->second : std::string();
    }

    /** @return Every value given for a repeatable option. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
