#include "ConfigBase.hpp"
#include "Log.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <set>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/config.hpp>
#include <boost/foreach.hpp>
#include <boost/nowide/fstream.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <string.h>

namespace Laminar {

std::string float_to_string_exact(double value)
{
    std::ostringstream ss;
    ss << std::setprecision(15) << value;
    std::istringstream iss(ss.str());
    double back = 0;
    iss >> back;
    if (!iss.fail() && back == value) return ss.str();

    std::ostringstream exact;
    exact << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return exact.str();
}

std::string escape_string_cstyle(const std::string &str)
{
    std::string out;
    out.reserve(str.size() * 2);
    for (const char c : str) {
        if (c == '\r') {
            continue;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\\') {
            out += "\\\\";
        } else {
            out += c;
        }
    }
    return out;
}

std::string escape_strings_cstyle(const std::vector<std::string> &strs)
{
    std::string out;
    for (size_t j = 0; j < strs.size(); ++ j) {
        if (j > 0)
            out += ';';
        const std::string &str = strs[j];
        // Strings holding blanks or escapable characters are quoted,
        // as is a lone empty string.
        bool should_quote = strs.size() == 1 && str.empty();
        for (const char c : str) {
            if (c == ' ' || c == '\t' || c == '\\' || c == '"' || c == '\r' || c == '\n' || c == ';') {
                should_quote = true;
                break;
            }
        }
        if (!should_quote) {
            out += str;
            continue;
        }
        out += '"';
        for (const char c : str) {
            if (c == '\\' || c == '"') {
                out += '\\';
                out += c;
            } else if (c == '\n') {
                out += "\\n";
            } else if (c != '\r') {
                out += c;
            }
        }
        out += '"';
    }
    return out;
}

bool unescape_string_cstyle(const std::string &str, std::string &str_out)
{
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++ i) {
        char c = str[i];
        if (c == '\\') {
            if (++ i == str.size())
                return false;
            c = str[i];
            if (c == 'n')
                out += '\n';
            else if (c == 't')
                out += '\t';
            else
                out += c;
        } else
            out += c;
    }
    str_out = out;
    return true;
}

bool unescape_strings_cstyle(const std::string &str, std::vector<std::string> &out)
{
    if (str.empty())
        return true;

    size_t i = 0;
    for (;;) {
        // Skip white spaces.
        while (i < str.size() && (str[i] == ' ' || str[i] == '\t')) ++ i;
        if (i == str.size())
            return true;
        std::string buf;
        if (str[i] == '"') {
            // quoted, may contain escapes
            for (++ i; i < str.size() && str[i] != '"'; ++ i) {
                char c = str[i];
                if (c == '\\') {
                    if (++ i == str.size())
                        return false;
                    c = (str[i] == 'n') ? '\n' : str[i];
                }
                buf += c;
            }
            if (i == str.size())
                return false;
            ++ i;
        } else {
            for (; i < str.size() && str[i] != ';'; ++ i)
                buf += str[i];
        }
        out.push_back(buf);
        while (i < str.size() && (str[i] == ' ' || str[i] == '\t')) ++ i;
        if (i == str.size())
            return true;
        if (str[i] != ';')
            return false;
        if (++ i == str.size()) {
            // trailing separator means a final empty string
            out.push_back(std::string());
            return true;
        }
    }
}

bool
operator== (const ConfigOption &a, const ConfigOption &b)
{
    return a.serialize().compare(b.serialize()) == 0;
}

bool
operator!= (const ConfigOption &a, const ConfigOption &b)
{
    return !(a == b);
}

ConfigOptionDef::ConfigOptionDef(const ConfigOptionDef &other)
    : type(other.type), default_value(nullptr),
      label(other.label), category(other.category), tooltip(other.tooltip),
      sidetext(other.sidetext), cli(other.cli), min(other.min), max(other.max),
      aliases(other.aliases), enum_values(other.enum_values),
      enum_labels(other.enum_labels), enum_keys_map(other.enum_keys_map)
{
    if (other.default_value != nullptr)
        this->default_value = other.default_value->clone();
}

ConfigOptionDef::~ConfigOptionDef()
{
    if (this->default_value != nullptr)
        delete this->default_value;
}

std::vector<std::string>
ConfigOptionDef::cli_args() const
{
    std::string cli = this->cli.substr(0, this->cli.find("="));
    boost::trim_right_if(cli, boost::is_any_of("!"));
    std::vector<std::string> args;
    boost::split(args, cli, boost::is_any_of("|"));
    return args;
}

ConfigOptionDef*
ConfigDef::add(const t_config_option_key &opt_key, ConfigOptionType type)
{
    ConfigOptionDef* opt = &this->options[opt_key];
    opt->type = type;
    return opt;
}

ConfigOptionDef*
ConfigDef::add(const t_config_option_key &opt_key, const ConfigOptionDef &def)
{
    this->options.insert(std::make_pair(opt_key, def));
    return &this->options[opt_key];
}

bool
ConfigDef::has(const t_config_option_key &opt_key) const
{
    return this->options.count(opt_key) > 0;
}

const ConfigOptionDef&
ConfigDef::get(const t_config_option_key &opt_key) const
{
    if (this->options.count(opt_key) == 0)
        throw UnknownOptionException(opt_key);
    return this->options.at(opt_key);
}

void
ConfigDef::merge(const ConfigDef &other)
{
    this->options.insert(other.options.begin(), other.options.end());
}

std::ostream&
ConfigDef::print_cli_help(std::ostream& out, bool show_defaults) const
{
    // get the unique categories
    std::set<std::string> categories;
    for (const auto& opt : this->options)
        categories.insert(opt.second.category);
    
    for (const auto& category : categories) {
        if (category != "") {
            out << category << ":" << std::endl;
        } else if (categories.size() > 1) {
            out << "Misc options:" << std::endl;
        }
        
        for (const auto& opt : this->options) {
            const ConfigOptionDef& def = opt.second;
            if (def.category != category || def.cli.empty()) continue;
            
            // get all possible variations: --foo, --foobar, -f...
            auto cli_args = def.cli_args();
            for (auto& arg : cli_args) {
                arg.insert(0, (arg.size() == 1) ? "-" : "--");
                if (def.type == coFloat || def.type == coInt || def.type == coPercent) {
                    arg += " N";
                } else if (def.type == coString || def.type == coStrings || def.type == coEnum) {
                    arg += " ABCD";
                }
            }
            const std::string cli = boost::algorithm::join(cli_args, ", ");
            out << " " << std::left << std::setw(26) << cli;
            if (cli.size() > 25) out << std::endl << std::string(27, ' ');
            
            std::string descr = def.tooltip;
            if (show_defaults && def.default_value != nullptr && def.type != coBool
                && (def.type != coString || !def.default_value->serialize().empty())) {
                descr += " (";
                if (!def.sidetext.empty()) {
                    descr += def.sidetext + ", ";
                } else if (!def.enum_values.empty()) {
                    descr += boost::algorithm::join(def.enum_values, ", ") + "; ";
                }
                descr += "default: " + def.default_value->serialize() + ")";
            }
            out << descr << std::endl;
        }
    }
    return out;
}

bool
ConfigBase::has(const t_config_option_key &opt_key) const {
    return this->option(opt_key) != NULL;
}

void
ConfigBase::apply(const ConfigBase &other, bool ignore_nonexistent) {
    this->apply_only(other, other.keys(), ignore_nonexistent);
}

void
ConfigBase::apply_only(const ConfigBase &other, const t_config_option_keys &opt_keys, bool ignore_nonexistent) {
    for (const t_config_option_key &opt_key : opt_keys) {
        if (opt_key.empty()) continue;
        ConfigOption* my_opt = nullptr;
        if (this->def == nullptr || this->def->has(opt_key))
            my_opt = this->option(opt_key, true);
        if (my_opt == NULL) {
            if (ignore_nonexistent == false) throw UnknownOptionException(opt_key);
            continue;
        }
        
        // not the most efficient way, but easier than casting pointers to subclasses
        if (!my_opt->deserialize( other.option(opt_key)->serialize() ))
            CONFESS("Unexpected failure when deserializing serialized value for %s", opt_key.c_str());
    }
}

void
ConfigBase::set_defaults(const t_config_option_keys &opt_keys)
{
    if (this->def == NULL) return;
    for (const auto &opt_key : opt_keys) {
        if (!this->def->has(opt_key)) continue;
        const ConfigOptionDef &optdef = this->def->options.at(opt_key);
        ConfigOption* opt = this->option(opt_key, true);
        if (opt != nullptr && optdef.default_value != nullptr)
            opt->set(*optdef.default_value);
    }
}

bool
ConfigBase::equals(const ConfigBase &other) const {
    return this->diff(other).empty();
}

// this will *ignore* options not present in both configs
t_config_option_keys
ConfigBase::diff(const ConfigBase &other) const {
    t_config_option_keys diff;
    
    for (const t_config_option_key &opt_key : this->keys())
        if (other.has(opt_key) && other.serialize(opt_key) != this->serialize(opt_key))
            diff.push_back(opt_key);
    
    return diff;
}

std::string
ConfigBase::serialize(const t_config_option_key &opt_key) const {
    return this->option_throw(opt_key)->serialize();
}

bool
ConfigBase::set_deserialize(t_config_option_key opt_key, std::string str, bool append) {
    if (!this->def->has(opt_key)) {
        // look for an option having this key as an alias
        for (const auto &opt : this->def->options) {
            for (const t_config_option_key& alias : opt.second.aliases) {
                if (alias == opt_key) {
                    opt_key = opt.first;
                    break;
                }
            }
        }
    }
    if (!this->def->has(opt_key))
        throw UnknownOptionException(opt_key);
    
    // a static config does not necessarily hold every defined key
    ConfigOption* opt = this->option(opt_key, true);
    if (opt == nullptr)
        throw UnknownOptionException(opt_key);
    return opt->deserialize(str, append);
}

void
ConfigBase::set_deserialize_throw(t_config_option_key opt_key, std::string str, bool append) {
    if (this->set_deserialize(opt_key, str, append)) return;
    if (this->def->get(opt_key).type == coEnum)
        throw InvalidOptionException(opt_key, "'" + str + "' is not one of " + boost::algorithm::join(this->def->get(opt_key).enum_values, ", "));
    throw BadOptionTypeException("set_deserialize", opt_key);
}

bool
ConfigBase::getBool(const t_config_option_key &opt_key) const {
    return this->option_throw(opt_key)->getBool();
}

bool
ConfigBase::getBool(const t_config_option_key &opt_key, bool default_value) const {
    const ConfigOption* opt = this->option(opt_key);
    return opt == nullptr ? default_value : opt->getBool();
}

void
ConfigBase::setBool(const t_config_option_key &opt_key, bool value) {
    this->option_throw(opt_key, true)->setBool(value);
}

double
ConfigBase::getFloat(const t_config_option_key &opt_key) const {
    return this->option_throw(opt_key)->getFloat();
}

double
ConfigBase::getFloat(const t_config_option_key &opt_key, double default_value) const {
    const ConfigOption* opt = this->option(opt_key);
    return opt == nullptr ? default_value : opt->getFloat();
}

void
ConfigBase::setFloat(const t_config_option_key &opt_key, double value) {
    this->option_throw(opt_key, true)->setFloat(value);
}

int
ConfigBase::getInt(const t_config_option_key &opt_key) const {
    return this->option_throw(opt_key)->getInt();
}

int
ConfigBase::getInt(const t_config_option_key &opt_key, int default_value) const {
    const ConfigOption* opt = this->option(opt_key);
    return opt == nullptr ? default_value : opt->getInt();
}

void
ConfigBase::setInt(const t_config_option_key &opt_key, int value) {
    this->option_throw(opt_key, true)->setInt(value);
}

std::string
ConfigBase::getString(const t_config_option_key &opt_key) const {
    return this->option_throw(opt_key)->getString();
}

std::string
ConfigBase::getString(const t_config_option_key &opt_key, std::string default_value) const {
    const ConfigOption* opt = this->option(opt_key);
    return opt == nullptr ? default_value : opt->getString();
}

void
ConfigBase::setString(const t_config_option_key &opt_key, std::string value) {
    this->option_throw(opt_key, true)->setString(value);
}

std::vector<std::string>
ConfigBase::getStrings(const t_config_option_key &opt_key) const {
    return this->option_throw(opt_key)->getStrings();
}

std::vector<std::string>
ConfigBase::getStrings(const t_config_option_key &opt_key, std::vector<std::string> default_value) const {
    const ConfigOption* opt = this->option(opt_key);
    return opt == nullptr ? default_value : opt->getStrings();
}

const ConfigOption*
ConfigBase::option(const t_config_option_key &opt_key) const {
    return const_cast<ConfigBase*>(this)->option(opt_key, false);
}

const ConfigOption*
ConfigBase::option_throw(const t_config_option_key &opt_key) const {
    const auto opt = this->option(opt_key);
    if (opt == nullptr) throw UnknownOptionException(opt_key);
    return opt;
}

ConfigOption*
ConfigBase::option(const t_config_option_key &opt_key, bool create) {
    return this->optptr(opt_key, create);
}

ConfigOption*
ConfigBase::option_throw(const t_config_option_key &opt_key, bool create) {
    auto opt = this->optptr(opt_key, create);
    if (opt == nullptr) throw UnknownOptionException(opt_key);
    return opt;
}

void
ConfigBase::load(const std::string &file)
{
    namespace pt = boost::property_tree;
    pt::ptree tree;
    boost::nowide::ifstream ifs(file);
    if (!ifs.is_open())
        throw std::runtime_error("Cannot open config file " + file);
    pt::read_ini(ifs, tree);
    BOOST_FOREACH(const pt::ptree::value_type &v, tree) {
        const t_config_option_key opt_key = v.first;
        try {
            const std::string value = v.second.get_value<std::string>();
            if (!this->set_deserialize(opt_key, value))
                throw InvalidOptionException(opt_key, "cannot parse '" + value + "'");
        } catch (UnknownOptionException &e) {
            Log::debug("Config") << file << ": ignoring unknown key " << opt_key << std::endl;
        }
    }
}

void
ConfigBase::save(const std::string &file) const
{
    using namespace std;
    boost::nowide::ofstream c;
    c.open(file, ios::out | ios::trunc);
    if (!c.is_open())
        throw std::runtime_error("Cannot write config file " + file);

    {
        time_t now;
        time(&now);
        char buf[sizeof "0000-00-00 00:00:00"];
        strftime(buf, sizeof buf, "%F %T", gmtime(&now));
        c << "# generated by Laminar " << LAMINAR_VERSION << " on " << buf << endl;
    }

    t_config_option_keys my_keys = this->keys();
    std::sort(my_keys.begin(), my_keys.end());
    for (const auto &opt_key : my_keys)
        c << opt_key << " = " << this->serialize(opt_key) << endl;
    c.close();
}

void
ConfigBase::validate() const
{
    for (auto &opt_key : this->keys()) {
        // get option definition
        const ConfigOptionDef& def = this->def->get(opt_key);
        
        if (def.type == coInt) {
            auto &value = this->opt<ConfigOptionInt>(opt_key)->value;
            if (value < def.min || value > def.max)
                throw InvalidOptionException(opt_key, "out of range");
        } else if (def.type == coFloat || def.type == coPercent) {
            auto &value = this->opt<ConfigOptionFloat>(opt_key)->value;
            if (std::isnan(value) || value < def.min || value > def.max)
                throw InvalidOptionException(opt_key, "out of range");
        } else if (def.type == coEnum) {
            const std::string value = this->serialize(opt_key);
            if (value.empty() || def.enum_keys_map.count(value) == 0)
                throw InvalidOptionException(opt_key, "not a known value");
        }
    }
}

DynamicConfig& DynamicConfig::operator= (DynamicConfig other)
{
    this->swap(other);
    return *this;
}

void
DynamicConfig::swap(DynamicConfig &other)
{
    std::swap(this->def, other.def);
    std::swap(this->options, other.options);
}

DynamicConfig::~DynamicConfig () {
    for (t_options_map::iterator it = this->options.begin(); it != this->options.end(); ++it) {
        ConfigOption* opt = it->second;
        if (opt != NULL) delete opt;
    }
}

DynamicConfig::DynamicConfig (const DynamicConfig& other) : ConfigBase(other.def) {
    this->apply(other, false);
}

ConfigOption*
DynamicConfig::optptr(const t_config_option_key &opt_key, bool create) {
    if (this->options.count(opt_key) == 0) {
        if (!create) return NULL;
        if (!this->def->has(opt_key)) throw UnknownOptionException(opt_key);
        const ConfigOptionDef& optdef = this->def->options.at(opt_key);
        ConfigOption* opt;
        if (optdef.default_value != nullptr) {
            opt = optdef.default_value->clone();
        } else if (optdef.type == coFloat) {
            opt = new ConfigOptionFloat ();
        } else if (optdef.type == coInt) {
            opt = new ConfigOptionInt ();
        } else if (optdef.type == coString) {
            opt = new ConfigOptionString ();
        } else if (optdef.type == coStrings) {
            opt = new ConfigOptionStrings ();
        } else if (optdef.type == coPercent) {
            opt = new ConfigOptionPercent ();
        } else if (optdef.type == coBool) {
            opt = new ConfigOptionBool ();
        } else if (optdef.type == coEnum) {
            ConfigOptionEnumGeneric* optv = new ConfigOptionEnumGeneric ();
            optv->keys_map = &optdef.enum_keys_map;
            opt = static_cast<ConfigOption*>(optv);
        } else {
            throw std::runtime_error("Unknown option type");
        }
        this->options[opt_key] = opt;
        return opt;
    }
    return this->options[opt_key];
}

t_config_option_keys
DynamicConfig::keys() const {
    t_config_option_keys keys;
    for (t_options_map::const_iterator it = this->options.begin(); it != this->options.end(); ++it)
        keys.push_back(it->first);
    return keys;
}

void
DynamicConfig::erase(const t_config_option_key &opt_key) {
    auto it = this->options.find(opt_key);
    if (it == this->options.end()) return;
    delete it->second;
    this->options.erase(it);
}

void
DynamicConfig::clear() {
    for (auto &opt : this->options)
        delete opt.second;
    this->options.clear();
}

bool
DynamicConfig::empty() const {
    return this->options.empty();
}

bool
DynamicConfig::read_cli(const std::vector<std::string> &tokens, t_config_option_keys* extra, t_config_option_keys* keys)
{
    std::vector<char*> _argv;
    
    // push a bogus executable name (argv[0])
    _argv.push_back(const_cast<char*>(""));

    for (size_t i = 0; i < tokens.size(); ++i)
        _argv.push_back(const_cast<char *>(tokens[i].c_str()));
    
    return this->read_cli(_argv.size(), &_argv[0], extra, keys);
}

bool
DynamicConfig::read_cli(int argc, char** argv, t_config_option_keys* extra, t_config_option_keys* keys)
{
    // cache the CLI option => opt_key mapping
    std::map<std::string,std::string> opts;
    for (const auto &oit : this->def->options) {
        if (oit.second.cli.empty()) continue;
        // the option key itself is accepted too (--layer_height)
        opts[oit.first] = oit.first;
        for (auto t : oit.second.cli_args())
            if (!t.empty()) opts[t] = oit.first;
    }
    
    bool parse_options = true;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        
        // Store non-option arguments in the provided vector.
        if (!parse_options || !boost::starts_with(token, "-") || token.size() == 1) {
            extra->push_back(token);
            continue;
        }
        
        // Stop parsing tokens as options when -- is supplied.
        if (token == "--") {
            parse_options = false;
            continue;
        }
        
        // Remove leading dashes
        boost::trim_left_if(token, boost::is_any_of("-"));
        
        // Remove the "no-" prefix used to negate boolean options.
        bool no = false;
        if (boost::starts_with(token, "no-")) {
            no = true;
            boost::replace_first(token, "no-", "");
        }
        
        // Read value when supplied in the --key=value form.
        std::string value;
        {
            size_t equals_pos = token.find("=");
            if (equals_pos != std::string::npos) {
                value = token.substr(equals_pos+1);
                token.erase(equals_pos);
            }
        }
        
        const auto it = opts.find(token);
        if (it == opts.end()) {
            Log::error("Config") << "Unknown option --" << token << std::endl;
            return false;
        }
        const t_config_option_key opt_key = it->second;
        const ConfigOptionDef &optdef = this->def->options.at(opt_key);
        
        // If the option type expects a value and it was not already provided,
        // look for it in the next token.
        if (optdef.type != coBool && value.empty()) {
            if (i == (argc-1)) {
                Log::error("Config") << "No value supplied for --" << token << std::endl;
                return false;
            }
            value = argv[++i];
        }
        
        const bool existing = this->has(opt_key);
        if (keys != nullptr && !existing) {
            // save the order of detected keys
            keys->push_back(opt_key);
        }
        if (ConfigOptionBool* opt = this->opt<ConfigOptionBool>(opt_key, true)) {
            opt->value = !no;
        } else if (ConfigOptionStrings* opt = this->opt<ConfigOptionStrings>(opt_key, true)) {
            // repeated options accumulate
            if (!existing) opt->values.clear();
            opt->values.push_back(value);
        } else {
            this->set_deserialize_throw(opt_key, value);
        }
    }
    return true;
}

void
StaticConfig::set_defaults()
{
    ConfigBase::set_defaults(this->keys());
}

t_config_option_keys
StaticConfig::keys() const {
    t_config_option_keys keys;
    for (t_optiondef_map::const_iterator it = this->def->options.begin(); it != this->def->options.end(); ++it) {
        const ConfigOption* opt = this->option(it->first);
        if (opt != NULL) keys.push_back(it->first);
    }
    return keys;
}

}
