#ifndef laminar_ConfigBase_hpp_
#define laminar_ConfigBase_hpp_

#include <climits>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include "liblaminar.h"
#include "Exception.hpp"

namespace Laminar {

typedef std::vector<std::string> t_config_option_keys;

extern std::string escape_string_cstyle(const std::string &str);
extern std::string escape_strings_cstyle(const std::vector<std::string> &strs);
extern bool unescape_string_cstyle(const std::string &str, std::string &out);
extern bool unescape_strings_cstyle(const std::string &str, std::vector<std::string> &out);
/// Shortest of 15 or 17 significant digits that parses back to the same double.
extern std::string float_to_string_exact(double value);

/// Public interface for configuration options.
class ConfigOption {
    public:
    virtual ~ConfigOption() {};
    virtual ConfigOption* clone() const = 0;
    virtual std::string serialize() const = 0;
    virtual bool deserialize(const std::string &str, bool append = false) = 0;
    virtual void set(const ConfigOption &option) = 0;
    virtual int getInt() const { throw BadOptionTypeException("getInt", ""); };
    virtual double getFloat() const { throw BadOptionTypeException("getFloat", ""); };
    virtual bool getBool() const { throw BadOptionTypeException("getBool", ""); };
    virtual std::string getString() const { throw BadOptionTypeException("getString", ""); };
    virtual std::vector<std::string> getStrings() const { throw BadOptionTypeException("getStrings", ""); };
    virtual void setInt(int val) { throw BadOptionTypeException("setInt", ""); };
    virtual void setFloat(double val) { throw BadOptionTypeException("setFloat", ""); };
    virtual void setBool(bool val) { throw BadOptionTypeException("setBool", ""); };
    virtual void setString(std::string val) { throw BadOptionTypeException("setString", ""); };
    friend bool operator== (const ConfigOption &a, const ConfigOption &b);
    friend bool operator!= (const ConfigOption &a, const ConfigOption &b);
};

/// Value of a single valued option (bool, int, float, string, enum).
template <class T>
class ConfigOptionSingle : public ConfigOption {
    public:
    T value;
    ConfigOptionSingle(T _value) : value(_value) {};
    operator T() const { return this->value; };

    void set(const ConfigOption &option) {
        const ConfigOptionSingle<T>* other = dynamic_cast< const ConfigOptionSingle<T>* >(&option);
        if (other != NULL) this->value = other->value;
    };
};

/// Value of a multi-valued option.
class ConfigOptionVectorBase : public ConfigOption {
    public:
    virtual ~ConfigOptionVectorBase() {};
    virtual std::vector<std::string> vserialize() const = 0;
};

template <class T>
class ConfigOptionVector : public ConfigOptionVectorBase
{
    public:
    virtual ~ConfigOptionVector() {};
    std::vector<T> values;

    void set(const ConfigOption &option) {
        const ConfigOptionVector<T>* other = dynamic_cast< const ConfigOptionVector<T>* >(&option);
        if (other != NULL) this->values = other->values;
    };
};

class ConfigOptionFloat : public ConfigOptionSingle<double>
{
    public:
    ConfigOptionFloat() : ConfigOptionSingle<double>(0) {};
    ConfigOptionFloat(double _value) : ConfigOptionSingle<double>(_value) {};
    ConfigOptionFloat* clone() const { return new ConfigOptionFloat(this->value); };

    double getFloat() const { return this->value; };
    void setFloat(double val) { this->value = val; }

    std::string serialize() const {
        return float_to_string_exact(this->value);
    };

    bool deserialize(const std::string &str, bool append = false) {
        std::istringstream iss(boost::algorithm::trim_copy(str));
        iss >> this->value;
        return !iss.fail() && iss.eof();
    };
};

class ConfigOptionInt : public ConfigOptionSingle<int>
{
    public:
    ConfigOptionInt() : ConfigOptionSingle<int>(0) {};
    ConfigOptionInt(double _value) : ConfigOptionSingle<int>(_value) {};
    ConfigOptionInt* clone() const { return new ConfigOptionInt(this->value); };

    int getInt() const { return this->value; };
    void setInt(int val) { this->value = val; };

    std::string serialize() const {
        std::ostringstream ss;
        ss << this->value;
        return ss.str();
    };

    bool deserialize(const std::string &str, bool append = false) {
        std::istringstream iss(boost::algorithm::trim_copy(str));
        iss >> this->value;
        return !iss.fail() && iss.eof();
    };
};

/// String option; new lines are stored escaped so templates survive INI files.
class ConfigOptionString : public ConfigOptionSingle<std::string>
{
    public:
    ConfigOptionString() : ConfigOptionSingle<std::string>("") {};
    ConfigOptionString(std::string _value) : ConfigOptionSingle<std::string>(_value) {};
    ConfigOptionString* clone() const { return new ConfigOptionString(this->value); };

    std::string getString() const { return this->value; };
    void setString(std::string val) { this->value = val; };

    std::string serialize() const {
        return escape_string_cstyle(this->value);
    }

    bool deserialize(const std::string &str, bool append = false) {
        return unescape_string_cstyle(str, this->value);
    };
};

class ConfigOptionStrings : public ConfigOptionVector<std::string>
{
    public:
    ConfigOptionStrings() {};
    ConfigOptionStrings(const std::vector<std::string> _values) { this->values = _values; };
    ConfigOptionStrings* clone() const { return new ConfigOptionStrings(this->values); };

    std::vector<std::string> getStrings() const { return this->values; };

    std::string serialize() const {
        return escape_strings_cstyle(this->values);
    };

    std::vector<std::string> vserialize() const {
        return this->values;
    };

    bool deserialize(const std::string &str, bool append = false) {
        if (!append) this->values.clear();
        return unescape_strings_cstyle(str, this->values);
    };
};

/// Percentage in [0, 100]; serialized with a trailing '%', which is optional on input.
class ConfigOptionPercent : public ConfigOptionFloat
{
    public:
    ConfigOptionPercent() : ConfigOptionFloat(0) {};
    ConfigOptionPercent(double _value) : ConfigOptionFloat(_value) {};
    ConfigOptionPercent* clone() const { return new ConfigOptionPercent(this->value); };

    double get_abs_value(double ratio_over) const {
        return ratio_over * this->value / 100;
    };

    std::string serialize() const {
        return float_to_string_exact(this->value) + "%";
    };

    bool deserialize(const std::string &str, bool append = false) {
        std::string s = boost::algorithm::trim_copy(str);
        if (!s.empty() && s.back() == '%') s.erase(s.size() - 1);
        std::istringstream iss(s);
        iss >> this->value;
        return !iss.fail() && iss.eof();
    };
};

class ConfigOptionBool : public ConfigOptionSingle<bool>
{
    public:
    ConfigOptionBool() : ConfigOptionSingle<bool>(false) {};
    ConfigOptionBool(bool _value) : ConfigOptionSingle<bool>(_value) {};
    ConfigOptionBool* clone() const { return new ConfigOptionBool(this->value); };

    bool getBool() const { return this->value; };
    void setBool(bool val) { this->value = val; };

    std::string serialize() const {
        return std::string(this->value ? "1" : "0");
    };

    bool deserialize(const std::string &str, bool append = false) {
        const std::string s = boost::algorithm::trim_copy(str);
        if (s == "1" || s == "true") {
            this->value = true;
        } else if (s == "0" || s == "false") {
            this->value = false;
        } else {
            return false;
        }
        return true;
    };
};

/// Map from an enum name to an enum integer value.
typedef std::map<std::string,int> t_config_enum_values;

template <class T>
class ConfigOptionEnum : public ConfigOptionSingle<T>
{
    public:
    // by default, use the first value (0) of the T enum type
    ConfigOptionEnum() : ConfigOptionSingle<T>(static_cast<T>(0)) {};
    ConfigOptionEnum(T _value) : ConfigOptionSingle<T>(_value) {};
    ConfigOptionEnum<T>* clone() const { return new ConfigOptionEnum<T>(this->value); };

    std::string getString() const { return this->serialize(); };

    std::string serialize() const {
        t_config_enum_values enum_keys_map = ConfigOptionEnum<T>::get_enum_values();
        for (t_config_enum_values::iterator it = enum_keys_map.begin(); it != enum_keys_map.end(); ++it) {
            if (it->second == static_cast<int>(this->value)) return it->first;
        }
        return "";
    };

    bool deserialize(const std::string &str, bool append = false) {
        t_config_enum_values enum_keys_map = ConfigOptionEnum<T>::get_enum_values();
        const std::string s = boost::algorithm::trim_copy(str);
        if (enum_keys_map.count(s) == 0) return false;
        this->value = static_cast<T>(enum_keys_map[s]);
        return true;
    };

    static t_config_enum_values get_enum_values();
};

/// Generic enum option that only knows its keys map; used by DynamicConfig.
class ConfigOptionEnumGeneric : public ConfigOptionInt
{
    public:
    ConfigOptionEnumGeneric() : ConfigOptionInt(0) {};
    ConfigOptionEnumGeneric(int _value) : ConfigOptionInt(_value) {};
    const t_config_enum_values* keys_map {nullptr};
    ConfigOptionEnumGeneric* clone() const {
        ConfigOptionEnumGeneric* opt = new ConfigOptionEnumGeneric(this->value);
        opt->keys_map = this->keys_map;
        return opt;
    };

    std::string getString() const { return this->serialize(); };

    std::string serialize() const {
        for (t_config_enum_values::const_iterator it = this->keys_map->begin(); it != this->keys_map->end(); ++it) {
            if (it->second == this->value) return it->first;
        }
        return "";
    };

    bool deserialize(const std::string &str, bool append = false) {
        const std::string s = boost::algorithm::trim_copy(str);
        if (this->keys_map->count(s) == 0) return false;
        this->value = (*const_cast<t_config_enum_values*>(this->keys_map))[s];
        return true;
    };

    void set(const ConfigOption &option) {
        // typed enums and generic enums exchange their values through the serialized key
        if (const ConfigOptionEnumGeneric* other = dynamic_cast<const ConfigOptionEnumGeneric*>(&option)) {
            this->value = other->value;
        } else {
            this->deserialize(option.serialize());
        }
    };
};

enum ConfigOptionType {
    coNone,
    coFloat,
    coInt,
    coString,
    coStrings,
    coPercent,
    coBool,
    coEnum,
};

/// Definition of a configuration value for the purpose of help, validation and CLI parsing.
class ConfigOptionDef
{
    public:
    ConfigOptionType type {coNone};
    /// Owned by this definition.
    ConfigOption* default_value {nullptr};
    std::string label;
    std::string category;
    std::string tooltip;
    std::string sidetext;
    /// CLI spec: "name|alias=type", '!' marks a negatable boolean.
    std::string cli;
    double min {-INT_MAX};
    double max {INT_MAX};
    std::vector<t_config_option_key> aliases;
    std::vector<std::string> enum_values;
    std::vector<std::string> enum_labels;
    t_config_enum_values enum_keys_map;

    ConfigOptionDef() {};
    ConfigOptionDef(const ConfigOptionDef &other);
    ~ConfigOptionDef();

    /// Returns the alternative CLI arguments for the given option.
    std::vector<std::string> cli_args() const;

    private:
    ConfigOptionDef& operator= (ConfigOptionDef other);
};

typedef std::map<t_config_option_key,ConfigOptionDef> t_optiondef_map;

/// Set of option definitions, keyed by option name.
class ConfigDef
{
    public:
    t_optiondef_map options;
    ConfigOptionDef* add(const t_config_option_key &opt_key, ConfigOptionType type);
    ConfigOptionDef* add(const t_config_option_key &opt_key, const ConfigOptionDef &def);
    bool has(const t_config_option_key &opt_key) const;
    const ConfigOptionDef& get(const t_config_option_key &opt_key) const;
    void merge(const ConfigDef &other);

    /// Print the CLI help of every option having a cli spec, grouped by category.
    std::ostream& print_cli_help(std::ostream& out, bool show_defaults) const;
};

/// An abstract configuration store.
class ConfigBase
{
    public:
    /// Definition of the options this config may hold. Not owned.
    const ConfigDef* def;

    ConfigBase() : def(NULL) {};
    ConfigBase(const ConfigDef* def) : def(def) {};
    virtual ~ConfigBase() {};
    bool has(const t_config_option_key &opt_key) const;
    const ConfigOption* option(const t_config_option_key &opt_key) const;
    ConfigOption* option(const t_config_option_key &opt_key, bool create = false);
    const ConfigOption* option_throw(const t_config_option_key &opt_key) const;
    ConfigOption* option_throw(const t_config_option_key &opt_key, bool create = false);
    virtual ConfigOption* optptr(const t_config_option_key &opt_key, bool create = false) = 0;
    virtual t_config_option_keys keys() const = 0;
    void apply(const ConfigBase &other, bool ignore_nonexistent = false);
    void apply_only(const ConfigBase &other, const t_config_option_keys &opt_keys, bool ignore_nonexistent = false);
    bool equals(const ConfigBase &other) const;
    t_config_option_keys diff(const ConfigBase &other) const;
    std::string serialize(const t_config_option_key &opt_key) const;
    virtual bool set_deserialize(t_config_option_key opt_key, std::string str, bool append = false);
    /// Throws InvalidOptionException for an out-of-enum value and
    /// BadOptionTypeException for a value that does not parse.
    void set_deserialize_throw(t_config_option_key opt_key, std::string str, bool append = false);
    void set_defaults(const t_config_option_keys &opt_keys);

    bool getBool(const t_config_option_key &opt_key) const;
    bool getBool(const t_config_option_key &opt_key, bool default_value) const;
    void setBool(const t_config_option_key &opt_key, bool value);
    double getFloat(const t_config_option_key &opt_key) const;
    double getFloat(const t_config_option_key &opt_key, double default_value) const;
    void setFloat(const t_config_option_key &opt_key, double value);
    int getInt(const t_config_option_key &opt_key) const;
    int getInt(const t_config_option_key &opt_key, int default_value) const;
    void setInt(const t_config_option_key &opt_key, int value);
    std::string getString(const t_config_option_key &opt_key) const;
    std::string getString(const t_config_option_key &opt_key, std::string default_value) const;
    void setString(const t_config_option_key &opt_key, std::string value);
    std::vector<std::string> getStrings(const t_config_option_key &opt_key) const;
    std::vector<std::string> getStrings(const t_config_option_key &opt_key, std::vector<std::string> default_value) const;

    /// Read key = value pairs from an INI file. Unknown keys are skipped.
    void load(const std::string &file);
    /// Write every key, sorted, after a generator header.
    void save(const std::string &file) const;
    /// Check every numeric option against its declared range.
    void validate() const;

    template<class T> T* opt(const t_config_option_key &opt_key, bool create = false)
        { return dynamic_cast<T*>(this->option(opt_key, create)); };
    template<class T> const T* opt(const t_config_option_key &opt_key) const
        { return dynamic_cast<const T*>(this->option(opt_key)); };
};

/// Configuration store holding only the options that were set, allocated on demand.
class DynamicConfig : public virtual ConfigBase
{
    public:
    DynamicConfig() {};
    DynamicConfig(const ConfigDef* def) : ConfigBase(def) {};
    DynamicConfig(const DynamicConfig& other);
    DynamicConfig& operator= (DynamicConfig other);
    void swap(DynamicConfig &other);
    virtual ~DynamicConfig();
    ConfigOption* optptr(const t_config_option_key &opt_key, bool create = false);
    t_config_option_keys keys() const;
    void erase(const t_config_option_key &opt_key);
    void clear();
    bool empty() const;

    /// Parse command line tokens. Non-option arguments go to extra,
    /// option keys are appended to keys in the order they appear.
    /// Returns false on an unknown option.
    bool read_cli(const std::vector<std::string> &tokens, t_config_option_keys* extra, t_config_option_keys* keys = nullptr);
    bool read_cli(int argc, char** argv, t_config_option_keys* extra, t_config_option_keys* keys = nullptr);

    private:
    typedef std::map<t_config_option_key,ConfigOption*> t_options_map;
    t_options_map options;
};

/// Configuration store with one typed member per option; subclasses map keys to members.
class StaticConfig : public virtual ConfigBase
{
    public:
    StaticConfig() : ConfigBase() {};
    t_config_option_keys keys() const;
    /// Set all the options to their definition defaults.
    void set_defaults();
};

}

#endif
