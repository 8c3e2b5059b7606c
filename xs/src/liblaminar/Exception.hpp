#ifndef laminar_Exception_hpp_
#define laminar_Exception_hpp_

#include <stdexcept>
#include <string>
#include <vector>

namespace Laminar {

/// Key in a configuration definition (for example "layer_height").
typedef std::string t_config_option_key;

/// Specialization of std::exception to indicate that an unknown config option has been encountered.
class UnknownOptionException : public std::exception {
    public:
    /// Name of the key that was not recognized.
    t_config_option_key opt_key;
    UnknownOptionException() = default;
    UnknownOptionException(const t_config_option_key& _opt_key);
    virtual const char* what() const noexcept;
    private:
    std::string msg;
};

/// Indicates that an option value was outside its declared range or enum.
class InvalidOptionException : public std::exception {
    public:
    t_config_option_key opt_key;
    InvalidOptionException() = default;
    InvalidOptionException(const t_config_option_key& _opt_key, const std::string& reason = "");
    virtual const char* what() const noexcept;
    private:
    std::string msg;
};

/// Indicates that an accessor of the wrong type was used on an option.
class BadOptionTypeException : public std::exception {
    public:
    const char* func_name {""};
    t_config_option_key opt_key;
    BadOptionTypeException() : msg("Invalid accessor used.") {};
    BadOptionTypeException(const char* _func_name, t_config_option_key _opt_key);
    virtual const char* what() const noexcept;
    private:
    std::string msg;
};

/// Fatal failure of a slicing run (mesh without facets, cross-sectioner
/// could not be set up). The run ends in the Failed state.
class SlicingException : public std::runtime_error {
    public:
    SlicingException(const std::string& what) : std::runtime_error(what) {};
};

/// Fatal failure of G-code emission (missing or malformed printer template).
class EmissionException : public std::runtime_error {
    public:
    EmissionException(const std::string& what) : std::runtime_error(what) {};
};

/// Raised when no mesh loader strategy could read a file.
/// The message lists every strategy that was tried along with its cause.
class MeshLoadException : public std::runtime_error {
    public:
    std::string path;
    std::vector<std::string> causes;
    MeshLoadException(const std::string& _path, const std::vector<std::string>& _causes);
};

}

#endif
