#include "Exception.hpp"
#include <sstream>

namespace Laminar {

UnknownOptionException::UnknownOptionException(const t_config_option_key& _opt_key)
    : opt_key(_opt_key), msg("Unknown option: " + _opt_key) {}

const char* UnknownOptionException::what() const noexcept {
    return this->msg.empty() ? "Unknown option" : this->msg.c_str();
}

InvalidOptionException::InvalidOptionException(const t_config_option_key& _opt_key, const std::string& reason)
    : opt_key(_opt_key) {
    std::ostringstream s_msg;
    s_msg << "Invalid value for " << this->opt_key;
    if (!reason.empty()) s_msg << ": " << reason;
    this->msg = s_msg.str();
}

const char* InvalidOptionException::what() const noexcept {
    return this->msg.empty() ? "Invalid option value" : this->msg.c_str();
}

BadOptionTypeException::BadOptionTypeException(const char* _func_name, t_config_option_key _opt_key)
    : func_name(_func_name), opt_key(_opt_key) {
    std::ostringstream s_msg;
    s_msg << "Invalid accessor used: "
          << this->func_name
          << " on "
          << this->opt_key << ".";
    this->msg = s_msg.str();
}

const char* BadOptionTypeException::what() const noexcept {
    return this->msg.c_str();
}

static std::string
mesh_load_message(const std::string& path, const std::vector<std::string>& causes)
{
    std::ostringstream ss;
    ss << "Unable to load " << path;
    for (size_t i = 0; i < causes.size(); ++i)
        ss << (i == 0 ? ": " : "; ") << causes[i];
    return ss.str();
}

MeshLoadException::MeshLoadException(const std::string& _path, const std::vector<std::string>& _causes)
    : std::runtime_error(mesh_load_message(_path, _causes)), path(_path), causes(_causes) {}

}
