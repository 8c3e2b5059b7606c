#ifndef LAMINAR_HPP
#define LAMINAR_HPP

#include "ConfigBase.hpp"
#include "PrintConfig.hpp"
#include "TriangleMesh.hpp"

namespace Laminar {

class CLI {
    public:
    /// Returns the process exit status.
    int run(int argc, char **argv);

    const SliceConfig& slice_config_ref() const { return this->slice_config; }
    const PrinterConfig& printer_config_ref() const { return this->printer_config; }
    const std::string& last_outfile_ref() const { return this->last_outfile; }

    private:
    ConfigDef config_def;
    DynamicConfig config;
    SliceConfig slice_config;
    PrinterConfig printer_config;
    t_config_option_keys input_files;
    std::string last_outfile;

    /// Prints usage of the CLI.
    void print_help(bool include_print_options = false) const;

    /// Builds slice_config and printer_config from --printer, --load,
    /// --material and the command line options, in that order.
    void load_configs();

    /// Writes mesh statistics for --info.
    void print_info(const std::string &input_file, TriangleMesh &mesh) const;

    /// Slices the mesh and writes the G-code. Returns false on failure.
    bool export_gcode(const std::string &input_file, TriangleMesh &mesh);

    std::string output_filepath(const std::string &input_file) const;
};

}

#endif
