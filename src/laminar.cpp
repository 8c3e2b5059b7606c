#include "laminar.hpp"
#include "Exception.hpp"
#include "Log.hpp"
#include "MeshLoader.hpp"
#include "PrintEstimator.hpp"
#include "PrintGCode.hpp"
#include "Slicer.hpp"
#include "liblaminar.h"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <boost/filesystem.hpp>
#include <boost/nowide/args.hpp>
#include <boost/nowide/fstream.hpp>
#include <boost/nowide/iostream.hpp>
#include <stdexcept>
#include <string>

using namespace Laminar;

#ifndef BUILD_TEST
int
main(int argc, char **argv) {
    return CLI().run(argc, argv);
}
#endif // BUILD_TEST

int CLI::run(int argc, char **argv) {
    #ifdef LAMINAR_DEBUG
        laminar_log->set_level(log_t::DEBUG);
    #endif
    // Convert arguments to UTF-8 (needed on Windows).
    // argv then points to memory owned by a.
    boost::nowide::args a(argc, argv);

    this->config_def.merge(cli_config_def);
    this->config_def.merge(print_config_def);
    this->config.def = &this->config_def;

    // if any option is unsupported, print usage and abort immediately
    if (!this->config.read_cli(argc, argv, &this->input_files)) {
        this->print_help();
        return EXIT_FAILURE;
    }

    if (this->config.getBool("quiet", false)) {
        laminar_log->set_level(log_t::ERR);
    } else if (this->config.getBool("verbose", false)) {
        laminar_log->set_level(log_t::DEBUG);
    }
    Laminar::Log::debug("CLI") << "Command line parsed." << std::endl;

    if (this->config.getBool("help", false)) {
        this->print_help(true);
        return 0;
    }

    try {
        this->load_configs();
    } catch (std::exception &e) {
        Laminar::Log::error("CLI") << "Config error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (this->config.has("save")) {
        const std::string file = this->config.getString("save");
        try {
            this->slice_config.save(file);
        } catch (std::exception &e) {
            Laminar::Log::error("CLI") << e.what() << std::endl;
            return EXIT_FAILURE;
        }
        boost::nowide::cout << "Config saved to " << file << std::endl;
    }

    if (this->input_files.empty()) {
        if (this->config.has("save")) return 0;
        Laminar::Log::error("CLI") << "No input file given." << std::endl;
        this->print_help();
        return EXIT_FAILURE;
    }
    if (this->input_files.size() > 1) {
        Laminar::Log::error("CLI") << "Only one input file can be sliced at a time." << std::endl;
        return EXIT_FAILURE;
    }

    const std::string input_file = this->input_files.front();
    TriangleMesh mesh;
    try {
        mesh = IO::MeshLoader().load(input_file);
    } catch (std::exception &e) {
        Laminar::Log::error("CLI") << input_file << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (this->config.getBool("info", false)) {
        this->print_info(input_file, mesh);
        return 0;
    }

    return this->export_gcode(input_file, mesh) ? 0 : EXIT_FAILURE;
}

void
CLI::load_configs() {
    // shared keys of the printer profile (nozzle, filament) are the slice defaults
    if (this->config.has("printer")) {
        const std::string file = this->config.getString("printer");
        if (!boost::filesystem::exists(file))
            throw std::invalid_argument("No such printer profile: " + file);
        this->printer_config.load(file);
        this->slice_config.load(file);
        Laminar::Log::info("CLI") << "Printer profile loaded from " << file << std::endl;
    }

    // load config files supplied via --load; later files win
    for (auto const &file : this->config.getStrings("load", {})) {
        if (!boost::filesystem::exists(file))
            throw std::invalid_argument("No such file: " + file);
        this->slice_config.load(file);
        Laminar::Log::debug("CLI") << "Config loaded from " << file << std::endl;
    }

    if (this->config.has("material"))
        MaterialPreset::builtin(this->config.getString("material")).apply_to(this->slice_config);

    // command line options override --load files
    this->slice_config.apply(this->config, true);
    this->printer_config.apply(this->config, true);
    if (this->config.has("line_width_pct") && !this->config.has("line_width"))
        this->slice_config.line_width.value = this->slice_config.line_width_from_pct();

    this->slice_config.validate();
    this->printer_config.validate();
    Laminar::Log::debug("CLI") << "Config validated" << std::endl;
}

void
CLI::print_info(const std::string &input_file, TriangleMesh &mesh) const {
    using namespace std;
    auto &out = boost::nowide::cout;
    out << fixed;
    out << "[" << boost::filesystem::path(input_file).filename().string() << "]" << endl;

    const BoundingBoxf3 bb = mesh.bounding_box();
    const Pointf3 size = bb.size();
    out << "size_x = " << size.x << endl;
    out << "size_y = " << size.y << endl;
    out << "size_z = " << size.z << endl;
    out << "min_x = " << bb.min.x << endl;
    out << "min_y = " << bb.min.y << endl;
    out << "min_z = " << bb.min.z << endl;
    out << "max_x = " << bb.max.x << endl;
    out << "max_y = " << bb.max.y << endl;
    out << "max_z = " << bb.max.z << endl;

    const mesh_stats stats = mesh.stats();
    out << "number_of_facets = " << stats.number_of_facets << endl;
    out << "manifold = "   << (mesh.is_manifold() ? "yes" : "no") << endl;
    if (mesh.needed_repair()) {
        if (stats.degenerate_facets > 0)
            out << "degenerate_facets = "  << stats.degenerate_facets << endl;
        if (stats.edges_fixed > 0)
            out << "edges_fixed = "        << stats.edges_fixed       << endl;
        if (stats.facets_removed > 0)
            out << "facets_removed = "     << stats.facets_removed    << endl;
        if (stats.facets_added > 0)
            out << "facets_added = "       << stats.facets_added      << endl;
        if (stats.facets_reversed > 0)
            out << "facets_reversed = "    << stats.facets_reversed   << endl;
        if (stats.backwards_edges > 0)
            out << "backwards_edges = "    << stats.backwards_edges   << endl;
    }
    out << "number_of_parts = " << stats.number_of_parts << endl;
    out << "volume = "          << mesh.volume()         << endl;
}

bool
CLI::export_gcode(const std::string &input_file, TriangleMesh &mesh) {
    mesh.center_on_bed(this->printer_config.bed_size_x.value, this->printer_config.bed_size_y.value);

    // start chronometer
    typedef std::chrono::high_resolution_clock clock_;
    typedef std::chrono::duration<double, std::ratio<1> > second_;
    std::chrono::time_point<clock_> t0{ clock_::now() };

    Slicer slicer(this->slice_config);
    slicer.threads = this->config.getInt("threads", 0);
    slicer.status_cb = [](int current, int total, const std::string& msg) {
        boost::nowide::cout << msg << std::endl;
    };
    const SlicedLayers layers = slicer.slice(mesh);
    if (slicer.state() == ssFailed) {
        Laminar::Log::error("CLI") << "Slicing failed: " << slicer.failure_reason() << std::endl;
        return false;
    }

    const std::string outfile = this->output_filepath(input_file);
    GCodeStats stats;
    try {
        boost::nowide::ofstream fh(outfile, std::ios::out | std::ios::trunc);
        if (!fh.is_open())
            throw std::runtime_error("Cannot write G-code file " + outfile);
        PrintGCode print_gcode(layers, this->slice_config, this->printer_config, fh);
        print_gcode.output();
        stats = print_gcode.stats();
    } catch (std::runtime_error &e) {
        Laminar::Log::error("CLI") << e.what() << std::endl;
        return false;
    }
    Laminar::Log::info("CLI") << "G-code exported to " << outfile << std::endl;
    this->last_outfile = outfile;

    // output some statistics
    const PrintEstimate estimate = Laminar::estimate(layers, this->slice_config);
    double duration { std::chrono::duration_cast<second_>(clock_::now() - t0).count() };
    boost::nowide::cout << std::fixed << std::setprecision(0)
        << "Done. Process took " << std::floor(duration/60) << " minutes and "
        << std::setprecision(3)
        << std::fmod(duration, 60.0) << " seconds." << std::endl
        << "Estimated print time: " << format_duration(estimate.seconds) << std::endl
        << std::setprecision(2)
        << "Filament required: " << stats.filament_used_mm << "mm"
        << " (" << stats.extruded_volume/1000 << "cm3, "
        << estimate.grams << "g)" << std::endl;
    return true;
}

void
CLI::print_help(bool include_print_options) const {
    boost::nowide::cout
        << "Laminar " << LAMINAR_VERSION << " (build commit: " << BUILD_COMMIT << ")" << std::endl
        << std::endl
        << "Usage: laminar [ OPTIONS ] file.stl|file.obj" << std::endl
        << std::endl
        << "Options:" << std::endl;
    cli_config_def.print_cli_help(boost::nowide::cout, false);

    if (include_print_options) {
        boost::nowide::cout << std::endl;
        print_config_def.print_cli_help(boost::nowide::cout, true);
    } else {
        boost::nowide::cout
            << std::endl
            << "Run --help to see the full listing of slice options." << std::endl;
    }
}

std::string
CLI::output_filepath(const std::string &input_file) const {
    const boost::filesystem::path input(input_file);
    const std::string filename = input.stem().string() + ".gcode";

    // use --output when available
    std::string outfile{ this->config.getString("output", "") };
    if (!outfile.empty()) {
        // if we were supplied a directory, use it and append our automatically generated filename
        const boost::filesystem::path out(outfile);
        if (boost::filesystem::is_directory(out))
            outfile = (out / filename).string();
    } else {
        outfile = (input.parent_path() / filename).string();
    }
    return outfile;
}
