#include <catch.hpp>
#include <cstring>
#include <fstream>
#include <sstream>
#include <boost/filesystem.hpp>

#include "test_options.hpp"

#include "laminar.hpp"
#include "Log.hpp"

using namespace Laminar;
using namespace std::string_literals;

// Owns a writable argv built from args.
class Argv {
    public:
    explicit Argv(const std::vector<std::string> &args) {
        for (const std::string &arg : args) {
            char* buf = new char[arg.size() + 1];
            std::strcpy(buf, arg.c_str());
            this->argv.push_back(buf);
        }
        this->argv.push_back(nullptr);
    }
    ~Argv() {
        for (char* buf : this->argv) delete[] buf;
    }
    int argc() const { return int(this->argv.size()) - 1; }
    char** data() { return this->argv.data(); }
    private:
    std::vector<char*> argv;
};

static int run(CLI &cli, const std::vector<std::string> &args) {
    Argv argv(args);
    return cli.run(argv.argc(), argv.data());
}

static std::string read_file(const boost::filesystem::path &file) {
    std::ifstream f(file.string());
    std::stringstream buf;
    buf << f.rdbuf();
    return buf.str();
}

SCENARIO("CLI: slicing a model") {
    laminar_log->set_level(log_t::ERR);
    const boost::filesystem::path tmp = boost::filesystem::temp_directory_path()
        / boost::filesystem::unique_path("laminar-cli-%%%%-%%%%");
    boost::filesystem::create_directories(tmp);

    GIVEN("A cube and an output directory") {
        CLI cli;
        const int status = run(cli, { "laminar"s, "-o"s, tmp.string(), "--threads"s, "2"s,
            testfile("test_loader/cube.stl") });
        THEN("a G-code file named after the model is written there") {
            REQUIRE(status == 0);
            const boost::filesystem::path outfile = tmp / "cube.gcode";
            REQUIRE(boost::filesystem::exists(outfile));
            REQUIRE(cli.last_outfile_ref() == outfile.string());
            const std::string gcode = read_file(outfile);
            REQUIRE(gcode.find("; generated by Laminar") == 0);
            REQUIRE(gcode.find(";LAYER:0") != std::string::npos);
        }
    }
    GIVEN("An explicit output file") {
        CLI cli;
        const boost::filesystem::path outfile = tmp / "out.gcode";
        THEN("the G-code goes to that file") {
            REQUIRE(run(cli, { "laminar"s, "--output="s + outfile.string(),
                testfile("test_loader/cube.obj") }) == 0);
            REQUIRE(boost::filesystem::exists(outfile));
        }
    }
    GIVEN("A request for mesh information") {
        CLI cli;
        THEN("no G-code is written") {
            REQUIRE(run(cli, { "laminar"s, "--info"s, "-o"s, tmp.string(),
                testfile("test_loader/cube.stl") }) == 0);
            REQUIRE(cli.last_outfile_ref().empty());
            REQUIRE_FALSE(boost::filesystem::exists(tmp / "cube.gcode"));
        }
    }
    GIVEN("A model that cannot be read") {
        CLI cli;
        THEN("the run fails") {
            REQUIRE(run(cli, { "laminar"s, testfile("test_loader/bad_index.obj") }) != 0);
            REQUIRE(run(cli, { "laminar"s, testfile("test_loader/missing.stl") }) != 0);
        }
    }
    GIVEN("A printer whose start template uses an unknown placeholder") {
        const boost::filesystem::path profile = tmp / "bad_printer.ini";
        {
            std::ofstream f(profile.string());
            f << "start_gcode = G28\\nM109 S{hotend}\n";
        }
        CLI cli;
        THEN("emission fails and the run reports it") {
            REQUIRE(run(cli, { "laminar"s, "--printer"s, profile.string(), "-o"s, tmp.string(),
                testfile("test_loader/cube.stl") }) != 0);
        }
    }

    boost::filesystem::remove_all(tmp);
    laminar_log->set_level(log_t::INFO);
}

SCENARIO("CLI: configuration") {
    laminar_log->set_level(log_t::ERR);
    const boost::filesystem::path saved = boost::filesystem::temp_directory_path()
        / boost::filesystem::unique_path("laminar-cli-%%%%-%%%%.ini");

    GIVEN("A config file overridden on the command line") {
        CLI cli;
        const int status = run(cli, { "laminar"s, "--load"s, testfile("test_config/basic.ini"),
            "--layer-height"s, "0.1"s, "--save"s, saved.string() });
        THEN("command line options win over the file") {
            REQUIRE(status == 0);
            REQUIRE(cli.slice_config_ref().layer_height.value == Approx(0.1));
            REQUIRE(cli.slice_config_ref().infill_pattern.value == ipHoneycomb);
            REQUIRE(cli.slice_config_ref().infill_density.value == Approx(35));
        }
        THEN("the merged settings are saved") {
            SliceConfig reloaded;
            reloaded.load(saved.string());
            REQUIRE(reloaded.layer_height.value == Approx(0.1));
            REQUIRE(reloaded.seam_position.value == spSharpest);
        }
        boost::filesystem::remove(saved);
    }
    GIVEN("A printer profile and a material") {
        CLI cli;
        const int status = run(cli, { "laminar"s, "--printer"s, testfile("test_config/printer.ini"),
            "--material"s, "pla"s, "--save"s, saved.string() });
        THEN("the printer settings and the shared keys are loaded") {
            REQUIRE(status == 0);
            REQUIRE(cli.printer_config_ref().printer_name.value == "Test Printer");
            REQUIRE(cli.printer_config_ref().bed_temp_max.value == 90);
            REQUIRE(cli.slice_config_ref().filament_diameter.value == Approx(2.85));
        }
        THEN("the material sets temperatures") {
            REQUIRE(cli.slice_config_ref().print_temp.value == 210);
            REQUIRE(cli.slice_config_ref().bed_temp.value == 60);
        }
        boost::filesystem::remove(saved);
    }
    GIVEN("A relative line width") {
        CLI cli;
        const int status = run(cli, { "laminar"s, "--line-width-pct"s, "150"s, "--save"s, saved.string() });
        THEN("the line width is derived from the nozzle diameter") {
            REQUIRE(status == 0);
            REQUIRE(cli.slice_config_ref().line_width.value
                == Approx(cli.slice_config_ref().nozzle_diameter.value * 1.5));
        }
        boost::filesystem::remove(saved);
    }
    GIVEN("Invalid invocations") {
        THEN("an unknown option fails") {
            CLI cli;
            REQUIRE(run(cli, { "laminar"s, "--no-such-option"s, testfile("test_loader/cube.stl") }) != 0);
        }
        THEN("an out of range config file fails") {
            CLI cli;
            REQUIRE(run(cli, { "laminar"s, "--load"s, testfile("test_config/out_of_range.ini"),
                testfile("test_loader/cube.stl") }) != 0);
        }
        THEN("an unknown material fails") {
            CLI cli;
            REQUIRE(run(cli, { "laminar"s, "--material"s, "unobtainium"s,
                testfile("test_loader/cube.stl") }) != 0);
        }
        THEN("no input at all fails") {
            CLI cli;
            REQUIRE(run(cli, { "laminar"s }) != 0);
        }
        THEN("two inputs fail") {
            CLI cli;
            REQUIRE(run(cli, { "laminar"s, testfile("test_loader/cube.stl"),
                testfile("test_loader/cube.obj") }) != 0);
        }
    }
    laminar_log->set_level(log_t::INFO);
}
