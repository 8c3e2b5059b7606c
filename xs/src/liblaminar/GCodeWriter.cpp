#include "GCodeWriter.hpp"
#include "Log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

#define COMMENT(comment) if (!comment.empty()) gcode << " ; " << comment;
#define XYZ_NUM(val) to_string_nozero(val, 3)
#define E_NUM(val) to_string_nozero(val, 5)
#define F_NUM(val) long(std::round(val))

namespace Laminar {

std::string
GCodeWriter::preamble()
{
    std::ostringstream gcode;
    gcode << "G21 ; set units to millimeters\n";
    gcode << "G90 ; use absolute coordinates\n";
    gcode << "M82 ; use absolute distances for extrusion\n";
    gcode << this->reset_e(true);
    return gcode.str();
}

std::string
GCodeWriter::set_temperature(unsigned int temperature, bool wait) const
{
    std::ostringstream gcode;
    if (wait) {
        gcode << "M109 S" << temperature << " ; set temperature and wait for it to be reached\n";
    } else {
        gcode << "M104 S" << temperature << " ; set temperature\n";
    }
    return gcode.str();
}

std::string
GCodeWriter::set_bed_temperature(unsigned int temperature, bool wait) const
{
    const unsigned int max_temp = std::max(0, this->printer->bed_temp_max.value);
    if (temperature > max_temp) {
        Log::warn("GCode") << "Bed temperature " << temperature << " exceeds the printer maximum, using "
            << max_temp << "." << std::endl;
        temperature = max_temp;
    }

    std::ostringstream gcode;
    if (wait) {
        gcode << "M190 S" << temperature << " ; set bed temperature and wait for it to be reached\n";
    } else {
        gcode << "M140 S" << temperature << " ; set bed temperature\n";
    }
    return gcode.str();
}

std::string
GCodeWriter::set_fan(unsigned int speed)
{
    speed = std::min(speed, 100u);
    if (int(speed) == this->_last_fan_speed) return "";
    this->_last_fan_speed = speed;

    std::ostringstream gcode;
    if (speed == 0) {
        gcode << "M107 ; disable fan\n";
    } else {
        gcode << "M106 S" << long(std::round(255.0 * speed / 100.0)) << " ; enable fan\n";
    }
    return gcode.str();
}

std::string
GCodeWriter::reset_e(bool force)
{
    if (this->extruder.E == 0. && !force)
        return "";
    this->extruder.reset_E();
    return "G92 E0 ; reset extrusion distance\n";
}

double
GCodeWriter::feedrate(double speed) const
{
    const double max_speed = this->printer->max_speed.value;
    if (max_speed > 0 && speed > max_speed)
        speed = max_speed;
    return speed * 60.0;
}

std::string
GCodeWriter::travel_to_xy(const Pointf &point, const std::string &comment)
{
    this->_pos.x = point.x;
    this->_pos.y = point.y;
    this->_last_F = this->feedrate(this->config->travel_speed.value);
    ++this->_moves;

    std::ostringstream gcode;
    gcode << "G1 X" << XYZ_NUM(point.x)
          <<   " Y" << XYZ_NUM(point.y)
          <<   " F" << F_NUM(this->_last_F);
    COMMENT(comment);
    gcode << "\n";
    return gcode.str();
}

std::string
GCodeWriter::travel_to_z(double z, const std::string &comment)
{
    /*  If target Z is lower than current Z but higher than nominal Z
        we don't perform the move but we only adjust the nominal Z by
        reducing the lift amount that will be used for unlift. */
    if (this->_lifted > 0) {
        const double nominal_z = this->_pos.z - this->_lifted;
        if (z >= nominal_z + EPSILON && z <= this->_pos.z - EPSILON) {
            this->_lifted -= (z - nominal_z);
            return "";
        }
    }
    this->_lifted = 0;
    return this->_travel_to_z(z, comment);
}

std::string
GCodeWriter::_travel_to_z(double z, const std::string &comment)
{
    this->_pos.z = z;
    this->_last_F = this->feedrate(this->config->travel_speed.value);
    ++this->_moves;

    std::ostringstream gcode;
    gcode << "G1 Z" << XYZ_NUM(z)
          <<   " F" << F_NUM(this->_last_F);
    COMMENT(comment);
    gcode << "\n";
    return gcode.str();
}

std::string
GCodeWriter::extrude_to_xy(const Pointf &point, double dE, double F, const std::string &comment)
{
    this->_pos.x = point.x;
    this->_pos.y = point.y;
    this->extruder.extrude(dE);
    ++this->_moves;

    std::ostringstream gcode;
    gcode << "G1 X" << XYZ_NUM(point.x)
          <<   " Y" << XYZ_NUM(point.y)
          <<   " E" << E_NUM(this->extruder.E);
    if (F_NUM(F) != F_NUM(this->_last_F)) {
        gcode << " F" << F_NUM(F);
        this->_last_F = F;
    }
    COMMENT(comment);
    gcode << "\n";
    return gcode.str();
}

std::string
GCodeWriter::extrude_to_xyz(const Pointf3 &point, double dE, double F, const std::string &comment)
{
    this->_pos = point;
    this->_lifted = 0;
    this->extruder.extrude(dE);
    ++this->_moves;

    std::ostringstream gcode;
    gcode << "G1 X" << XYZ_NUM(point.x)
          <<   " Y" << XYZ_NUM(point.y)
          <<   " Z" << XYZ_NUM(point.z)
          <<   " E" << E_NUM(this->extruder.E);
    if (F_NUM(F) != F_NUM(this->_last_F)) {
        gcode << " F" << F_NUM(F);
        this->_last_F = F;
    }
    COMMENT(comment);
    gcode << "\n";
    return gcode.str();
}

std::string
GCodeWriter::retract()
{
    const double dE = this->extruder.retract(this->config->retraction_distance.value,
        this->config->retraction_extra_prime.value);
    if (dE == 0) return "";

    this->_last_F = this->feedrate(this->config->retraction_speed.value);
    ++this->_moves;

    std::ostringstream gcode;
    gcode << "G1 E" << E_NUM(this->extruder.E) << " F" << F_NUM(this->_last_F) << " ; retract\n";
    return gcode.str();
}

std::string
GCodeWriter::unretract()
{
    if (this->extruder.retracted == 0 && this->extruder.restart_extra == 0) return "";
    this->extruder.unretract();

    this->_last_F = this->feedrate(this->config->retraction_speed.value);
    ++this->_moves;

    std::ostringstream gcode;
    gcode << "G1 E" << E_NUM(this->extruder.E) << " F" << F_NUM(this->_last_F) << " ; unretract\n";
    return gcode.str();
}

std::string
GCodeWriter::lift()
{
    const double hop = this->config->retraction_z_hop.value;
    if (hop <= 0 || this->_lifted > 0) return "";

    const double target = this->_pos.z + hop;
    std::string gcode = this->_travel_to_z(target, "lift Z");
    this->_lifted = hop;
    return gcode;
}

std::string
GCodeWriter::unlift()
{
    if (this->_lifted <= 0) return "";
    const double target = this->_pos.z - this->_lifted;
    this->_lifted = 0;
    return this->_travel_to_z(target, "restore layer Z");
}

}
