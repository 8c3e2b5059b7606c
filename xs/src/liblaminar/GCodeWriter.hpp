#ifndef laminar_GCodeWriter_hpp_
#define laminar_GCodeWriter_hpp_

#include "liblaminar.h"
#include <string>
#include "Extruder.hpp"
#include "Point.hpp"
#include "PrintConfig.hpp"

namespace Laminar {

/// Formats single RepRap/Marlin G-code commands and tracks the machine state
/// (position, E axis, fan, lift) they leave behind.
class GCodeWriter {
public:
    const SliceConfig* config;
    const PrinterConfig* printer;
    Extruder extruder;

    GCodeWriter(const SliceConfig* config, const PrinterConfig* printer)
        : config(config), printer(printer), extruder(config->filament_diameter.value),
          _last_fan_speed(-1), _last_F(-1), _lifted(0), _moves(0)
        {};

    std::string preamble();
    std::string set_temperature(unsigned int temperature, bool wait = false) const;
    /// Requests above bed_temp_max are clamped with a warning.
    std::string set_bed_temperature(unsigned int temperature, bool wait = false) const;
    /// speed in percent; nothing is written when it did not change.
    std::string set_fan(unsigned int speed);
    std::string reset_e(bool force = false);

    /// Feed rate in mm/min for a speed in mm/s, capped by the printer's max_speed.
    double feedrate(double speed) const;

    std::string travel_to_xy(const Pointf &point, const std::string &comment = std::string());
    std::string travel_to_z(double z, const std::string &comment = std::string());
    /// F is written only when it differs from the last feed rate.
    std::string extrude_to_xy(const Pointf &point, double dE, double F, const std::string &comment = std::string());
    std::string extrude_to_xyz(const Pointf3 &point, double dE, double F, const std::string &comment = std::string());
    std::string retract();
    std::string unretract();
    std::string lift();
    std::string unlift();

    Pointf3 get_position() const { return this->_pos; }
    bool is_lifted() const { return this->_lifted > 0; }
    /// Number of G1 moves written so far.
    size_t moves() const { return this->_moves; }

private:
    int _last_fan_speed;
    double _last_F;
    double _lifted;
    size_t _moves;
    Pointf3 _pos;

    std::string _travel_to_z(double z, const std::string &comment);
};

}

#endif
