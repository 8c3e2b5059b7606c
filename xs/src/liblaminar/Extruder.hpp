#ifndef laminar_Extruder_hpp_
#define laminar_Extruder_hpp_

#include "liblaminar.h"

namespace Laminar {

/// E axis bookkeeping of the single extruder (absolute E distances).
class Extruder
{
    public:
    /// Current E position as written to the G-code.
    double E;
    /// E position ignoring resets.
    double absolute_E;
    double retracted;
    double restart_extra;
    /// Filament length per mm3 of extruded plastic.
    double e_per_mm3;

    explicit Extruder(double filament_diameter);
    virtual ~Extruder() {}
    void reset();
    /// Reset only the E origin (G92 E0).
    void reset_E() { this->E = 0; };
    double extrude(double dE);
    double retract(double length, double restart_extra);
    double unretract();
    double e_per_mm(double mm3_per_mm) const;
    double extruded_volume() const;

    /// Length of filament pushed through, mm.
    double used_filament() const;

    double filament_diameter() const { return this->_filament_diameter; };

    private:
    double _filament_diameter;
};

}

#endif
