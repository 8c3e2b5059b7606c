#include "Extruder.hpp"

namespace Laminar {

Extruder::Extruder(double filament_diameter)
:   _filament_diameter(filament_diameter)
{
    reset();

    // cache values that are going to be called often
    this->e_per_mm3 = 4 / ((filament_diameter * filament_diameter) * PI);
}

void
Extruder::reset()
{
    this->E = 0;
    this->absolute_E = 0;
    this->retracted = 0;
    this->restart_extra = 0;
}

double
Extruder::extrude(double dE)
{
    this->E += dE;
    this->absolute_E += dE;
    return dE;
}

/* This method makes sure the extruder is retracted by the specified amount
   of filament and returns the amount of filament retracted.
   If the extruder is already retracted by the same or a greater amount,
   this method is a no-op.
   The restart_extra argument sets the extra length pushed back on the next
   unretraction. */
double
Extruder::retract(double length, double restart_extra)
{
    double to_retract = length - this->retracted;
    if (to_retract > 0) {
        this->E -= to_retract;
        this->absolute_E -= to_retract;
        this->retracted += to_retract;
        this->restart_extra = restart_extra;
        return to_retract;
    } else {
        return 0;
    }
}

double
Extruder::unretract()
{
    double dE = this->retracted + this->restart_extra;
    this->extrude(dE);
    this->retracted = 0;
    this->restart_extra = 0;
    return dE;
}

double
Extruder::e_per_mm(double mm3_per_mm) const
{
    return mm3_per_mm * this->e_per_mm3;
}

double
Extruder::extruded_volume() const
{
    return this->used_filament() * (this->_filament_diameter * this->_filament_diameter) * PI/4;
}

double
Extruder::used_filament() const
{
    // Any current amount of retraction should not affect used filament, since
    // it represents empty volume in the nozzle. We add it back to E.
    return this->absolute_E + this->retracted;
}

}
