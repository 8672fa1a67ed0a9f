#ifndef CAR_INTERFACE_HPP
#define CAR_INTERFACE_HPP

#include "core/config.hpp"

/*** Actuator / sensor collaborator used by the mapper.
 *   Commands return false when the device rejected or failed them;
 *   readDistance() returns <= 0 when there is no echo.  Timing and
 *   distance calibration belong to the implementation.               */
class CarInterface {
public:
    virtual ~CarInterface() = default;

    // Sensor pan servo, absolute 0..180, 90 = straight ahead
    virtual bool   setSensorHeading(double angle_deg) = 0;
    virtual double readDistance() = 0;   // cm
    bool centerSensor() { return setSensorHeading(SENSOR_CENTER_DEG); }

    // Coarse motion primitives
    virtual bool turnLeft(double degrees)  = 0;
    virtual bool turnRight(double degrees) = 0;
    virtual bool forward()  = 0;
    virtual bool backward() = 0;
    virtual bool setSpeed(int percent) = 0;
    virtual bool stop() = 0;
};

#endif // CAR_INTERFACE_HPP
