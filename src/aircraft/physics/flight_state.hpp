#pragma once

namespace aerobuild {

/**
 * @brief Instantaneous air-relative state for one evaluation.
 *
 * Owned by the caller for the duration of a call; never stored by the model.
 */
struct FlightState {
    double alpha = 0.0;    // angle of attack, rad
    double beta = 0.0;     // sideslip, rad
    double p = 0.0;        // body roll rate, rad/s
    double q = 0.0;        // body pitch rate, rad/s
    double r = 0.0;        // body yaw rate, rad/s
    double elevator = 0.0; // deltaE, rad
    double aileron = 0.0;  // deltaA, rad
    double rudder = 0.0;   // deltaR, rad
    double airspeed = 0.0; // true airspeed, m/s
};

}
