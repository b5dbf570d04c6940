#ifndef DISTANCESOURCE_H
#define DISTANCESOURCE_H

// Raw distance capability behind a PresenceDetector.
// A missing echo is reported as NO_ECHO_DISTANCE_CM (config.h), never as a
// failure.
class DistanceSource {
public:
    virtual ~DistanceSource() {}
    virtual float measureDistance() = 0;    // centimetres
};

#endif
