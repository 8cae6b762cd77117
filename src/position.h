#ifndef _POSITION_H_
#define _POSITION_H_

#include <wx/string.h>

struct LatLong {
    double lat;
    double lon;

    LatLong() : lat(0), lon(0) {}
    LatLong(double la, double lo) : lat(la), lon(lo) {}

    // "51.4,8.5" -- the form the weather API accepts as a location.
    wxString ToString() const;
};

enum PositionKind { POSITION_AIRFIELD, POSITION_LATLONG, POSITION_GEOIP };

// The place a report was requested for.
struct Position {
    PositionKind kind;
    wxString icao;      // POSITION_AIRFIELD
    LatLong latlong;    // POSITION_LATLONG

    Position() : kind(POSITION_GEOIP) {}

    static Position Airfield(const wxString &icao);
    static Position Coordinates(double lat, double lon);
    static Position GeoIP();
};

// True if the report came from the requested station. Coordinate and
// GeoIP requests name no station, so any reporting station matches.
bool IsExactMatch(const wxString &station, const Position &requested);

#endif // _POSITION_H_
