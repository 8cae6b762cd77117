#include "position.h"

#include <iomanip>
#include <locale>
#include <sstream>

// Shortest form with a period separator regardless of system locale.
static std::string FmtCoord(double d) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(10) << d;
    return oss.str();
}

wxString LatLong::ToString() const {
    return wxString::FromUTF8((FmtCoord(lat) + "," + FmtCoord(lon)).c_str());
}

Position Position::Airfield(const wxString &icao) {
    Position p;
    p.kind = POSITION_AIRFIELD;
    p.icao = icao;
    return p;
}

Position Position::Coordinates(double lat, double lon) {
    Position p;
    p.kind = POSITION_LATLONG;
    p.latlong = LatLong(lat, lon);
    return p;
}

Position Position::GeoIP() {
    return Position();
}

bool IsExactMatch(const wxString &station, const Position &requested) {
    if (requested.kind != POSITION_AIRFIELD) return true;
    return station.CmpNoCase(requested.icao) == 0;
}
