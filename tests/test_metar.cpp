#include "test_runner.h"
#include "../src/metar.h"
#include "../src/report_json.h"
#include "../src/term_colour.h"

#include <wx/init.h>
#include <wx/jsonval.h>
#include <wx/log.h>

// ---- helpers ---------------------------------------------------------------

static wxJSONValue json(const char *s) {
    wxJSONValue root;
    wxString err;
    ParseJsonDocument(wxString::FromUTF8(s), root, err);
    return root;
}

static Config airfield_config(const char *icao) {
    Config config;
    config.position = Position::Airfield(wxString::FromUTF8(icao));
    return config;
}

static const char *FULL_METAR = R"({
    "station": "EDDK",
    "time": {"repr": "210550Z", "dt": "2024-06-21T05:50:00Z"},
    "wind_direction": {"repr": "240", "value": 240},
    "wind_speed": {"repr": "12", "value": 12},
    "wind_gust": {"repr": "22", "value": 22},
    "wind_variable_direction": [{"repr": "270", "value": 270}, {"repr": "210", "value": 210}],
    "visibility": {"repr": "9999", "value": 9999},
    "temperature": {"repr": "M05", "value": -5},
    "dewpoint": {"repr": "M07", "value": -7},
    "altimeter": {"repr": "Q1013", "value": 1013},
    "wx_codes": [{"repr": "-SN", "value": "Light Snow"}],
    "clouds": [{"repr": "FEW030", "type": "FEW", "altitude": 30}],
    "remarks": "NOSIG",
    "units": {"altimeter": "hPa", "altitude": "ft", "temperature": "C",
              "visibility": "m", "wind_speed": "kt"}
})";

// ---- single extractors -----------------------------------------------------

TEST(GetTimestamp_parses_instant) {
    WxField f;
    REQUIRE(GetTimestamp(json(R"({"time":{"dt":"2024-06-21T05:50:00Z"}})"), Units(), f));
    REQUIRE_EQ(f.kind, FIELD_TIMESTAMP);
    REQUIRE_EQ((long)f.time.GetTicks(), 1718949000L);
}

TEST(GetTimestamp_honours_offset) {
    WxField f;
    REQUIRE(GetTimestamp(json(R"({"time":{"dt":"2024-06-21T07:50:00+02:00"}})"), Units(), f));
    REQUIRE_EQ((long)f.time.GetTicks(), 1718949000L);
}

TEST(GetTimestamp_rejects_garbage) {
    WxField f;
    REQUIRE(!GetTimestamp(json(R"({"time":{"dt":"yesterday"}})"), Units(), f));
    REQUIRE(!GetTimestamp(json(R"({"time":"2024-06-21T05:50:00Z"})"), Units(), f));
}

TEST(GetWinds_without_gust_key_defaults_to_zero) {
    WxField f;
    REQUIRE(GetWinds(json(R"({"wind_direction":{"value":100},"wind_speed":{"value":10}})"),
                     Units(), f));
    REQUIRE(f == WxField::Wind(100, 10, 0, SPEED_KT));
}

TEST(GetWinds_null_gust_defaults_to_zero) {
    WxField f;
    REQUIRE(GetWinds(json(R"({"wind_direction":{"value":100},"wind_speed":{"value":10},
                              "wind_gust":{"value":null}})"), Units(), f));
    REQUIRE_EQ(f.gusts, 0L);
}

TEST(GetWinds_variable_direction_is_absent) {
    WxField f;
    REQUIRE(!GetWinds(json(R"({"wind_direction":{"repr":"VRB","value":null},
                               "wind_speed":{"value":3}})"), Units(), f));
}

TEST(GetWinds_carries_report_unit) {
    Units units;
    units.wind_speed = SPEED_MPH;
    WxField f;
    REQUIRE(GetWinds(json(R"({"wind_direction":{"value":10},"wind_speed":{"value":20},
                              "wind_gust":{"value":31}})"), units, f));
    REQUIRE(f == WxField::Wind(10, 20, 31, SPEED_MPH));
}

TEST(GetWindVar_is_order_independent) {
    WxField a, b;
    REQUIRE(GetWindVar(json(R"({"wind_variable_direction":[{"value":150},{"value":80}]})"),
                       Units(), a));
    REQUIRE(GetWindVar(json(R"({"wind_variable_direction":[{"value":80},{"value":150}]})"),
                       Units(), b));
    REQUIRE(a == WxField::WindVariability(80, 150));
    REQUIRE(a == b);
}

TEST(GetWindVar_single_value) {
    WxField f;
    REQUIRE(GetWindVar(json(R"({"wind_variable_direction":[{"value":120}]})"), Units(), f));
    REQUIRE(f == WxField::WindVariability(120, 120));
}

TEST(GetWindVar_empty_or_malformed_is_absent) {
    WxField f;
    REQUIRE(!GetWindVar(json(R"({"wind_variable_direction":[]})"), Units(), f));
    REQUIRE(!GetWindVar(json(R"({"wind_variable_direction":[{"value":80},{"value":"x"}]})"),
                        Units(), f));
    REQUIRE(!GetWindVar(json("{}"), Units(), f));
}

TEST(GetVisibility_integer_only) {
    WxField f;
    REQUIRE(GetVisibility(json(R"({"visibility":{"value":4000}})"), Units(), f));
    REQUIRE(f == WxField::Visibility(4000, DISTANCE_M));
    REQUIRE(!GetVisibility(json(R"({"visibility":{"value":null}})"), Units(), f));
}

TEST(GetTemp_needs_both_values) {
    WxField f;
    REQUIRE(GetTemp(json(R"({"temperature":{"value":12},"dewpoint":{"value":9}})"), Units(), f));
    REQUIRE(f == WxField::Temperature(12, 9, TEMPERATURE_C));
    REQUIRE(!GetTemp(json(R"({"temperature":{"value":12}})"), Units(), f));
}

TEST(GetQnh_inhg_decimal_normalised) {
    Units units;
    units.pressure = PRESSURE_INHG;
    WxField f;
    REQUIRE(GetQnh(json(R"({"altimeter":{"value":29.92}})"), units, f));
    REQUIRE(f == WxField::Altimeter(2992, PRESSURE_INHG));
}

TEST(GetQnh_hpa_integer_unchanged) {
    WxField f;
    REQUIRE(GetQnh(json(R"({"altimeter":{"value":1013}})"), Units(), f));
    REQUIRE(f == WxField::Altimeter(1013, PRESSURE_HPA));
}

TEST(GetRemarks_passes_text_through) {
    WxField f;
    REQUIRE(GetRemarks(json(R"({"remarks":"AO2 SLP132"})"), Units(), f));
    REQUIRE(f.remarks == wxT("AO2 SLP132"));
    REQUIRE(!GetRemarks(json(R"({"remarks":null})"), Units(), f));
}

// ---- whole report ----------------------------------------------------------

TEST(ExtractFields_follows_report_order) {
    WxFieldList fields = ExtractFields(json(FULL_METAR), Units());
    REQUIRE_EQ((int)fields.size(), 9);
    REQUIRE_EQ(fields[0].kind, FIELD_TIMESTAMP);
    REQUIRE_EQ(fields[1].kind, FIELD_WIND);
    REQUIRE_EQ(fields[2].kind, FIELD_WIND_VARIABILITY);
    REQUIRE_EQ(fields[3].kind, FIELD_VISIBILITY);
    REQUIRE_EQ(fields[4].kind, FIELD_TEMPERATURE);
    REQUIRE_EQ(fields[5].kind, FIELD_ALTIMETER);
    REQUIRE_EQ(fields[6].kind, FIELD_WX_PHENOMENON);
    REQUIRE_EQ(fields[7].kind, FIELD_CLOUD_LAYER);
    REQUIRE_EQ(fields[8].kind, FIELD_REMARKS);
}

TEST(ExtractFields_wind_only_report) {
    WxFieldList fields = ExtractFields(
        json(R"({"wind_direction":{"value":100},"wind_speed":{"value":10}})"), Units());
    REQUIRE_EQ((int)fields.size(), 1);
    REQUIRE(fields[0] == WxField::Wind(100, 10, 0, SPEED_KT));
}

TEST(ExtractFields_clouds_in_order) {
    WxFieldList fields = ExtractFields(
        json(R"({"clouds":[{"repr":"SCT050"},{"repr":"BRK100"},{"repr":"OVC200"}]})"),
        Units());
    REQUIRE_EQ((int)fields.size(), 3);
    REQUIRE(fields[0] == WxField::CloudLayer(CLOUDS_SCT, 50));
    REQUIRE(fields[1] == WxField::CloudLayer(CLOUDS_BRK, 100));
    REQUIRE(fields[2] == WxField::CloudLayer(CLOUDS_OVC, 200));
}

TEST(ParseMetar_station_and_timestamp_only) {
    Metar m;
    wxString err;
    REQUIRE(ParseMetar(json(R"({"station":"EDRK","time":{"dt":"2024-06-21T05:50:00Z"}})"),
                       Config(), m, err));
    REQUIRE(m.station == wxT("EDRK"));
    REQUIRE_EQ((int)m.fields.size(), 1);
    REQUIRE_EQ(m.fields[0].kind, FIELD_TIMESTAMP);
    REQUIRE_EQ((long)m.fields[0].time.GetTicks(), 1718949000L);
}

TEST(ParseMetar_missing_station_is_fatal) {
    Metar m;
    wxString err;
    REQUIRE(!ParseMetar(json(R"({"wind_direction":{"value":100},"wind_speed":{"value":10}})"),
                        Config(), m, err));
    REQUIRE(!err.IsEmpty());
}

TEST(ParseMetar_uses_report_units) {
    Metar m;
    wxString err;
    REQUIRE(ParseMetar(json(R"({"station":"KJFK","altimeter":{"value":30.01},
                               "units":{"altimeter":"inHg"}})"), Config(), m, err));
    REQUIRE_EQ((int)m.fields.size(), 1);
    REQUIRE(m.fields[0] == WxField::Altimeter(3001, PRESSURE_INHG));
}

// ---- exact match -----------------------------------------------------------

TEST(ExactMatch_same_airfield) {
    REQUIRE(IsExactMatch(wxT("EDDK"), Position::Airfield(wxT("EDDK"))));
    REQUIRE(IsExactMatch(wxT("eddk"), Position::Airfield(wxT("EDDK"))));
}

TEST(ExactMatch_substitute_station) {
    REQUIRE(!IsExactMatch(wxT("EDRK"), Position::Airfield(wxT("EDDK"))));
}

TEST(ExactMatch_coordinate_and_geoip_always_match) {
    REQUIRE(IsExactMatch(wxT("EDRK"), Position::Coordinates(50.9, 7.1)));
    REQUIRE(IsExactMatch(wxT("KJFK"), Position::GeoIP()));
}

TEST(ParseMetar_flags_substitute_station) {
    Metar m;
    wxString err;
    REQUIRE(ParseMetar(json(R"({"station":"EDRK"})"), airfield_config("EDDK"), m, err));
    REQUIRE(!m.exact_match);
    REQUIRE(ParseMetar(json(R"({"station":"EDDK"})"), airfield_config("EDDK"), m, err));
    REQUIRE(m.exact_match);
}

// ---- rendering -------------------------------------------------------------

TEST(RenderMetar_text_layout) {
    Metar m;
    wxString err;
    REQUIRE(ParseMetar(json(FULL_METAR), airfield_config("EDDK"), m, err));
    wxString text = StripColour(RenderMetar(m, Config()));
    REQUIRE(text == wxT("EDDK 210550Z 24012G22KT 210V270 9999 M05/M07 Q1013 -SN FEW030 NOSIG"));
}

TEST(RenderMetar_station_only) {
    Metar m;
    m.station = wxT("EDRK");
    REQUIRE(StripColour(RenderMetar(m, Config())) == wxT("EDRK"));
}

TEST(RenderMetar_badge_colour_depends_on_match) {
    Metar m;
    m.station = wxT("EDRK");
    m.exact_match = true;
    REQUIRE_CONTAINS(RenderMetar(m, Config()), wxT("\x1b[97;44m"));
    m.exact_match = false;
    REQUIRE_CONTAINS(RenderMetar(m, Config()), wxT("\x1b[30;43m"));
}

int main(int argc, char **argv) {
    wxInitializer initializer;
    // Suppress wx log output during tests
    wxLogNull null_log;
    return run_tests(argc, argv);
}
