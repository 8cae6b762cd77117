#include "test_runner.h"
#include "../src/colourise.h"

#include <wx/init.h>
#include <wx/log.h>

static wxString green(const wxChar *s)  { return Paint(s, TC_GREEN); }
static wxString yellow(const wxChar *s) { return Paint(s, TC_YELLOW); }
static wxString red(const wxChar *s)    { return Paint(s, TC_RED); }

// ---- term colour -----------------------------------------------------------

TEST(Paint_wraps_in_sgr) {
    REQUIRE(Paint(wxT("OVC"), TC_RED) == wxT("\x1b[31mOVC\x1b[0m"));
    REQUIRE(Paint(wxT("EDDK"), TC_BRIGHT_WHITE, TC_BLUE) == wxT("\x1b[97;44mEDDK\x1b[0m"));
}

TEST(Paint_empty_text_stays_empty) {
    REQUIRE(Paint(wxEmptyString, TC_RED).IsEmpty());
    REQUIRE(Paint(wxT("x"), TC_DEFAULT) == wxT("x"));
}

TEST(StripColour_removes_sequences) {
    REQUIRE(StripColour(Paint(wxT("A"), TC_RED) + wxT(" ") +
                        Paint(wxT("B"), TC_BLACK, TC_WHITE)) == wxT("A B"));
}

// ---- visibility ------------------------------------------------------------

TEST(Visibility_boundaries) {
    Config c;
    REQUIRE_EQ(ClassifyVisibility(5000, DISTANCE_M, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyVisibility(4999, DISTANCE_M, c), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyVisibility(1501, DISTANCE_M, c), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyVisibility(1500, DISTANCE_M, c), SEVERITY_BAD);
    REQUIRE_EQ(ClassifyVisibility(0, DISTANCE_M, c), SEVERITY_BAD);
}

TEST(Visibility_converts_statute_miles) {
    Config c;
    REQUIRE_EQ(ClassifyVisibility(10, DISTANCE_MI, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyVisibility(2, DISTANCE_MI, c), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyVisibility(0, DISTANCE_MI, c), SEVERITY_BAD);
}

TEST(Visibility_fragment) {
    Config c;
    REQUIRE(ColouriseVisibility(9999, DISTANCE_M, c) == green(wxT("9999")));
    REQUIRE(ColouriseVisibility(800, DISTANCE_M, c) == red(wxT("0800")));
    REQUIRE(ColouriseVisibility(3, DISTANCE_MI, c) == yellow(wxT("3SM")));
}

// ---- clouds ----------------------------------------------------------------

TEST(CloudHeight_boundaries) {
    Config c;
    REQUIRE_EQ(ClassifyCloudHeight(6, c), SEVERITY_BAD);
    REQUIRE_EQ(ClassifyCloudHeight(7, c), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyCloudHeight(15, c), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyCloudHeight(16, c), SEVERITY_GOOD);
}

TEST(CloudHeight_severity_never_worsens_with_height) {
    Config c;
    Severity prev = ClassifyCloudHeight(0, c);
    for (long h = 1; h <= 400; h++) {
        Severity s = ClassifyCloudHeight(h, c);
        REQUIRE((int)s <= (int)prev);
        prev = s;
    }
}

TEST(Coverage_tints) {
    REQUIRE_EQ(ClassifyCoverage(CLOUDS_OVC), SEVERITY_BAD);
    REQUIRE_EQ(ClassifyCoverage(CLOUDS_BRK), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyCoverage(CLOUDS_SCT), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyCoverage(CLOUDS_FEW), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyCoverage(CLOUDS_SKC), SEVERITY_GOOD);
}

TEST(Clouds_fragment_colours_parts_independently) {
    Config c;
    REQUIRE(ColouriseClouds(CLOUDS_OVC, 200, c) == red(wxT("OVC")) + green(wxT("200")));
    REQUIRE(ColouriseClouds(CLOUDS_FEW, 5, c) == green(wxT("FEW")) + red(wxT("005")));
    REQUIRE(ColouriseClouds(CLOUDS_BRK, 12, c) == yellow(wxT("BRK")) + yellow(wxT("012")));
}

// ---- temperature -----------------------------------------------------------

TEST(Temperature_boundaries) {
    Config c;
    REQUIRE_EQ(ClassifyTemperature(1, TEMPERATURE_C, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyTemperature(0, TEMPERATURE_C, c), SEVERITY_BAD);
    REQUIRE_EQ(ClassifyTemperature(33, TEMPERATURE_F, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyTemperature(32, TEMPERATURE_F, c), SEVERITY_BAD);
}

TEST(Spread_boundaries) {
    Config c;
    REQUIRE_EQ(ClassifySpread(10, 6, TEMPERATURE_C, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifySpread(10, 7, TEMPERATURE_C, c), SEVERITY_BAD);
    REQUIRE_EQ(ClassifySpread(50, 44, TEMPERATURE_F, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifySpread(50, 45, TEMPERATURE_F, c), SEVERITY_BAD);
}

TEST(Temperature_fragment) {
    Config c;
    REQUIRE(ColouriseTemperature(12, 4, TEMPERATURE_C, c) ==
            Paint(wxT("12"), TC_BRIGHT_GREEN) + wxT("/") + green(wxT("04")));
    REQUIRE(ColouriseTemperature(-2, -3, TEMPERATURE_C, c) ==
            Paint(wxT("M02"), TC_BRIGHT_RED) + wxT("/") + red(wxT("M03")));
}

// ---- wind ------------------------------------------------------------------

TEST(WindSpeed_boundaries) {
    Config c;
    REQUIRE_EQ(ClassifyWindSpeed(15, SPEED_KT, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyWindSpeed(16, SPEED_KT, c), SEVERITY_BAD);
    REQUIRE_EQ(ClassifyWindSpeed(27, SPEED_KPH, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyWindSpeed(30, SPEED_KPH, c), SEVERITY_BAD);
}

TEST(Gust_boundaries) {
    Config c;
    REQUIRE_EQ(ClassifyGust(10, 20, SPEED_KT, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyGust(10, 21, SPEED_KT, c), SEVERITY_BAD);
}

TEST(WindVariability_boundaries) {
    Config c;
    REQUIRE_EQ(ClassifyWindVariability(200, 244, c), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyWindVariability(200, 245, c), SEVERITY_MARGINAL);
}

TEST(Wind_fragment_without_gusts) {
    Config c;
    REQUIRE(ColouriseWind(90, 5, 0, SPEED_KT, c) ==
            wxString(wxT("090")) + green(wxT("05")) + wxT("KT"));
}

TEST(Wind_fragment_with_gusts) {
    Config c;
    REQUIRE(ColouriseWind(270, 18, 35, SPEED_KT, c) ==
            wxString(wxT("270")) + red(wxT("18")) + wxT("G") +
            Paint(wxT("35"), TC_BRIGHT_RED) + wxT("KT"));
    REQUIRE(StripColour(ColouriseWind(270, 10, 15, SPEED_MPH, c)) == wxT("27010G15MPH"));
}

TEST(WindVariability_fragment) {
    Config c;
    REQUIRE(ColouriseWindVariability(10, 80, c) == yellow(wxT("010V080")));
}

// ---- altimeter -------------------------------------------------------------

TEST(Altimeter_boundaries) {
    REQUIRE_EQ(ClassifyAltimeter(1013, PRESSURE_HPA), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyAltimeter(1012, PRESSURE_HPA), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyAltimeter(2992, PRESSURE_INHG), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyAltimeter(2991, PRESSURE_INHG), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyAltimeter(900, PRESSURE_HPA), SEVERITY_MARGINAL);
}

TEST(Altimeter_fragment) {
    REQUIRE(ColouriseAltimeter(1020, PRESSURE_HPA) == green(wxT("Q1020")));
    REQUIRE(ColouriseAltimeter(2987, PRESSURE_INHG) == yellow(wxT("A2987")));
    REQUIRE(ColouriseAltimeter(998, PRESSURE_HPA) == yellow(wxT("Q0998")));
}

// ---- age -------------------------------------------------------------------

TEST(Age_boundaries) {
    wxTimeSpan marginal = wxTimeSpan::Hours(1), maximum = wxTimeSpan::Hours(6);
    REQUIRE_EQ(ClassifyAge(wxTimeSpan::Minutes(59), marginal, maximum), SEVERITY_GOOD);
    REQUIRE_EQ(ClassifyAge(wxTimeSpan::Hours(1), marginal, maximum), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyAge(wxTimeSpan::Minutes(359), marginal, maximum), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyAge(wxTimeSpan::Hours(6), marginal, maximum), SEVERITY_BAD);
}

TEST(Timestamp_fragment_uses_given_now) {
    wxDateTime obs((time_t)1718949000);   // 2024-06-21 05:50Z
    wxDateTime now = obs + wxTimeSpan::Minutes(30);
    Config c;
    REQUIRE(ColouriseTimestamp(obs, now, c.age_marginal, c.age_maximum) ==
            green(wxT("210550Z")));
    now = obs + wxTimeSpan::Hours(2);
    REQUIRE(ColouriseTimestamp(obs, now, c.age_marginal, c.age_maximum) ==
            yellow(wxT("210550Z")));
    now = obs + wxTimeSpan::Hours(7);
    REQUIRE(ColouriseTimestamp(obs, now, c.age_marginal, c.age_maximum) ==
            red(wxT("210550Z")));
}

// ---- phenomena, remarks, badge ---------------------------------------------

TEST(Phenomenon_fixed_palette) {
    REQUIRE(ColourisePhenomenon(WXCODE_RA, INTENSITY_LIGHT, DESCRIPTOR_NONE,
                                PROXIMITY_ON_STATION) ==
            Paint(wxT("-"), TC_BRIGHT_GREEN) + Paint(wxT("RA"), TC_BRIGHT_YELLOW));
    REQUIRE(ColourisePhenomenon(WXCODE_GR, INTENSITY_HEAVY, DESCRIPTOR_TS,
                                PROXIMITY_ON_STATION) ==
            Paint(wxT("+"), TC_BRIGHT_RED) + red(wxT("TS")) + red(wxT("GR")));
    REQUIRE(ColourisePhenomenon(WXCODE_FG, INTENSITY_MODERATE, DESCRIPTOR_FZ,
                                PROXIMITY_VICINITY) ==
            Paint(wxT("FZ"), TC_BRIGHT_BLUE) + Paint(wxT("FG"), TC_WHITE) +
            Paint(wxT("VC"), TC_WHITE));
    REQUIRE(ColourisePhenomenon(WXCODE_GS, INTENSITY_MODERATE, DESCRIPTOR_SH,
                                PROXIMITY_ON_STATION) ==
            yellow(wxT("SH")) + yellow(wxT("GS")));
    REQUIRE(ColourisePhenomenon(WXCODE_PO, INTENSITY_MODERATE, DESCRIPTOR_NONE,
                                PROXIMITY_DISTANT) ==
            Paint(wxT("PO"), TC_BRIGHT_RED) + Paint(wxT("DSNT"), TC_WHITE));
}

TEST(Remarks_black_on_white) {
    REQUIRE(ColouriseRemarks(wxT("NOSIG")) == Paint(wxT("NOSIG"), TC_BLACK, TC_WHITE));
}

TEST(StationBadge_exact_and_substitute) {
    REQUIRE(StationBadge(wxT("EDDK"), true) == Paint(wxT("EDDK"), TC_BRIGHT_WHITE, TC_BLUE));
    REQUIRE(StationBadge(wxT("EDRK"), false) == Paint(wxT("EDRK"), TC_BLACK, TC_YELLOW));
}

TEST(ColouriseFields_space_joined) {
    Config c;
    WxFieldList fields;
    fields.push_back(WxField::Visibility(9999, DISTANCE_M));
    fields.push_back(WxField::CloudLayer(CLOUDS_SCT, 40));
    fields.push_back(WxField::Remarks(wxT("NOSIG")));
    REQUIRE(StripColour(ColouriseFields(fields, c, wxDateTime::Now())) ==
            wxT("9999 SCT040 NOSIG"));
    REQUIRE(ColouriseFields(WxFieldList(), c, wxDateTime::Now()).IsEmpty());
}

TEST(Thresholds_follow_config) {
    Config c;
    c.visibility_minimum = 3000;
    c.visibility_marginal = 8000;
    c.cloud_minimum = 10;
    c.wind_maximum = 25;
    REQUIRE_EQ(ClassifyVisibility(6000, DISTANCE_M, c), SEVERITY_MARGINAL);
    REQUIRE_EQ(ClassifyVisibility(3000, DISTANCE_M, c), SEVERITY_BAD);
    REQUIRE_EQ(ClassifyCloudHeight(10, c), SEVERITY_BAD);
    REQUIRE_EQ(ClassifyWindSpeed(20, SPEED_KT, c), SEVERITY_GOOD);
}

int main(int argc, char **argv) {
    wxInitializer initializer;
    wxLogNull null_log;
    return run_tests(argc, argv);
}
