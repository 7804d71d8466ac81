#include <doctest/doctest.h>
#include <limits>
#include <string>
#include "fusionflex/command.hpp"
#include "fusionflex/volume.hpp"

using namespace fusionflex;

static std::string vol(float db) {
    std::string out;
    REQUIRE(encode_set_volume_db(db, out) == Result::Ok);
    return out;
}

TEST_CASE("Fixed commands map to their literal wire strings") {
    CHECK(std::string(wire_string(Command::PowerOn))         == "'@112'");
    CHECK(std::string(wire_string(Command::PowerOff))        == "'@113'");
    CHECK(std::string(wire_string(Command::SelectInput1))    == "'@15A'");
    CHECK(std::string(wire_string(Command::SelectInput2))    == "'@15B'");
    CHECK(std::string(wire_string(Command::SelectInputAuto)) == "'@15Z'");
    CHECK(std::string(wire_string(Command::MuteOn))          == "'@11Q'");
    CHECK(std::string(wire_string(Command::MuteOff))         == "'@11R'");
    CHECK(std::string(wire_string(Command::MuteToggle))      == "'@11U'");
    CHECK(std::string(wire_string(Command::VolumeUp))        == "'@11S'");
    CHECK(std::string(wire_string(Command::VolumeDown))      == "'@11T'");
}

TEST_CASE("Set-volume rounds to 0.5 dB and encodes the magnitude") {
    CHECK(vol(-3.2f)  == "'@11P-03.0'");
    CHECK(vol(-3.3f)  == "'@11P-03.5'");
    CHECK(vol(-95.5f) == "'@11P-95.5'");
    CHECK(vol(0.0f)   == "'@11P-00.0'");
    CHECK(vol(-0.1f)  == "'@11P-00.0'");
    // halfway cases round to the even half-step
    CHECK(vol(-47.75f) == "'@11P-48.0'");
    CHECK(vol(-47.25f) == "'@11P-47.0'");
}

TEST_CASE("Set-volume moves in whole device steps") {
    CHECK(vol(-10.0f - VOLUME_STEP_DB) == "'@11P-10.5'");
    CHECK(vol(-10.0f - VOLUME_STEP_DB / 4) == "'@11P-10.0'");
    CHECK(vol(MIN_VOLUME_DB) == "'@11P-95.5'");
}

TEST_CASE("Set-volume drops the sign of positive input") {
    CHECK(vol(3.2f) == "'@11P-03.0'");
}

TEST_CASE("Set-volume rejects non-finite input and leaves out untouched") {
    std::string out = "unchanged";
    CHECK(encode_set_volume_db(std::numeric_limits<float>::quiet_NaN(), out) == Result::OutOfRange);
    CHECK(encode_set_volume_db(std::numeric_limits<float>::infinity(), out) == Result::OutOfRange);
    CHECK(out == "unchanged");
}

TEST_CASE("Source modes select the matching input command") {
    Command c = Command::PowerOn;
    CHECK(command_for_source(SourceMode::Auto, c) == Result::Ok);
    CHECK(c == Command::SelectInputAuto);
    CHECK(command_for_source(SourceMode::Input1, c) == Result::Ok);
    CHECK(c == Command::SelectInput1);
    CHECK(command_for_source(SourceMode::Input2, c) == Result::Ok);
    CHECK(c == Command::SelectInput2);

    CHECK(command_for_source(static_cast<SourceMode>(7), c) == Result::UnsupportedSource);
    CHECK(c == Command::SelectInput2);
}

TEST_CASE("Source mode names round-trip through their string forms") {
    SourceMode m = SourceMode::Auto;
    CHECK(source_from_string("INPUT_2", m));
    CHECK(m == SourceMode::Input2);
    CHECK(source_from_string("input1", m));
    CHECK(m == SourceMode::Input1);
    CHECK(source_from_string("auto", m));
    CHECK(m == SourceMode::Auto);
    CHECK_FALSE(source_from_string("hdmi", m));
    CHECK(to_string(static_cast<SourceMode>(9)) == nullptr);
}

TEST_CASE("CLI verbs resolve case-insensitively") {
    Command c = Command::PowerOff;
    CHECK(name_to_command("ON", c));
    CHECK(c == Command::PowerOn);
    CHECK(name_to_command("toggle", c));
    CHECK(c == Command::MuteToggle);
    CHECK(name_to_command("input2", c));
    CHECK(c == Command::SelectInput2);
    CHECK_FALSE(name_to_command("reboot", c));
    CHECK(c == Command::SelectInput2);
}
