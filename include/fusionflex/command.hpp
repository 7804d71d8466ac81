#pragma once
/**
 * @page ff-command fusionflex Command Encoder
 * @file command.hpp
 * @brief Intent -> wire string. The whole outbound vocabulary of the amplifier.
 *
 * @details
 * PURPOSE
 * -------
 * The Fusion Flex listens for short ASCII frames wrapped in `'@` ... `'`.
 * This header is the single place that knows those strings. The device facade
 * asks for a string here and hands it to the transport; nothing else in the
 * tree spells out a command.
 *
 * VOCABULARY
 * ----------
 *   PowerOn          '@112'        PowerOff        '@113'
 *   SelectInput1     '@15A'        SelectInput2    '@15B'
 *   SelectInputAuto  '@15Z'
 *   MuteOn           '@11Q'        MuteOff         '@11R'
 *   MuteToggle       '@11U'
 *   VolumeUp         '@11S'        VolumeDown      '@11T'
 *   set volume       '@11P-DD.F'   (DD = two-digit magnitude, F = 0 or 5)
 *
 * The device echoes most of these back as status reports; status.cpp matches
 * inbound frames against the same strings.
 *
 * VOLUME QUIRK
 * ------------
 * encode_set_volume_db() rounds to the nearest 0.5 dB and then drops the sign:
 * the wire format carries an unsigned attenuation after the fixed '-'. So
 * -3.2 and +3.2 both become '@11P-03.0'. Keep it that way; the device expects
 * exactly this.
 *
 * CLI NAMES
 * ---------
 * name_to_command() maps the verbs typed into fusionflex-cli ("on", "mute",
 * "input2", ...) onto fixed commands so the CLI never builds strings itself.
 */

#include <cstdint>
#include <string>

#include "fusionflex/result.hpp"

namespace fusionflex {

static constexpr const char* MESSAGE_START = "'@";  ///< every frame starts with this
static constexpr const char* MESSAGE_END   = "'";   ///< ... and ends with this

/**
 * @enum Command
 * @brief Closed set of fixed commands. The parametric set-volume command is
 *        not in here; see encode_set_volume_db().
 */
enum class Command : uint8_t {
  PowerOn,
  PowerOff,
  SelectInput1,
  SelectInput2,
  SelectInputAuto,
  MuteOn,
  MuteOff,
  MuteToggle,
  VolumeUp,
  VolumeDown
};

/**
 * @enum SourceMode
 * @brief Input selection of the amplifier. Values match the device's own
 *        numbering and are what a caller may cast from an integer.
 */
enum class SourceMode : uint8_t {
  Auto   = 0,
  Input1 = 1,
  Input2 = 2
};

/// Literal wire string for a fixed command, delimiters included.
const char* wire_string(Command cmd);

/// Short lowercase name ("power_on", "mute_toggle", ...) for logs.
const char* to_string(Command cmd);

/// "AUTO", "INPUT_1", "INPUT_2", or nullptr for values outside the set.
const char* to_string(SourceMode mode);

/// Inverse of to_string(SourceMode). Also accepts "auto", "1", "2", "input1", "input2".
bool source_from_string(const std::string& name, SourceMode& out);

/**
 * @brief Build the set-volume frame for a level in dB.
 *
 * @param decibels  requested level; rounded to 0.5 dB, ties to even
 * @param out       receives e.g. "'@11P-03.0'" on success
 * @return Result::Ok, or Result::OutOfRange for NaN/inf. Finite values are
 *         never range-checked here (the magnitude quirk is preserved as is).
 */
Result encode_set_volume_db(float decibels, std::string& out);

/**
 * @brief Map a source mode to its select command.
 * @return Result::Ok, or Result::UnsupportedSource when @p mode is not one of
 *         the three enumerators (e.g. static_cast<SourceMode>(7)).
 */
Result command_for_source(SourceMode mode, Command& out);

/**
 * @brief Resolve a CLI verb to a fixed command (case-insensitive).
 *
 * Accepted: on, off, mute, unmute, toggle, up, down, auto, input1, input2.
 * @return false when the name is unknown; @p out is left untouched.
 */
bool name_to_command(const std::string& name, Command& out);

} // namespace fusionflex
