#pragma once

/// @file notation.h
/// @brief Display note-naming systems (English, Solfege, German, custom).

#include <array>
#include <string>

#include "util/types.h"

namespace pitchtrack {

/// @brief Built-in naming systems.
enum class Notation {
  English,
  Solfege,
  German,
};

/// @brief A 12-entry mapping from pitch class to display name.
/// @details Detection always produces sharps-only English names; a preset only
/// changes how they are displayed.
struct NotationPreset {
  std::string id;
  std::string name;
  bool built_in = false;
  std::array<std::string, 12> names;  ///< Indexed by PitchClass

  /// @brief Display name of a pitch class.
  const std::string& translate(PitchClass pc) const { return names[static_cast<int>(pc)]; }

  /// @brief Display name for an English note name; unknown names pass through.
  std::string translate(const std::string& english_name) const;

  /// @brief True when all 12 entries hold a non-blank name.
  bool is_valid() const;
};

/// @brief Returns the preset for a built-in naming system.
const NotationPreset& builtin_preset(Notation notation);

/// @brief Creates a custom preset seeded with English names.
NotationPreset make_custom_preset(const std::string& id, const std::string& name);

/// @brief Parses "english", "solfege" or "german" (case-insensitive).
/// @throws PitchtrackException for an unknown name
Notation parse_notation(const std::string& name);

}  // namespace pitchtrack
