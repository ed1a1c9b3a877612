#include "feature/notation.h"

#include <algorithm>
#include <cctype>

#include "util/exception.h"

namespace pitchtrack {

namespace {

NotationPreset make_preset(const char* id, const char* name, bool built_in,
                           const std::array<const char*, 12>& names) {
  NotationPreset preset;
  preset.id = id;
  preset.name = name;
  preset.built_in = built_in;
  for (size_t i = 0; i < names.size(); ++i) {
    preset.names[i] = names[i];
  }
  return preset;
}

const std::array<const char*, 12> kEnglishNames = {"C",  "C#", "D",  "D#", "E",  "F",
                                                   "F#", "G",  "G#", "A",  "A#", "B"};

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::string NotationPreset::translate(const std::string& english_name) const {
  for (size_t i = 0; i < kEnglishNames.size(); ++i) {
    if (english_name == kEnglishNames[i]) {
      return names[i];
    }
  }
  return english_name;
}

bool NotationPreset::is_valid() const {
  return std::none_of(names.begin(), names.end(), is_blank);
}

const NotationPreset& builtin_preset(Notation notation) {
  static const NotationPreset english = make_preset("english", "English", true, kEnglishNames);
  static const NotationPreset solfege =
      make_preset("solfege", "Solfege", true,
                  {"Do", "Do#", "Re", "Re#", "Mi", "Fa", "Fa#", "Sol", "Sol#", "La", "La#", "Si"});
  static const NotationPreset german =
      make_preset("german", "German", true,
                  {"C", "Cis", "D", "Dis", "E", "F", "Fis", "G", "Gis", "A", "Ais", "H"});

  switch (notation) {
    case Notation::Solfege:
      return solfege;
    case Notation::German:
      return german;
    case Notation::English:
      break;
  }
  return english;
}

NotationPreset make_custom_preset(const std::string& id, const std::string& name) {
  NotationPreset preset = builtin_preset(Notation::English);
  preset.id = id;
  preset.name = name;
  preset.built_in = false;
  return preset;
}

Notation parse_notation(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "english") return Notation::English;
  if (lower == "solfege") return Notation::Solfege;
  if (lower == "german") return Notation::German;
  throw PitchtrackException(ErrorCode::InvalidParameter, "Unknown notation: " + name);
}

}  // namespace pitchtrack
