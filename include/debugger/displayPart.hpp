#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace snap {

// One classified run of text in a variable's display signature, e.g.
// {Keyword "var"} {Space " "} {Local "count"}
struct DisplayPart {
  std::string tag;
  std::string text;

  bool operator==(const DisplayPart &other) const {
    return tag == other.tag && text == other.text;
  }
};

namespace DisplayTag {
inline constexpr const char *Keyword = "Keyword";
inline constexpr const char *Class = "Class";
inline constexpr const char *Enum = "Enum";
inline constexpr const char *Space = "Space";
inline constexpr const char *Local = "Local";
inline constexpr const char *Parameter = "Parameter";
inline constexpr const char *Punctuation = "Punctuation";
} // namespace DisplayTag

inline void to_json(nlohmann::json &j, const DisplayPart &part) {
  j = nlohmann::json{{"Tag", part.tag}, {"Text", part.text}};
}

inline void from_json(const nlohmann::json &j, DisplayPart &part) {
  j.at("Tag").get_to(part.tag);
  j.at("Text").get_to(part.text);
}

inline std::string displayText(const std::vector<DisplayPart> &parts) {
  std::string text;
  for (const auto &part : parts) {
    text += part.text;
  }
  return text;
}

} // namespace snap
