#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pagewise::model {

enum class Medium : std::uint8_t {
  kPaper = 1,
  kEbook = 2,
  kAudio = 3,
};

constexpr bool IsPageBased(Medium medium) {
  return medium == Medium::kPaper || medium == Medium::kEbook;
}

constexpr std::string_view ToString(Medium medium) {
  switch (medium) {
    case Medium::kPaper:
      return "paper";
    case Medium::kEbook:
      return "ebook";
    case Medium::kAudio:
      return "audiobook";
  }
  return "unspecified";
}

constexpr std::optional<Medium> ParseMedium(std::string_view value) {
  if (value == "paper") {
    return Medium::kPaper;
  }
  if (value == "ebook") {
    return Medium::kEbook;
  }
  if (value == "audiobook" || value == "audio") {
    return Medium::kAudio;
  }
  return std::nullopt;
}

constexpr std::optional<Medium> MediumFromCode(int code) {
  switch (code) {
    case 1:
      return Medium::kPaper;
    case 2:
      return Medium::kEbook;
    case 3:
      return Medium::kAudio;
    default:
      return std::nullopt;
  }
}

} // namespace pagewise::model
