#include "names.hpp"

#include <cctype>

namespace gaitrank::util {

std::string NormalizeName(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());

  bool pending_space = false;
  for (char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
  }
  return out;
}

std::string ToLower(std::string_view raw) {
  std::string out(raw);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace gaitrank::util
