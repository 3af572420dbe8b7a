#pragma once
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace bv {

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

// ASCII-only lowering; error text from remote services is matched byte-wise.
inline std::string AsciiLower(std::string_view text) {
  std::string lowered;
  lowered.reserve(text.size());
  for (char ch : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return lowered;
}

} // namespace bv
