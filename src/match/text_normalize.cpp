#include <boxscan/match/text_normalize.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace boxscan::match {

namespace {

struct Fold {
  std::string_view utf8;
  char ascii;
};

// Two-byte UTF-8 sequences of the Turkish alphabet plus common accents.
constexpr std::array<Fold, 18> kFolds{{
    {"\xC3\xA7", 'c'}, {"\xC3\x87", 'c'},  // ç Ç
    {"\xC4\x9F", 'g'}, {"\xC4\x9E", 'g'},  // ğ Ğ
    {"\xC4\xB1", 'i'}, {"\xC4\xB0", 'i'},  // ı İ
    {"\xC3\xB6", 'o'}, {"\xC3\x96", 'o'},  // ö Ö
    {"\xC5\x9F", 's'}, {"\xC5\x9E", 's'},  // ş Ş
    {"\xC3\xBC", 'u'}, {"\xC3\x9C", 'u'},  // ü Ü
    {"\xC3\xA2", 'a'}, {"\xC3\x82", 'a'},  // â Â
    {"\xC3\xAE", 'i'}, {"\xC3\xA9", 'e'},  // î é
    {"\xC3\xBB", 'u'}, {"\xC3\xA8", 'e'},  // û è
}};

bool is_ascii_alnum(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool has_letter(std::string_view token) {
  return std::any_of(token.begin(), token.end(), [](char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
  });
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

char consonant_class(char c) {
  switch (c) {
    case 'k':
    case 'q':
    case 'c':
      return 'k';
    case 'z':
      return 's';
    case 'w':
      return 'v';
    default:
      return c;
  }
}

bool is_vowel(char c) {
  return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u' || c == 'y';
}

}  // namespace

std::string normalize_text(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;

  auto emit = [&](char c) {
    if (pending_space && !out.empty()) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  };

  for (std::size_t i = 0; i < text.size();) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) {
      if (is_ascii_alnum(static_cast<char>(c))) {
        emit(static_cast<char>(std::tolower(c)));
      } else {
        pending_space = true;
      }
      ++i;
      continue;
    }

    bool folded = false;
    for (const auto& f : kFolds) {
      if (text.substr(i, f.utf8.size()) == f.utf8) {
        emit(f.ascii);
        i += f.utf8.size();
        folded = true;
        break;
      }
    }
    if (folded) continue;

    // Unknown multi-byte character: treat as a separator.
    std::size_t len = 1;
    if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;
    pending_space = true;
    i += len;
  }
  return out;
}

std::vector<std::string> tokenize(std::string_view normalized) {
  std::vector<std::string> tokens;
  std::size_t pos = 0;
  while (pos < normalized.size()) {
    const std::size_t start = normalized.find_first_not_of(' ', pos);
    if (start == std::string_view::npos) break;
    const std::size_t end = normalized.find(' ', start);
    tokens.emplace_back(normalized.substr(
        start, end == std::string_view::npos ? std::string_view::npos : end - start));
    pos = end == std::string_view::npos ? normalized.size() : end;
  }
  return tokens;
}

std::string join_tokens(const std::vector<std::string>& tokens,
                        std::size_t first, std::size_t count) {
  std::string out;
  const std::size_t last = std::min(tokens.size(), first + count);
  for (std::size_t i = first; i < last; ++i) {
    if (!out.empty()) out.push_back(' ');
    out += tokens[i];
  }
  return out;
}

bool is_dosage_token(std::string_view token) {
  static constexpr std::array<std::string_view, 20> kUnits{
      "mg", "g", "mcg", "ug", "ml", "l", "iu", "ie", "tablet", "tablets", "tab",
      "tb", "film", "kapsul", "capsule", "capsules", "caps", "draje", "x", "doz"};
  if (token.empty()) return false;

  std::size_t digits = 0;
  while (digits < token.size() &&
         std::isdigit(static_cast<unsigned char>(token[digits])) != 0) {
    ++digits;
  }
  const std::string_view rest = token.substr(digits);
  if (rest.empty()) return digits > 0;
  return std::find(kUnits.begin(), kUnits.end(), rest) != kUnits.end();
}

std::string strip_dosage(std::string_view text) {
  const auto tokens = tokenize(normalize_text(text));
  std::string out;
  for (const auto& t : tokens) {
    if (is_dosage_token(t)) continue;
    if (!out.empty()) out.push_back(' ');
    out += t;
  }
  return out;
}

std::string fold_ocr_confusions(std::string_view normalized) {
  auto tokens = tokenize(normalized);
  for (auto& t : tokens) {
    if (!has_letter(t)) continue;
    for (auto& c : t) {
      switch (c) {
        case '0': c = 'o'; break;
        case '1': c = 'l'; break;
        case '5': c = 's'; break;
        case '8': c = 'b'; break;
        case '6': c = 'g'; break;
        case '2': c = 'z'; break;
        default: break;
      }
    }
    replace_all(t, "rn", "m");
    replace_all(t, "vv", "w");
  }
  return join_tokens(tokens, 0, tokens.size());
}

std::string phonetic_key(std::string_view normalized) {
  std::string key;
  char prev = '\0';
  bool first = true;
  for (std::size_t i = 0; i < normalized.size(); ++i) {
    char c = normalized[i];
    if (c == ' ') {
      first = true;
      prev = '\0';
      continue;
    }
    if (c == 'p' && i + 1 < normalized.size() && normalized[i + 1] == 'h') {
      c = 'f';
      ++i;
    }
    if (first) {
      first = false;
      const char k = is_vowel(c) ? c : consonant_class(c);
      key.push_back(k);
      prev = k;
      continue;
    }
    if (is_vowel(c) || c == 'h') {
      continue;
    }
    const char k = consonant_class(c);
    if (k == prev) continue;
    key.push_back(k);
    prev = k;
  }
  return key;
}

}  // namespace boxscan::match
