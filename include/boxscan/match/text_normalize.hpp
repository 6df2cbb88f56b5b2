#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace boxscan::match {

/// Lowercase, fold Turkish letters to ASCII (ç->c, ğ->g, ı/İ->i, ö->o, ş->s,
/// ü->u), turn everything that is not a letter or digit into a space, and
/// collapse runs of spaces. Input is UTF-8.
[[nodiscard]] std::string normalize_text(std::string_view text);

/// Split a normalized string on spaces.
[[nodiscard]] std::vector<std::string> tokenize(std::string_view normalized);

[[nodiscard]] std::string join_tokens(const std::vector<std::string>& tokens,
                                      std::size_t first, std::size_t count);

/// Strength or packaging tokens such as "500", "500mg", "mg", "tablet".
[[nodiscard]] bool is_dosage_token(std::string_view token);

/// normalize_text() followed by removal of dosage tokens.
[[nodiscard]] std::string strip_dosage(std::string_view text);

/// Undo common OCR confusions inside tokens that contain letters:
/// 0->o, 1->l, 5->s, 8->b, 6->g, 2->z, "rn"->"m", "vv"->"w".
/// Purely numeric tokens are left alone. Expects normalized input.
[[nodiscard]] std::string fold_ocr_confusions(std::string_view normalized);

/// Consonant skeleton used for sound-alike comparison: first letter kept,
/// vowels and 'h' dropped, similar consonants merged (c/k/q, s/z, v/w, ph->f),
/// repeated letters collapsed. Expects normalized, folded input.
[[nodiscard]] std::string phonetic_key(std::string_view normalized);

}  // namespace boxscan::match
