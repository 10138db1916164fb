// gcite/cpp/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Lower-casing for case-insensitive metadata comparison (UTF-8 decode):
// - ASCII A-Z
// - Latin-1 Supplement / Latin Extended-A upper-case letters
// - Cyrillic А-Я and Ѐ-Џ
// Invalid byte sequences are copied through unchanged.
std::string fold_case_utf8(std::string_view s);

// Same, writes into out (reuses capacity)
void fold_case_utf8_to(std::string_view s, std::string& out);

std::string_view trim_view(std::string_view s);
std::string trim_copy(std::string_view s);

// Longest prefix of s not exceeding max_bytes that ends on a UTF-8 boundary
size_t utf8_safe_prefix_len(std::string_view s, size_t max_bytes);

// FNV-1a 64-bit
uint64_t fnv1a64(std::string_view s);

// Lower-case hex, 16 chars
std::string hex64(uint64_t v);
