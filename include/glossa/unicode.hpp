/*
 * Copyright 2013+ Evgeniy Polyakov <zbr@ioremap.net>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef __GLOSSA_UNICODE_HPP
#define __GLOSSA_UNICODE_HPP

#include <locale>
#include <string>

namespace ioremap { namespace glossa { namespace unicode {

enum block {
	block_unknown = 0,
	block_basic_latin,
	block_latin_1_supplement,
	block_latin_extended_a,
	block_latin_extended_b,
	block_ipa_extensions,
	block_combining_diacritical_marks,
	block_greek,
	block_cyrillic,
	block_armenian,
	block_hebrew,
	block_arabic,
	block_devanagari,
	block_bengali,
	block_gurmukhi,
	block_gujarati,
	block_oriya,
	block_tamil,
	block_telugu,
	block_kannada,
	block_malayalam,
	block_sinhala,
	block_thai,
	block_lao,
	block_tibetan,
	block_georgian,
	block_hangul_jamo,
	block_ethiopic,
	block_khmer,
	block_mongolian,
	block_latin_extended_additional,
	block_greek_extended,
	block_general_punctuation,
	block_cjk_symbols_and_punctuation,
	block_hiragana,
	block_katakana,
	block_bopomofo,
	block_bopomofo_extended,
	block_cjk_unified_ideographs_extension_a,
	block_cjk_unified_ideographs,
	block_hangul_syllables,
	block_cjk_compatibility_ideographs,
	block_halfwidth_and_fullwidth_forms,
};

/*
 * Script classes, n-gram never spans two different classes.
 * script_none is returned for characters which inherit class of their neighbours (combining marks).
 */
enum script {
	script_none = 0,
	script_latin,
	script_greek,
	script_cyrillic,
	script_armenian,
	script_hebrew,
	script_arabic,
	script_devanagari,
	script_bengali,
	script_gurmukhi,
	script_gujarati,
	script_oriya,
	script_tamil,
	script_telugu,
	script_kannada,
	script_malayalam,
	script_sinhala,
	script_thai,
	script_lao,
	script_tibetan,
	script_georgian,
	script_ethiopic,
	script_khmer,
	script_mongolian,
	script_cjk,
	script_hangul,
	script_other,
};

block block_of(char32_t ch);
script script_of(char32_t ch);

const char *block_name(block b);

/*
 * Invalid UTF-8 sequences are skipped
 */
std::u32string decode(const std::string &text);
std::string encode(const std::u32string &text);
std::string encode(char32_t ch);

size_t length(const std::string &utf8);

/*
 * ICU backed UTF-8 locale shared by all normalizers
 */
const std::locale &locale(void);

bool is_upper(char32_t ch);

}}} // namespace ioremap::glossa::unicode

#endif /* __GLOSSA_UNICODE_HPP */
