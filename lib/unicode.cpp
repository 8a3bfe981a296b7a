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

#include "glossa/unicode.hpp"

#include <algorithm>

#include <boost/locale.hpp>

namespace ioremap { namespace glossa { namespace unicode {

namespace {

struct block_range {
	char32_t	first;
	char32_t	last;
	block		id;
	const char	*name;
};

// sorted by code point
const block_range block_ranges[] = {
	{ 0x0000, 0x007F, block_basic_latin, "Basic Latin" },
	{ 0x0080, 0x00FF, block_latin_1_supplement, "Latin-1 Supplement" },
	{ 0x0100, 0x017F, block_latin_extended_a, "Latin Extended-A" },
	{ 0x0180, 0x024F, block_latin_extended_b, "Latin Extended-B" },
	{ 0x0250, 0x02AF, block_ipa_extensions, "IPA Extensions" },
	{ 0x0300, 0x036F, block_combining_diacritical_marks, "Combining Diacritical Marks" },
	{ 0x0370, 0x03FF, block_greek, "Greek and Coptic" },
	{ 0x0400, 0x052F, block_cyrillic, "Cyrillic" },
	{ 0x0530, 0x058F, block_armenian, "Armenian" },
	{ 0x0590, 0x05FF, block_hebrew, "Hebrew" },
	{ 0x0600, 0x06FF, block_arabic, "Arabic" },
	{ 0x0900, 0x097F, block_devanagari, "Devanagari" },
	{ 0x0980, 0x09FF, block_bengali, "Bengali" },
	{ 0x0A00, 0x0A7F, block_gurmukhi, "Gurmukhi" },
	{ 0x0A80, 0x0AFF, block_gujarati, "Gujarati" },
	{ 0x0B00, 0x0B7F, block_oriya, "Oriya" },
	{ 0x0B80, 0x0BFF, block_tamil, "Tamil" },
	{ 0x0C00, 0x0C7F, block_telugu, "Telugu" },
	{ 0x0C80, 0x0CFF, block_kannada, "Kannada" },
	{ 0x0D00, 0x0D7F, block_malayalam, "Malayalam" },
	{ 0x0D80, 0x0DFF, block_sinhala, "Sinhala" },
	{ 0x0E00, 0x0E7F, block_thai, "Thai" },
	{ 0x0E80, 0x0EFF, block_lao, "Lao" },
	{ 0x0F00, 0x0FFF, block_tibetan, "Tibetan" },
	{ 0x10A0, 0x10FF, block_georgian, "Georgian" },
	{ 0x1100, 0x11FF, block_hangul_jamo, "Hangul Jamo" },
	{ 0x1200, 0x137F, block_ethiopic, "Ethiopic" },
	{ 0x1780, 0x17FF, block_khmer, "Khmer" },
	{ 0x1800, 0x18AF, block_mongolian, "Mongolian" },
	{ 0x1E00, 0x1EFF, block_latin_extended_additional, "Latin Extended Additional" },
	{ 0x1F00, 0x1FFF, block_greek_extended, "Greek Extended" },
	{ 0x2000, 0x206F, block_general_punctuation, "General Punctuation" },
	{ 0x3000, 0x303F, block_cjk_symbols_and_punctuation, "CJK Symbols and Punctuation" },
	{ 0x3040, 0x309F, block_hiragana, "Hiragana" },
	{ 0x30A0, 0x30FF, block_katakana, "Katakana" },
	{ 0x3100, 0x312F, block_bopomofo, "Bopomofo" },
	{ 0x31A0, 0x31BF, block_bopomofo_extended, "Bopomofo Extended" },
	{ 0x3400, 0x4DBF, block_cjk_unified_ideographs_extension_a, "CJK Unified Ideographs Extension A" },
	{ 0x4E00, 0x9FFF, block_cjk_unified_ideographs, "CJK Unified Ideographs" },
	{ 0xAC00, 0xD7AF, block_hangul_syllables, "Hangul Syllables" },
	{ 0xF900, 0xFAFF, block_cjk_compatibility_ideographs, "CJK Compatibility Ideographs" },
	{ 0xFF00, 0xFFEF, block_halfwidth_and_fullwidth_forms, "Halfwidth and Fullwidth Forms" },
};

const size_t block_ranges_size = sizeof(block_ranges) / sizeof(block_ranges[0]);

const block_range *find_range(char32_t ch)
{
	const block_range *end = block_ranges + block_ranges_size;
	const block_range *it = std::upper_bound(block_ranges, end, ch,
			[] (char32_t c, const block_range &r) { return c < r.first; });

	if (it == block_ranges)
		return NULL;

	--it;
	if (ch > it->last)
		return NULL;

	return it;
}

}

block block_of(char32_t ch)
{
	const block_range *r = find_range(ch);
	if (!r)
		return block_unknown;

	return r->id;
}

const char *block_name(block b)
{
	for (size_t i = 0; i < block_ranges_size; ++i) {
		if (block_ranges[i].id == b)
			return block_ranges[i].name;
	}

	return "Unknown";
}

script script_of(char32_t ch)
{
	switch (block_of(ch)) {
	case block_basic_latin:
	case block_latin_1_supplement:
	case block_latin_extended_a:
	case block_latin_extended_b:
	case block_ipa_extensions:
	case block_latin_extended_additional:
		return script_latin;
	case block_combining_diacritical_marks:
		return script_none;
	case block_greek:
	case block_greek_extended:
		return script_greek;
	case block_cyrillic:
		return script_cyrillic;
	case block_armenian:
		return script_armenian;
	case block_hebrew:
		return script_hebrew;
	case block_arabic:
		return script_arabic;
	case block_devanagari:
		return script_devanagari;
	case block_bengali:
		return script_bengali;
	case block_gurmukhi:
		return script_gurmukhi;
	case block_gujarati:
		return script_gujarati;
	case block_oriya:
		return script_oriya;
	case block_tamil:
		return script_tamil;
	case block_telugu:
		return script_telugu;
	case block_kannada:
		return script_kannada;
	case block_malayalam:
		return script_malayalam;
	case block_sinhala:
		return script_sinhala;
	case block_thai:
		return script_thai;
	case block_lao:
		return script_lao;
	case block_tibetan:
		return script_tibetan;
	case block_georgian:
		return script_georgian;
	case block_ethiopic:
		return script_ethiopic;
	case block_khmer:
		return script_khmer;
	case block_mongolian:
		return script_mongolian;
	case block_cjk_symbols_and_punctuation:
	case block_hiragana:
	case block_katakana:
	case block_bopomofo:
	case block_bopomofo_extended:
	case block_cjk_unified_ideographs_extension_a:
	case block_cjk_unified_ideographs:
	case block_cjk_compatibility_ideographs:
	case block_halfwidth_and_fullwidth_forms:
		return script_cjk;
	case block_hangul_jamo:
	case block_hangul_syllables:
		return script_hangul;
	case block_general_punctuation:
	case block_unknown:
		break;
	}

	return script_other;
}

std::u32string decode(const std::string &text)
{
	return boost::locale::conv::utf_to_utf<char32_t>(text);
}

std::string encode(const std::u32string &text)
{
	return boost::locale::conv::utf_to_utf<char>(text);
}

std::string encode(char32_t ch)
{
	return encode(std::u32string(1, ch));
}

size_t length(const std::string &utf8)
{
	size_t len = 0;

	for (size_t i = 0; i < utf8.size(); ++i) {
		// count every byte which is not a continuation byte
		if ((static_cast<unsigned char>(utf8[i]) & 0xC0) != 0x80)
			++len;
	}

	return len;
}

const std::locale &locale(void)
{
	static boost::locale::generator gen;
	static const std::locale loc = gen("en_US.UTF-8");

	return loc;
}

bool is_upper(char32_t ch)
{
	if (ch < 0x80)
		return ch >= 'A' && ch <= 'Z';

	const std::string s = encode(ch);
	return boost::locale::to_lower(s, locale()) != s;
}

}}} // namespace ioremap::glossa::unicode
