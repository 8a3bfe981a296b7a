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

#include "glossa/profile.hpp"
#include "glossa/error.hpp"
#include "glossa/unicode.hpp"

#include <errno.h>
#include <math.h>
#include <string.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace ioremap { namespace glossa {

namespace {

uint64_t parse_counter(const rapidjson::Value &v, const std::string &source, const char *field)
{
	if (v.IsUint64())
		return v.GetUint64();

	// some generators dump counters as doubles, 2^64 and above does not fit the counter
	if (v.IsDouble()) {
		const double d = v.GetDouble();
		if (d >= 0 && d < 18446744073709551616.0 && d == floor(d))
			return static_cast<uint64_t>(d);
	}

	throw_error(format, "profile format error in '%s': '%s' must contain non-negative integers",
			source.c_str(), field);
}

std::string read_file(const std::string &path)
{
	std::ifstream in(path.c_str(), std::ios::binary);
	if (!in) {
		int err = errno;
		throw_error(source_unavailable, "can't open '%s': %s [%d]", path.c_str(), strerror(err), err);
	}

	std::ostringstream ss;
	ss << in.rdbuf();

	if (in.bad())
		throw_error(source_unavailable, "can't read '%s'", path.c_str());

	return ss.str();
}

}

profile_record parse_profile(const std::string &json, const std::string &source)
{
	rapidjson::Document doc;
	doc.Parse<0>(json.c_str());

	if (doc.HasParseError()) {
		throw_error(format, "profile format error in '%s': %s at offset %zu",
				source.c_str(), rapidjson::GetParseError_En(doc.GetParseError()),
				static_cast<size_t>(doc.GetErrorOffset()));
	}

	if (!doc.IsObject())
		throw_error(format, "profile format error in '%s': top level value is not an object", source.c_str());

	profile_record profile;

	if (!doc.HasMember("name") || !doc["name"].IsString())
		throw_error(format, "profile format error in '%s': field 'name' is missed or is not a string", source.c_str());

	const rapidjson::Value &name = doc["name"];
	profile.name.assign(name.GetString(), name.GetStringLength());
	if (profile.name.empty())
		throw_error(format, "profile format error in '%s': empty language name", source.c_str());

	if (!doc.HasMember("n_words") || !doc["n_words"].IsArray() || doc["n_words"].Size() != 3)
		throw_error(format, "profile format error in '%s': field 'n_words' must be an array of 3 counters",
				source.c_str());

	const rapidjson::Value &n_words = doc["n_words"];
	for (rapidjson::SizeType i = 0; i < n_words.Size(); ++i)
		profile.n_words[i] = parse_counter(n_words[i], source, "n_words");

	if (!doc.HasMember("freq") || !doc["freq"].IsObject())
		throw_error(format, "profile format error in '%s': field 'freq' is missed or is not an object", source.c_str());

	const rapidjson::Value &freq = doc["freq"];
	profile.freq.reserve(freq.MemberCount());
	for (auto it = freq.MemberBegin(); it != freq.MemberEnd(); ++it) {
		std::string gram(it->name.GetString(), it->name.GetStringLength());
		profile.freq[gram] = parse_counter(it->value, source, "freq");
	}

	return profile;
}

profile_record read_profile(const std::string &path)
{
	return parse_profile(read_file(path), path);
}

std::vector<profile_record> parse_profiles(const std::vector<std::string> &json)
{
	std::vector<profile_record> ret;
	ret.reserve(json.size());

	for (size_t i = 0; i < json.size(); ++i) {
		std::ostringstream source;
		source << "<profile #" << i << ">";

		ret.emplace_back(parse_profile(json[i], source.str()));
	}

	return ret;
}

ngram::cluster_map parse_clusters(const std::string &json, const std::string &source)
{
	rapidjson::Document doc;
	doc.Parse<0>(json.c_str());

	if (doc.HasParseError()) {
		throw_error(format, "cluster map format error in '%s': %s at offset %zu",
				source.c_str(), rapidjson::GetParseError_En(doc.GetParseError()),
				static_cast<size_t>(doc.GetErrorOffset()));
	}

	if (!doc.IsArray())
		throw_error(format, "cluster map format error in '%s': top level value is not an array", source.c_str());

	ngram::cluster_map clusters;

	for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
		const rapidjson::Value &v = doc[i];
		if (!v.IsString())
			throw_error(format, "cluster map format error in '%s': cluster %u is not a string", source.c_str(), i);

		const std::u32string cluster = unicode::decode(std::string(v.GetString(), v.GetStringLength()));
		if (cluster.empty())
			throw_error(format, "cluster map format error in '%s': cluster %u is empty", source.c_str(), i);

		for (auto ch = cluster.begin(); ch != cluster.end(); ++ch) {
			if (unicode::block_of(*ch) != unicode::block_cjk_unified_ideographs) {
				throw_error(format, "cluster map format error in '%s': cluster %u: U+%04X is not a CJK ideograph",
						source.c_str(), i, static_cast<unsigned>(*ch));
			}

			if (clusters.contains(*ch) || std::count(cluster.begin(), ch, *ch)) {
				throw_error(format, "cluster map format error in '%s': cluster %u: U+%04X belongs to several clusters",
						source.c_str(), i, static_cast<unsigned>(*ch));
			}
		}

		clusters.add(cluster);
	}

	return clusters;
}

ngram::cluster_map read_clusters(const std::string &path)
{
	return parse_clusters(read_file(path), path);
}

}} // namespace ioremap::glossa
