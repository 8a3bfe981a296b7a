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

#ifndef __GLOSSA_TEST_COMMON_HPP
#define __GLOSSA_TEST_COMMON_HPP

#include "glossa/ngram.hpp"
#include "glossa/profile.hpp"
#include "glossa/unicode.hpp"

#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <swarm/logger.hpp>

namespace ioremap { namespace glossa { namespace test {

static const char *const english =
	"The quick brown fox jumps over the lazy dog. This is a simple English sentence that we use "
	"for testing the language detector. The weather is nice today and the children are playing "
	"in the park with their friends. We think that this is the best way to learn the language. "
	"She would like to have a cup of tea with milk, but there is nothing left in the kitchen.";

static const char *const german =
	"Der schnelle braune Fuchs springt über den faulen Hund. Dies ist ein einfacher deutscher Satz, "
	"den wir zum Testen der Spracherkennung verwenden. Das Wetter ist heute schön und die Kinder "
	"spielen mit ihren Freunden im Park. Wir glauben, dass dies der beste Weg ist, die Sprache zu "
	"lernen. Sie möchte eine Tasse Tee mit Milch trinken, aber in der Küche ist nichts mehr übrig.";

static const char *const french =
	"Le renard brun rapide saute par-dessus le chien paresseux. Ceci est une phrase française simple "
	"que nous utilisons pour tester le détecteur de langue. Il fait beau aujourd'hui et les enfants "
	"jouent dans le parc avec leurs amis. Nous pensons que c'est la meilleure façon d'apprendre la "
	"langue. Elle voudrait une tasse de thé avec du lait, mais il ne reste rien dans la cuisine.";

static const char *const russian =
	"Быстрая коричневая лиса прыгает через ленивую собаку. Это простое русское предложение, которое "
	"мы используем для проверки определения языка. Сегодня хорошая погода, и дети играют в парке со "
	"своими друзьями. Мы думаем, что это лучший способ выучить язык. Она хотела бы выпить чашку чая "
	"с молоком, но на кухне ничего не осталось.";

/*
 * Builds a profile out of gram counts of @text, real profiles are generated the same way from large corpora
 */
static inline profile_record make_profile(const std::string &name, const std::string &text)
{
	ngram::normalizer norm;
	std::u32string normalized;
	norm.append(normalized, norm.normalize(text), text.size());

	ngram::evidence ev;
	ngram::extractor::feed(normalized, ev);

	profile_record profile;
	profile.name = name;

	for (auto it = ev.grams().begin(); it != ev.grams().end(); ++it) {
		profile.freq[it->first] = it->second;
		profile.n_words[unicode::length(it->first) - 1] += it->second;
	}

	return profile;
}

static inline profile_record make_counted_profile(const std::string &name,
		const std::vector<std::pair<std::string, uint64_t>> &freq, uint64_t n1, uint64_t n2, uint64_t n3)
{
	profile_record profile;
	profile.name = name;
	profile.n_words[0] = n1;
	profile.n_words[1] = n2;
	profile.n_words[2] = n3;

	for (auto it = freq.begin(); it != freq.end(); ++it)
		profile.freq[it->first] = it->second;

	return profile;
}

static inline std::string to_json(const profile_record &profile)
{
	rapidjson::StringBuffer buffer;
	rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

	writer.StartObject();

	writer.String("name");
	writer.String(profile.name.c_str(), static_cast<rapidjson::SizeType>(profile.name.size()));

	writer.String("freq");
	writer.StartObject();
	for (auto it = profile.freq.begin(); it != profile.freq.end(); ++it) {
		writer.String(it->first.c_str(), static_cast<rapidjson::SizeType>(it->first.size()));
		writer.Uint64(it->second);
	}
	writer.EndObject();

	writer.String("n_words");
	writer.StartArray();
	for (int i = 0; i < 3; ++i)
		writer.Uint64(profile.n_words[i]);
	writer.EndArray();

	writer.EndObject();

	return std::string(buffer.GetString(), buffer.GetSize());
}

static inline std::vector<profile_record> sample_profiles(void)
{
	std::vector<profile_record> ret;
	ret.push_back(make_profile("en", english));
	ret.push_back(make_profile("de", german));
	ret.push_back(make_profile("fr", french));
	ret.push_back(make_profile("ru", russian));
	return ret;
}

static inline swarm::logger null_logger(void)
{
	return swarm::logger("/dev/null", swarm::SWARM_LOG_ERROR);
}

/*
 * Temporary directory removed with all its content on destruction
 */
class temp_dir {
	public:
		temp_dir() {
			char tmpl[] = "/tmp/glossa-test-XXXXXX";
			if (!mkdtemp(tmpl))
				throw std::runtime_error("failed to create temporary directory");

			m_path = tmpl;
		}

		~temp_dir() {
			nftw(m_path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
		}

		temp_dir(const temp_dir &other) = delete;
		temp_dir &operator =(const temp_dir &other) = delete;

		const std::string &path(void) const {
			return m_path;
		}

		std::string write(const std::string &name, const std::string &content) const {
			const std::string file = m_path + "/" + name;

			std::ofstream out(file.c_str(), std::ios::binary | std::ios::trunc);
			out.write(content.data(), content.size());
			if (!out)
				throw std::runtime_error("failed to write " + file);

			return file;
		}

		std::string mkdir(const std::string &name) const {
			const std::string dir = m_path + "/" + name;
			if (::mkdir(dir.c_str(), 0755) != 0)
				throw std::runtime_error("failed to create " + dir);

			return dir;
		}

	private:
		std::string m_path;

		static int remove_entry(const char *path, const struct stat *, int, struct FTW *) {
			return ::remove(path);
		}
};

}}} // namespace ioremap::glossa::test

#endif /* __GLOSSA_TEST_COMMON_HPP */
