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

#include "glossa/registry.hpp"
#include "glossa/timer.hpp"

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

using namespace ioremap::glossa;

static void print_result(const std::string &name, detector &d, bool all)
{
	if (all) {
		std::vector<language> langs = d.get_probabilities();

		std::cout << name << ":";
		if (langs.empty())
			std::cout << " " << detector::unknown_language;

		for (auto it = langs.begin(); it != langs.end(); ++it)
			std::cout << " " << *it;

		std::cout << std::endl;
		return;
	}

	std::string lang = d.detect();
	std::vector<language> langs = d.get_probabilities();

	std::cout << name << ": " << lang;
	if (!langs.empty() && langs.front().name == lang)
		std::cout << " (" << langs.front().prob << ")";
	std::cout << std::endl;
}

int main(int argc, char *argv[])
{
	namespace bpo = boost::program_options;

	bpo::options_description generic("Language detector options");

	std::string config_file, profile_dir, clusters_file;
	double alpha;
	uint64_t seed;
	generic.add_options()
		("help", "This help message")
		("config", bpo::value<std::string>(&config_file), "JSON config file")
		("profile-dir", bpo::value<std::string>(&profile_dir), "Directory with language profiles, default profiles are used if not set")
		("clusters", bpo::value<std::string>(&clusters_file), "CJK cluster map the profiles of --profile-dir were generated with")
		("short", "Use default profiles for short texts")
		("alpha", bpo::value<double>(&alpha), "Smoothing parameter")
		("seed", bpo::value<uint64_t>(&seed), "Random seed, makes detection deterministic")
		("all", "Print every language above probability threshold")
		("verbose", "Log registry and detector activity to stderr")
		;

	bpo::positional_options_description p;
	p.add("files", -1);

	std::vector<std::string> files;
	bpo::options_description hidden("Hidden options");
	hidden.add_options()
		("files", bpo::value<std::vector<std::string>>(&files), "files to detect, stdin is read if none is given")
	;

	bpo::variables_map vm;

	try {
		bpo::options_description cmdline_options;
		cmdline_options.add(generic).add(hidden);

		bpo::store(bpo::command_line_parser(argc, argv).options(cmdline_options).positional(p).run(), vm);

		if (vm.count("help")) {
			std::cout << "Usage: " << argv[0] << " [options] [files]\n" << generic << std::endl;
			return 0;
		}

		bpo::notify(vm);
	} catch (const std::exception &e) {
		std::cerr << "Invalid options: " << e.what() << "\n" << generic << std::endl;
		return -1;
	}

	try {
		config cfg;
		if (config_file.size())
			cfg = config::load(config_file);

		if (vm.count("verbose")) {
			cfg.log_file = "/dev/stderr";
			cfg.log_level = ioremap::swarm::SWARM_LOG_DEBUG;
		}

		if (vm.count("alpha"))
			cfg.detector.alpha = alpha;
		if (vm.count("seed"))
			cfg.detector.seed = seed;
		if (vm.count("all"))
			cfg.detector.prob_threshold = 0;

		cfg.detector.check();

		registry_service service(cfg);
		std::shared_ptr<registry> reg;

		timer tm;

		if (profile_dir.size()) {
			reg = service.get(profile_dir);
			reg->load_directory(profile_dir);

			if (clusters_file.size())
				reg->load_clusters(clusters_file);
		} else if (vm.count("short")) {
			reg = service.default_short_text_registry();
		} else {
			reg = service.default_registry();
		}

		long long load_time = tm.restart();

		if (files.empty()) {
			detector d = reg->create();
			d.append(std::cin);
			print_result("<stdin>", d, vm.count("all") != 0);
		}

		for (auto f = files.begin(); f != files.end(); ++f) {
			std::ifstream in(f->c_str(), std::ios::binary);
			if (!in) {
				std::cerr << *f << ": can not open file" << std::endl;
				continue;
			}

			detector d = reg->create();
			d.append(in);
			print_result(*f, d, vm.count("all") != 0);
		}

		if (vm.count("verbose")) {
			std::cerr << "languages: " << reg->size() << ", load: " << load_time << " ms, detection: " <<
				tm.elapsed() << " ms" << std::endl;
		}
	} catch (const ioremap::glossa::error &e) {
		std::cerr << "Detection failed: " << error_code_name(e.code()) << ": " << e.what() << std::endl;
		return -1;
	} catch (const std::exception &e) {
		std::cerr << "Caught exception: " << e.what() << std::endl;
		return -1;
	}

	return 0;
}
