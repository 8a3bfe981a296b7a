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
#include "glossa/dir.hpp"
#include "glossa/error.hpp"

#include <sys/stat.h>

#include <sstream>

namespace ioremap { namespace glossa {

registry::registry(const std::string &name, const swarm::logger &logger, const detector_options &opts) :
	m_name(name),
	m_logger(logger),
	m_table(std::make_shared<probability_table>()),
	m_opts(opts)
{
}

void registry::add_profile(const profile_record &profile, size_t index, size_t total)
{
	std::lock_guard<std::mutex> guard(m_lock);

	std::shared_ptr<probability_table> table = std::make_shared<probability_table>(*m_table);
	table->add_profile(profile, index, total);
	m_table = table;
}

void registry::load_batch(size_t count, const profile_source &source, const std::string &origin)
{
	if (count < 2) {
		throw_error(insufficient_profiles, "registry '%s': need at least 2 profiles, %zu found in '%s'",
				m_name.c_str(), count, origin.c_str());
	}

	std::shared_ptr<probability_table> table = std::make_shared<probability_table>(*m_table);
	const size_t base = table->languages().size();
	profile_record tmp;

	try {
		for (size_t i = 0; i < count; ++i)
			table->add_profile(source(i, tmp), base + i, base + count);
	} catch (const std::exception &e) {
		// profiles loaded before the failed one stay in the registry
		table->trim();
		m_table = table;

		m_logger.log(swarm::SWARM_LOG_ERROR, "registry: %s: failed to load profiles from '%s': %s, languages: %zu",
				m_name.c_str(), origin.c_str(), e.what(), table->languages().size());
		throw;
	}

	m_table = table;

	m_logger.log(swarm::SWARM_LOG_INFO, "registry: %s: loaded %zu profiles from '%s', languages: %zu, grams: %zu",
			m_name.c_str(), count, origin.c_str(), table->languages().size(), table->size());
}

void registry::load_records(const std::vector<profile_record> &records)
{
	std::lock_guard<std::mutex> guard(m_lock);

	load_batch(records.size(), [&records] (size_t index, profile_record &) -> const profile_record & {
		return records[index];
	}, "<records>");
}

void registry::load_json(const std::vector<std::string> &json)
{
	std::lock_guard<std::mutex> guard(m_lock);

	load_batch(json.size(), [&json] (size_t index, profile_record &tmp) -> const profile_record & {
		std::ostringstream source;
		source << "<profile #" << index << ">";

		tmp = parse_profile(json[index], source.str());
		return tmp;
	}, "<json>");
}

void registry::load_directory_locked(const std::string &path)
{
	std::vector<std::string> files;
	iterate_directory(path, [&files] (const char *file, const char *) -> bool {
		files.push_back(file);
		return true;
	});

	load_batch(files.size(), [&files] (size_t index, profile_record &tmp) -> const profile_record & {
		tmp = read_profile(files[index]);
		return tmp;
	}, path);
}

void registry::load_directory(const std::string &path)
{
	std::lock_guard<std::mutex> guard(m_lock);
	load_directory_locked(path);
}

void registry::load_clusters_locked(const std::string &path)
{
	std::shared_ptr<const ngram::cluster_map> clusters = std::make_shared<ngram::cluster_map>(read_clusters(path));

	std::shared_ptr<probability_table> table = std::make_shared<probability_table>(*m_table);
	table->set_clusters(clusters);
	m_table = table;

	m_logger.log(swarm::SWARM_LOG_INFO, "registry: %s: loaded cluster map from '%s', ideographs: %zu",
			m_name.c_str(), path.c_str(), clusters->size());
}

void registry::load_clusters(const std::string &path)
{
	std::lock_guard<std::mutex> guard(m_lock);

	try {
		load_clusters_locked(path);
	} catch (const std::exception &e) {
		m_logger.log(swarm::SWARM_LOG_ERROR, "registry: %s: failed to load cluster map from '%s': %s",
				m_name.c_str(), path.c_str(), e.what());
		throw;
	}
}

bool registry::load_directory_if_empty(const std::string &path, const std::string &clusters)
{
	std::lock_guard<std::mutex> guard(m_lock);

	if (!m_table->empty())
		return false;

	try {
		load_directory_locked(path);

		if (!clusters.empty()) {
			struct stat st;
			if (stat(clusters.c_str(), &st) == 0) {
				load_clusters_locked(clusters);
			} else {
				m_logger.log(swarm::SWARM_LOG_NOTICE, "registry: %s: there is no cluster map '%s', "
						"ideographs are not folded", m_name.c_str(), clusters.c_str());
			}
		}
	} catch (const std::exception &) {
		m_table = std::make_shared<probability_table>();
		throw;
	}

	return true;
}

void registry::clear(void)
{
	std::lock_guard<std::mutex> guard(m_lock);
	m_table = std::make_shared<probability_table>();
}

detector registry::create(const detector_options &opts) const
{
	std::shared_ptr<const probability_table> table = this->table();
	if (table->empty())
		throw_error(not_ready, "registry '%s': need to load profiles", m_name.c_str());

	return detector(table, opts, m_logger);
}

detector registry::create(void) const
{
	return create(get_detector_options());
}

detector registry::create(double alpha) const
{
	detector_options opts = get_detector_options();
	opts.alpha = alpha;

	return create(opts);
}

void registry::set_detector_options(const detector_options &opts)
{
	opts.check();

	std::lock_guard<std::mutex> guard(m_lock);
	m_opts = opts;
}

detector_options registry::get_detector_options(void) const
{
	std::lock_guard<std::mutex> guard(m_lock);
	return m_opts;
}

void registry::set_seed(uint64_t seed)
{
	std::lock_guard<std::mutex> guard(m_lock);
	m_opts.seed = seed;
}

std::vector<std::string> registry::languages(void) const
{
	return table()->languages();
}

size_t registry::size(void) const
{
	return table()->languages().size();
}

bool registry::empty(void) const
{
	return table()->empty();
}

std::shared_ptr<const probability_table> registry::table(void) const
{
	std::lock_guard<std::mutex> guard(m_lock);
	return m_table;
}

const char *const registry_service::default_name = "DEFAULT";
const char *const registry_service::short_text_name = "SHORT";

registry_service::registry_service() : registry_service(config())
{
}

registry_service::registry_service(const config &cfg) :
	m_config(cfg),
	m_logger(cfg.log_file.c_str(), cfg.log_level)
{
}

registry_service::registry_service(const config &cfg, const swarm::logger &logger) :
	m_config(cfg),
	m_logger(logger)
{
}

std::shared_ptr<registry> registry_service::get(const std::string &name)
{
	if (name == default_name || name == short_text_name)
		throw_error(reserved_name, "registry name '%s' is reserved", name.c_str());

	return get_internal(name);
}

std::shared_ptr<registry> registry_service::get_internal(const std::string &name)
{
	std::lock_guard<std::mutex> guard(m_lock);

	auto it = m_registries.find(name);
	if (it != m_registries.end())
		return it->second;

	std::shared_ptr<registry> reg = std::make_shared<registry>(name, m_logger, m_config.detector);
	m_registries.insert(std::make_pair(name, reg));
	return reg;
}

std::shared_ptr<registry> registry_service::get_default(const std::string &name, const std::string &path,
		const std::string &clusters)
{
	std::shared_ptr<registry> reg = get_internal(name);

	// registry lock makes concurrent first requests wait for a single load
	if (reg->load_directory_if_empty(path, clusters)) {
		m_logger.log(swarm::SWARM_LOG_NOTICE, "registry: %s: default profiles loaded from '%s'",
				name.c_str(), path.c_str());
	}

	return reg;
}

std::shared_ptr<registry> registry_service::default_registry(void)
{
	return get_default(default_name, m_config.profiles, m_config.cjk_clusters);
}

std::shared_ptr<registry> registry_service::default_short_text_registry(void)
{
	return get_default(short_text_name, m_config.short_profiles, m_config.cjk_clusters);
}

bool registry_service::remove(const std::string &name)
{
	std::lock_guard<std::mutex> guard(m_lock);
	return m_registries.erase(name) != 0;
}

void registry_service::clear(void)
{
	std::lock_guard<std::mutex> guard(m_lock);
	m_registries.clear();
}

std::vector<std::string> registry_service::names(void) const
{
	std::vector<std::string> ret;

	std::lock_guard<std::mutex> guard(m_lock);
	for (auto it = m_registries.begin(); it != m_registries.end(); ++it)
		ret.push_back(it->first);

	return ret;
}

}} // namespace ioremap::glossa
