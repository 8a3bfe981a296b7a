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

#ifndef __GLOSSA_REGISTRY_HPP
#define __GLOSSA_REGISTRY_HPP

#include "glossa/config.hpp"
#include "glossa/detector.hpp"
#include "glossa/profile.hpp"
#include "glossa/table.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <swarm/logger.hpp>

namespace ioremap { namespace glossa {

/*!
 * \brief Named collection of language profiles compiled into one probability table
 *
 * Loads are serialized by the registry lock. Every load publishes a new immutable table,
 * detectors created earlier keep reading the table they were created with.
 *
 * If a load fails in the middle of a batch, profiles added before the failed one stay loaded.
 */
class registry {
	public:
		registry(const std::string &name, const swarm::logger &logger,
				const detector_options &opts = detector_options());
		registry(const registry &other) = delete;
		registry &operator =(const registry &other) = delete;

		const std::string &name(void) const {
			return m_name;
		}

		/*!
		 * Adds one profile into column \a index of a table of \a total languages.
		 * \a index must be the number of already loaded languages.
		 */
		void add_profile(const profile_record &profile, size_t index, size_t total);

		/*!
		 * Loads a batch of at least 2 profiles, columns follow \a records order
		 */
		void load_records(const std::vector<profile_record> &records);
		void load_json(const std::vector<std::string> &json);

		/*!
		 * Loads every regular non-hidden file of \a path as a profile, columns follow directory order
		 */
		void load_directory(const std::string &path);

		/*!
		 * Loads CJK cluster map the profiles were generated with, detectors created afterwards
		 * fold ideographs of their text with it. Cleared together with profiles.
		 */
		void load_clusters(const std::string &path);

		/*!
		 * Loads \a path unless registry already holds languages.
		 * Cluster map \a clusters is loaded along with profiles if that file exists.
		 * Unlike load_directory() it is all-or-nothing, registry stays empty if load fails.
		 * Returns true if profiles were loaded by this call.
		 */
		bool load_directory_if_empty(const std::string &path, const std::string &clusters = std::string());

		/*!
		 * Resets registry to zero languages
		 */
		void clear(void);

		/*!
		 * Throws not_ready_error if no languages are loaded
		 */
		detector create(void) const;
		detector create(double alpha) const;
		detector create(const detector_options &opts) const;

		/*!
		 * Options used by create() without explicit options
		 */
		void set_detector_options(const detector_options &opts);
		detector_options get_detector_options(void) const;

		/*!
		 * Shortcut for detector options seed, all detectors created afterwards are deterministic
		 */
		void set_seed(uint64_t seed);

		std::vector<std::string> languages(void) const;
		size_t size(void) const;
		bool empty(void) const;

		std::shared_ptr<const probability_table> table(void) const;

	private:
		typedef std::function<const profile_record &(size_t index, profile_record &tmp)> profile_source;

		std::string m_name;
		swarm::logger m_logger;

		mutable std::mutex m_lock;
		std::shared_ptr<const probability_table> m_table;
		detector_options m_opts;

		void load_batch(size_t count, const profile_source &source, const std::string &origin);
		void load_directory_locked(const std::string &path);
		void load_clusters_locked(const std::string &path);
};

/*!
 * \brief Registry of registries
 *
 * Owns named registries, access to the name map is serialized by the service lock.
 * Names DEFAULT and SHORT are reserved for registries loaded from the configured
 * default profile directories on the first request.
 */
class registry_service {
	public:
		static const char *const default_name;
		static const char *const short_text_name;

		registry_service();
		explicit registry_service(const config &cfg);
		registry_service(const config &cfg, const swarm::logger &logger);
		registry_service(const registry_service &other) = delete;
		registry_service &operator =(const registry_service &other) = delete;

		/*!
		 * Returns existing registry or creates an empty one.
		 * Throws reserved_name_error for DEFAULT and SHORT names.
		 */
		std::shared_ptr<registry> get(const std::string &name);

		std::shared_ptr<registry> default_registry(void);
		std::shared_ptr<registry> default_short_text_registry(void);

		/*!
		 * Forgets registry, holders of its shared pointer keep using it
		 */
		bool remove(const std::string &name);
		void clear(void);

		std::vector<std::string> names(void) const;

		const config &configuration(void) const {
			return m_config;
		}

		const swarm::logger &logger(void) const {
			return m_logger;
		}

	private:
		config m_config;
		swarm::logger m_logger;

		mutable std::mutex m_lock;
		std::map<std::string, std::shared_ptr<registry>> m_registries;

		std::shared_ptr<registry> get_internal(const std::string &name);
		std::shared_ptr<registry> get_default(const std::string &name, const std::string &path,
				const std::string &clusters);
};

}} // namespace ioremap::glossa

#endif /* __GLOSSA_REGISTRY_HPP */
