/*
 * sarflood.hpp
 *
 * Logging, error types and small utilities shared by the flood
 * mapping library and its tools.
 *
 *  Created on: Oct 2, 2026
 *      Author: rob
 */

#ifndef INCLUDE_SARFLOOD_HPP_
#define INCLUDE_SARFLOOD_HPP_

#include <string>
#include <sstream>
#include <stdexcept>
#include <limits>
#include <iterator>

#define SF_LOG_DEBUG 0
#define SF_LOG_INFO 1
#define SF_LOG_WARN 2
#define SF_LOG_ERROR 3
#define SF_LOG_NONE 4

// Log a message if the level is enabled. The argument is streamed,
// so it may be a chain: sf_debug("Value: " << value)
#define sf_log(lvl, x) do { \
		if(sarflood::loglevel() <= lvl) { \
			std::stringstream _sf_ss; _sf_ss << x; \
			sarflood::log(lvl, _sf_ss.str()); \
		} \
	} while(0)

#define sf_debug(x) sf_log(SF_LOG_DEBUG, x)
#define sf_info(x) sf_log(SF_LOG_INFO, x)
#define sf_warn(x) sf_log(SF_LOG_WARN, x)
#define sf_error(x) sf_log(SF_LOG_ERROR, x)

// Throw the given exception type with a streamed message.
#define sf_err(type, x) do { std::stringstream _sf_ss; _sf_ss << x; throw type(_sf_ss.str()); } while(0)
#define sf_runerr(x) sf_err(std::runtime_error, x)
#define sf_argerr(x) sf_err(std::invalid_argument, x)

namespace sarflood {

	/**
	 * \brief Set the global log level.
	 *
	 * Messages below this level are discarded.
	 *
	 * \param level One of the SF_LOG_* constants.
	 */
	void loglevel(int level);

	/**
	 * \brief Return the global log level.
	 *
	 * \return The global log level.
	 */
	int loglevel();

	/**
	 * \brief Write a message to the log at the given level.
	 *
	 * \param level One of the SF_LOG_* constants.
	 * \param msg The message.
	 */
	void log(int level, const std::string& msg);

	/**
	 * \brief Thrown when two rasters that must share a grid do not.
	 */
	class GridMismatchError : public std::runtime_error {
	public:
		explicit GridMismatchError(const std::string& msg) : std::runtime_error(msg) {}
	};

	/**
	 * \brief Thrown when there are no valid pixels to work with.
	 */
	class EmptyInputError : public std::runtime_error {
	public:
		explicit EmptyInputError(const std::string& msg) : std::runtime_error(msg) {}
	};

	/**
	 * \brief Thrown when a geometry is invalid and cannot (or may not) be repaired.
	 */
	class InvalidGeometryError : public std::runtime_error {
	public:
		explicit InvalidGeometryError(const std::string& msg) : std::runtime_error(msg) {}
	};

	/**
	 * \brief Thrown for invalid configuration values or inputs that
	 * conflict with the configuration.
	 */
	class ConfigurationError : public std::runtime_error {
	public:
		explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
	};

	template <class T>
	T maxvalue() {
		return std::numeric_limits<T>::max();
	}

	template <class T>
	T minvalue() {
		return std::numeric_limits<T>::lowest();
	}

	template <class T>
	T sq(T v) {
		return v * v;
	}

	template <class T>
	T min(T a, T b) {
		return a < b ? a : b;
	}

	template <class T>
	T max(T a, T b) {
		return a > b ? a : b;
	}

	namespace util {

		/**
		 * \brief Return a lower-case copy of the string.
		 */
		std::string lowercase(const std::string& str);

		/**
		 * \brief Return a copy of the string without leading and trailing whitespace.
		 */
		std::string trim(const std::string& str);

		/**
		 * \brief Split the string on any of the delimiter characters and write
		 * the (trimmed) parts to the iterator.
		 *
		 * \param iter An output iterator, e.g. std::back_inserter.
		 * \param str The string to split.
		 * \param delim The delimiter characters.
		 */
		template <class T>
		void split(T iter, const std::string& str, const std::string& delim = ",") {
			size_t start = 0;
			size_t pos;
			while((pos = str.find_first_of(delim, start)) != std::string::npos) {
				*iter = trim(str.substr(start, pos - start));
				++iter;
				start = pos + 1;
			}
			*iter = trim(str.substr(start));
			++iter;
		}

		/**
		 * \brief Return true if the path is an existing regular file.
		 */
		bool isfile(const std::string& path);

		/**
		 * \brief Return true if the path is an existing directory.
		 */
		bool isdir(const std::string& path);

		/**
		 * \brief Create the directory and any missing parents.
		 *
		 * \return True if the directory exists on return.
		 */
		bool makedir(const std::string& path);

		/**
		 * \brief Remove the file if it exists.
		 *
		 * \return True if the file was removed.
		 */
		bool rem(const std::string& path);

		/**
		 * \brief Join a directory and a file name.
		 */
		std::string join(const std::string& dir, const std::string& name);

	} // util

} // sarflood

#endif /* INCLUDE_SARFLOOD_HPP_ */
