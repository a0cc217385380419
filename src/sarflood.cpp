/*
 * sarflood.cpp
 *
 *  Created on: Oct 2, 2026
 *      Author: rob
 */

#include <iostream>
#include <mutex>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cerrno>

#include <sys/stat.h>
#include <sys/types.h>

#include "sarflood.hpp"

namespace {

	int s_loglevel = SF_LOG_INFO;	///<! The current log level.
	std::mutex s_logmtx;			///<! Keeps lines from worker threads intact.

	const char* levelName(int level) {
		switch(level) {
		case SF_LOG_DEBUG: return "DEBUG";
		case SF_LOG_INFO: return "INFO";
		case SF_LOG_WARN: return "WARN";
		default: return "ERROR";
		}
	}

} // anon

void sarflood::loglevel(int level) {
	s_loglevel = level;
}

int sarflood::loglevel() {
	return s_loglevel;
}

void sarflood::log(int level, const std::string& msg) {
	std::lock_guard<std::mutex> lk(s_logmtx);
	std::cerr << "[" << levelName(level) << "] " << msg << std::endl;
}

std::string sarflood::util::lowercase(const std::string& str) {
	std::string out(str);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
	return out;
}

std::string sarflood::util::trim(const std::string& str) {
	size_t a = 0;
	size_t b = str.size();
	while(a < b && std::isspace((unsigned char) str[a]))
		++a;
	while(b > a && std::isspace((unsigned char) str[b - 1]))
		--b;
	return str.substr(a, b - a);
}

bool sarflood::util::isfile(const std::string& path) {
	struct stat st;
	return !path.empty() && stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool sarflood::util::isdir(const std::string& path) {
	struct stat st;
	return !path.empty() && stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool sarflood::util::makedir(const std::string& path) {
	if(path.empty())
		return false;
	if(isdir(path))
		return true;
	// Create the parents first.
	size_t pos = path.find_last_of('/');
	if(pos != std::string::npos && pos > 0)
		makedir(path.substr(0, pos));
	if(mkdir(path.c_str(), 0755) != 0 && errno != EEXIST)
		return false;
	return isdir(path);
}

bool sarflood::util::rem(const std::string& path) {
	return isfile(path) && std::remove(path.c_str()) == 0;
}

std::string sarflood::util::join(const std::string& dir, const std::string& name) {
	if(dir.empty())
		return name;
	if(dir[dir.size() - 1] == '/')
		return dir + name;
	return dir + "/" + name;
}
