// utils.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <time.h>
#include <errno.h>
#include <unistd.h>

#include <fstream>
#include <algorithm>

namespace util
{
	std::string getEnvironmentVar(const std::string& name)
	{
		if(char* val = getenv(name.c_str()); val)
			return std::string(val);

		else
			return "";
	}

	int64_t getFileSize(const std::fs::path& path)
	{
		std::error_code ec;
		auto sz = std::fs::file_size(path, ec);
		if(ec)
			return -1;

		return static_cast<int64_t>(sz);
	}

	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path)
	{
		auto bad = std::pair<uint8_t*, size_t>(nullptr, 0);

		auto sz = getFileSize(path);
		if(sz < 0) return bad;

		// i'm lazy, so just use fstreams.
		auto fs = std::ifstream(path, std::ios::binary);
		if(!fs.good()) return bad;

		uint8_t* buf = new uint8_t[sz + 1];
		fs.read(reinterpret_cast<char*>(buf), sz);
		fs.close();

		buf[sz] = 0;
		return std::pair(buf, static_cast<size_t>(sz));
	}

	std::fs::path findProgram(const std::string& name)
	{
		auto is_executable = [](const std::fs::path& p) -> bool {
			std::error_code ec;
			return std::fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
		};

		// explicit paths are taken as-is.
		if(name.find('/') != std::string::npos)
			return is_executable(name) ? std::fs::path(name) : std::fs::path();

		for(const auto& dir : splitString(getEnvironmentVar("PATH"), ':'))
		{
			if(dir.empty())
				continue;

			auto candidate = std::fs::path(dir) / name;
			if(is_executable(candidate))
				return candidate;
		}

		return { };
	}

	std::string shellQuote(const std::string& s)
	{
		if(s.empty())
			return "''";

		bool safe = true;
		for(char c : s)
		{
			if(!isalnum(static_cast<unsigned char>(c)) && !strchr("_-+=.,/:@%", c))
			{
				safe = false;
				break;
			}
		}

		if(safe)
			return s;

		std::string ret = "'";
		for(char c : s)
		{
			if(c == '\'')   ret += "'\\''";
			else            ret += c;
		}

		return ret + "'";
	}

	bool parseInt(const std::string& s, int* out)
	{
		auto str = trim(s);
		if(str.empty())
			return false;

		char* end = nullptr;
		errno = 0;

		long x = strtol(str.c_str(), &end, 10);
		if(errno != 0 || *end != 0 || x < INT32_MIN || x > INT32_MAX)
			return false;

		*out = static_cast<int>(x);
		return true;
	}

	std::string timestamp()
	{
		char buf[32] = { 0 };

		struct tm tm;
		auto now = time(nullptr);
		localtime_r(&now, &tm);

		strftime(buf, 31, "%Y-%m-%d %H:%M:%S", &tm);
		return buf;
	}

	std::string prettyPrintTime(uint64_t ns, bool ms)
	{
		auto hours = ns / (1000ULL * 1000 * 1000 * 60 * 60);
		auto mins = (ns / (1000ULL * 1000 * 1000 * 60)) % 60;
		auto secs = (ns / (1000ULL * 1000 * 1000)) % 60;
		auto mils = (ns / (1000ULL * 1000)) % 1000;

		std::string ret;
		if(hours >= 1)      ret += zpr::sprint("%dh ", hours);
		if(mins >= 1)       ret += zpr::sprint("%dm ", mins);
		if(secs >= 1)       ret += zpr::sprint("%ds ", secs);
		if(ms && mils >= 1) ret += zpr::sprint("%dms", mils);

		return ret;
	}

	std::string uglyPrintTime(uint64_t ns, bool ms)
	{
		auto hours = ns / (1000ULL * 1000 * 1000 * 60 * 60);
		auto mins = (ns / (1000ULL * 1000 * 1000 * 60)) % 60;
		auto secs = (ns / (1000ULL * 1000 * 1000)) % 60;
		auto mils = (ns / (1000ULL * 1000)) % 1000;

		if(ms)  return zpr::sprint("%02d:%02d:%02d.%03d", hours, mins, secs, mils);
		else    return zpr::sprint("%02d:%02d:%02d", hours, mins, secs);
	}

	std::string prettyPrintSize(int64_t bytes)
	{
		if(bytes < 0)
			return "?";

		constexpr const char* units[] = { "B", "KB", "MB", "GB", "TB" };

		size_t idx = 0;
		double x = static_cast<double>(bytes);
		while(x >= 1024 && idx < 4)
			idx++, x /= 1024;

		if(idx == 0)    return zpr::sprint("%d B", bytes);
		else            return zpr::sprint("%.1f %s", x, units[idx]);
	}





	// the indent is per-thread so that concurrent jobs don't trample each other's nesting;
	// the lock only keeps whole lines together.
	static thread_local int log_indent = 0;
	static std::mutex log_lock;
	static bool progress_active = false;

	void indent_log(int n)    { log_indent += n; }
	void unindent_log(int n)  { log_indent = std::max(0, log_indent - n); }
	int get_log_indent()      { return log_indent; }

	void print_log_line(FILE* stream, const char* colour, const std::string& msg)
	{
		auto pad = std::string(2 * log_indent, ' ');

		std::lock_guard<std::mutex> lk(log_lock);
		if(progress_active)
		{
			fprintf(stderr, "\x1b[2K\r");
			progress_active = false;
		}

		fprintf(stream, "%s[%s]%s %s%s*%s %s\n", COLOUR_GREY_BOLD, timestamp().c_str(), COLOUR_RESET,
			pad.c_str(), colour, COLOUR_RESET, msg.c_str());

		fflush(stream);
	}

	void print_progress_line(const std::string& msg, int indent)
	{
		auto pad = std::string(2 * std::max(0, indent), ' ');

		std::lock_guard<std::mutex> lk(log_lock);
		fprintf(stderr, "\x1b[2K\r%s[%s]%s %s%s*%s %s\r", COLOUR_GREY_BOLD, timestamp().c_str(), COLOUR_RESET,
			pad.c_str(), COLOUR_MAGENTA_BOLD, COLOUR_RESET, msg.c_str());

		fflush(stderr);
		progress_active = true;
	}

	void end_progress_line()
	{
		std::lock_guard<std::mutex> lk(log_lock);
		if(progress_active)
		{
			fprintf(stderr, "\x1b[2K\r");
			fflush(stderr);

			progress_active = false;
		}
	}
}
