// config.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <algorithm>

#include "picojson.h"

namespace pj = picojson;

namespace config
{
	static std::fs::path getDefaultConfigPath()
	{
		auto home = std::fs::path(util::getEnvironmentVar("HOME"));
		if(!home.empty())
		{
			auto x = home / ".config" / "surroundinator" / "config.json";
			if(std::fs::exists(x))
				return x;
		}

		if(std::fs::exists("surroundinator-config.json"))
			return std::fs::path("surroundinator-config.json");

		if(std::fs::exists(".surroundinator-config.json"))
			return std::fs::path(".surroundinator-config.json");

		return "";
	}

	template <typename... Args>
	void error(const std::string& fmt, Args&&... args)
	{
		util::error(fmt, args...);
	}

	void readConfig()
	{
		// if there's a manual one, use that.
		std::fs::path path;
		if(auto cp = getConfigPath(); !cp.empty())
		{
			path = cp;
			if(!std::fs::exists(path))
			{
				util::error("specified configuration file '%s' does not exist", cp);
				return;
			}
		}
		else
		{
			path = getDefaultConfigPath();
		}

		// it's ok not to have one.
		if(path.empty())
			return;

		uint8_t* buf = 0; size_t sz = 0;
		std::tie(buf, sz) = util::readEntireFile(path.string());
		if(!buf || sz == 0)
		{
			delete[] buf;
			error("failed to read config file '%s'", path.string());
			return;
		}

		defer(delete[] buf);

		pj::value config;

		auto begin = buf;
		auto end = buf + sz;
		std::string err;
		pj::parse(config, begin, end, &err);
		if(!err.empty())
		{
			error("%s", err);
			return;
		}

		// the top-level object should be "options".
		if(!config.is<pj::object>() || !config.contains("options") || !config.get("options").is<pj::object>())
		{
			error("no top-level 'options' object");
			return;
		}

		auto opts = config.get("options").get<pj::object>();

		auto get_string = [&opts](const std::string& key, const std::string& def) -> std::string {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<std::string>())
					return it->second.get<std::string>();

				else
					error("expected string value for '%s'", key);
			}

			return def;
		};

		auto get_array = [&opts](const std::string& key) -> std::vector<pj::value> {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<pj::array>())
					return it->second.get<pj::array>();

				else
					error("expected array value for '%s'", key);
			}

			return { };
		};

		auto get_bool = [&opts](const std::string& key, bool def) -> bool {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<bool>())
					return it->second.get<bool>();

				else
					error("expected boolean value for '%s'", key);
			}

			return def;
		};

		auto get_int = [&opts](const std::string& key, int def) -> int {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<double>())
					return static_cast<int>(it->second.get<double>());

				else
					error("expected integer value for '%s'", key);
			}

			return def;
		};

		if(auto x = get_string("root-folder", ""); !x.empty())
			setRootFolder(x);

		if(auto x = get_string("output-folder", ""); !x.empty())
			setOutputFolder(x);

		if(auto x = get_string("scratch-folder", ""); !x.empty())
			setScratchFolder(x);

		if(auto x = get_string("ffmpeg-path", ""); !x.empty())
			setFFmpegPath(x);

		if(auto x = get_string("ffprobe-path", ""); !x.empty())
			setFFprobePath(x);

		if(auto x = get_string("stereo-bitrate", ""); !x.empty())
			setStereoBitrate(x);

		if(auto x = get_string("policy", ""); !x.empty())
		{
			Policy p;
			if(parsePolicy(x, &p))  setPolicy(p);
			else                    error("invalid policy '%s' (expected 'surround-only' or 'complete')", x);
		}

		if(auto x = get_string("probe-format", ""); !x.empty())
		{
			ProbeFormat f;
			if(parseProbeFormat(x, &f)) setProbeFormat(f);
			else                        error("invalid probe format '%s' (expected 'auto', 'json' or 'flat')", x);
		}

		if(auto x = get_array("extensions"); !x.empty())
		{
			std::vector<std::string> exts;
			for(const auto& v : x)
			{
				if(v.is<std::string>() && !v.get<std::string>().empty())
					exts.push_back(v.get<std::string>());

				else
					error("expected non-empty string value in 'extensions'");
			}

			if(!exts.empty())
				setExtensions(exts);
		}

		if(int jobs = get_int("jobs", 1); jobs >= 1)
			setJobCount(static_cast<size_t>(jobs));

		else
			error("'jobs' must be at least 1");

		// these are the default values without a config file.
		setDisableProgress(!get_bool("show-progress", true));
		setShouldStopOnError(get_bool("stop-on-first-error", false));
		setShouldVerifyStreams(get_bool("verify-streams", true));
	}


	bool parsePolicy(const std::string& s, Policy* out)
	{
		auto x = util::lowercase(s);
		if(x == "surround-only")    { *out = Policy::SurroundOnly; return true; }
		else if(x == "complete")    { *out = Policy::Complete; return true; }

		return false;
	}

	bool parseProbeFormat(const std::string& s, ProbeFormat* out)
	{
		auto x = util::lowercase(s);
		if(x == "auto")         { *out = ProbeFormat::Auto; return true; }
		else if(x == "json")    { *out = ProbeFormat::Json; return true; }
		else if(x == "flat")    { *out = ProbeFormat::Flat; return true; }

		return false;
	}

	std::string policyName(Policy p)
	{
		switch(p)
		{
			case Policy::SurroundOnly:  return "surround-only";
			case Policy::Complete:      return "complete";
		}

		return "?";
	}





	static std::string rootFolder = "/mnt/media/video";
	static std::string outputFolder;
	static std::string scratchFolder;
	static std::string configPath;
	static std::string ffmpegPath = "ffmpeg";
	static std::string ffprobePath = "ffprobe";
	static std::string stereoBitrate = "192k";

	static std::vector<std::string> extensions = {
		"mp4", "mkv", "avi", "mov", "m4v", "flv", "wmv", "webm", "mpg", "mpeg"
	};

	static Policy policy = Policy::SurroundOnly;
	static ProbeFormat probeFormat = ProbeFormat::Auto;
	static size_t jobCount = 1;

	static bool dryrun = false;
	static bool noprogress = false;
	static bool stopOnError = false;
	static bool verifyStreams = true;


	std::string getRootFolder()                 { return rootFolder; }
	std::string getOutputFolder()               { return outputFolder; }
	std::string getConfigPath()                 { return configPath; }
	std::string getFFmpegPath()                 { return ffmpegPath; }
	std::string getFFprobePath()                { return ffprobePath; }
	std::string getStereoBitrate()              { return stereoBitrate; }
	std::vector<std::string> getExtensions()    { return extensions; }
	Policy getPolicy()                          { return policy; }
	ProbeFormat getProbeFormat()                { return probeFormat; }
	size_t getJobCount()                        { return jobCount; }
	bool isDryRun()                             { return dryrun; }
	bool disableProgress()                      { return noprogress; }
	bool shouldStopOnError()                    { return stopOnError; }
	bool shouldVerifyStreams()                  { return verifyStreams; }

	std::string getScratchFolder()
	{
		if(!scratchFolder.empty())
			return scratchFolder;

		std::error_code ec;
		auto tmp = std::fs::temp_directory_path(ec);
		return ec ? "/tmp" : tmp.string();
	}

	void setRootFolder(const std::string& x)                { rootFolder = x; }
	void setOutputFolder(const std::string& x)              { outputFolder = x; }
	void setScratchFolder(const std::string& x)             { scratchFolder = x; }
	void setFFmpegPath(const std::string& x)                { ffmpegPath = x; }
	void setFFprobePath(const std::string& x)               { ffprobePath = x; }
	void setStereoBitrate(const std::string& x)             { stereoBitrate = x; }
	void setExtensions(const std::vector<std::string>& xs)  { extensions = xs; }
	void setPolicy(Policy x)                                { policy = x; }
	void setProbeFormat(ProbeFormat x)                      { probeFormat = x; }
	void setJobCount(size_t x)                              { jobCount = std::max(size_t(1), x); }
	void setIsDryRun(bool x)                                { dryrun = x; }
	void setDisableProgress(bool x)                         { noprogress = x; }
	void setShouldStopOnError(bool x)                       { stopOnError = x; }
	void setShouldVerifyStreams(bool x)                     { verifyStreams = x; }

	void setConfigPath(const std::string& x)
	{
		// this one is special. once we set it, we wanna re-read the config.
		configPath = x;
		readConfig();
	}
}
