// ffprobe.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include "picojson.h"
namespace pj = picojson;

namespace probe
{
	proc::Command probeCommand(const std::fs::path& file, Kind kind, config::ProbeFormat format)
	{
		proc::Command cmd;
		cmd.program = config::getFFprobePath();
		cmd.args = {
			"-v", "error",
			"-select_streams", kind == Kind::Audio ? "a" : "s",
			"-show_entries", "stream=index,channels,codec_name",
			"-of", format == config::ProbeFormat::Flat ? "default=noprint_wrappers=0" : "json",
			file.string()
		};

		return cmd;
	}

	bool parseJson(const std::string& text, std::vector<Stream>& out, std::string* err)
	{
		auto failed = [&err](const std::string& msg) -> bool {
			if(err) *err = msg;
			return false;
		};

		pj::value root;

		std::string e;
		pj::parse(root, text.begin(), text.end(), &e);
		if(!e.empty())
			return failed(util::trim(e));

		if(!root.is<pj::object>())
			return failed("expected a top-level object");

		// ffprobe leaves out the array entirely for some versions when nothing matched.
		auto& obj = root.get<pj::object>();
		auto it = obj.find("streams");
		if(it == obj.end())
		{
			out.clear();
			return true;
		}

		if(!it->second.is<pj::array>())
			return failed("'streams' is not an array");

		std::vector<Stream> ret;
		for(const auto& v : it->second.get<pj::array>())
		{
			if(!v.is<pj::object>())
				return failed("stream entry is not an object");

			// every entry is kept, even incomplete ones; dropping one would shift
			// the stream numbers of everything after it.
			Stream strm;
			if(auto idx = v.get("index"); idx.is<double>())
				strm.index = static_cast<int>(idx.get<double>());

			if(auto ch = v.get("channels"); ch.is<double>())
				strm.channels = static_cast<int>(ch.get<double>());

			if(auto codec = v.get("codec_name"); codec.is<std::string>())
				strm.codec = codec.get<std::string>();

			ret.push_back(strm);
		}

		out = ret;
		return true;
	}

	bool parseFlat(const std::string& text, std::vector<Stream>& out)
	{
		// handles both the [STREAM]...[/STREAM] wrapped form and the bare 'key=value' form
		// (where a new 'index' line starts the next stream). field order does not matter.
		std::vector<Stream> ret;

		std::optional<Stream> cur;
		bool sawIndex = false;

		auto flush = [&]() {
			if(cur) ret.push_back(*cur);

			cur = std::nullopt;
			sawIndex = false;
		};

		for(const auto& ln : util::splitString(text))
		{
			auto line = util::trim(ln);
			if(line.empty())
				continue;

			if(line == "[STREAM]")
			{
				flush();
				cur = Stream();
				continue;
			}
			else if(line == "[/STREAM]")
			{
				flush();
				continue;
			}
			else if(line.front() == '[')
			{
				// some other section (eg. side data). nothing we want in there.
				continue;
			}

			auto eq = line.find('=');
			if(eq == std::string::npos)
				return false;

			auto key = line.substr(0, eq);
			auto val = line.substr(eq + 1);

			if(key == "index")
			{
				if(sawIndex) flush();
				if(!cur) cur = Stream();

				if(!util::parseInt(val, &cur->index))
					return false;

				sawIndex = true;
			}
			else
			{
				if(!cur) cur = Stream();

				if(key == "channels")
				{
					// ffprobe prints 'N/A' sometimes; that's just "unknown".
					int ch = 0;
					if(util::parseInt(val, &ch))
						cur->channels = ch;
				}
				else if(key == "codec_name")
				{
					cur->codec = val == "N/A" ? "" : val;
				}
			}
		}

		flush();

		out = ret;
		return true;
	}




	static std::optional<std::vector<Stream>> try_probe(proc::Runner& runner, const std::fs::path& file, Kind kind,
		config::ProbeFormat format, bool quiet)
	{
		auto cmd = probeCommand(file, kind, format);
		auto res = runner.run(cmd, { });

		if(res.cancelled)
			return std::nullopt;

		if(res.status != 0)
		{
			if(!quiet)
			{
				util::error("ffprobe returned non-zero (status = %d)", res.status);
				if(auto e = util::trim(res.err); !e.empty())
					util::error("%s", e);
			}

			return std::nullopt;
		}

		std::vector<Stream> streams;
		if(format == config::ProbeFormat::Flat)
		{
			if(!parseFlat(res.out, streams))
			{
				if(!quiet) util::error("could not parse ffprobe output");
				return std::nullopt;
			}
		}
		else
		{
			std::string err;
			if(!parseJson(res.out, streams, &err))
			{
				if(!quiet) util::error("could not parse ffprobe json: %s", err);
				return std::nullopt;
			}
		}

		return streams;
	}

	std::optional<std::vector<Stream>> probeStreams(proc::Runner& runner, const std::fs::path& file, Kind kind)
	{
		auto format = config::getProbeFormat();
		if(format != config::ProbeFormat::Auto)
			return try_probe(runner, file, kind, format, /* quiet: */ false);

		if(auto ret = try_probe(runner, file, kind, config::ProbeFormat::Json, /* quiet: */ true); ret)
			return ret;

		if(proc::isCancelled())
			return std::nullopt;

		return try_probe(runner, file, kind, config::ProbeFormat::Flat, /* quiet: */ false);
	}
}
