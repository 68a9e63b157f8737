// process.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "tinyprocesslib/tinyprocess.h"

namespace proc
{
	static std::atomic<bool> cancelRequested { false };

	static void handle_signal(int sig)
	{
		cancelRequested = true;

		// a second ^C means the user really wants out, right now.
		signal(sig, SIG_DFL);
	}

	void installSignalHandlers()
	{
		signal(SIGINT, handle_signal);
		signal(SIGTERM, handle_signal);
		signal(SIGHUP, handle_signal);
	}

	void requestCancel()    { cancelRequested = true; }
	void resetCancel()      { cancelRequested = false; }
	bool isCancelled()      { return cancelRequested; }


	std::string Command::toString() const
	{
		std::string ret = util::shellQuote(this->program);
		for(const auto& a : this->args)
			ret += " " + util::shellQuote(a);

		return ret;
	}

	bool parseProgressLine(Progress& state, const std::string& line)
	{
		auto l = util::trim(line);
		auto eq = l.find('=');
		if(eq == std::string::npos)
			return false;

		auto key = util::trim(l.substr(0, eq));
		auto val = util::trim(l.substr(eq + 1));

		// note: despite the name, ffmpeg reports 'out_time_ms' in microseconds too.
		if(key == "out_time_us" || key == "out_time_ms")
		{
			char* end = nullptr;
			auto us = strtoull(val.c_str(), &end, 10);
			if(!val.empty() && end && *end == 0)
				state.outTimeNs = us * 1000;
		}
		else if(key == "speed")
		{
			state.speed = val;
		}
		else if(key == "progress")
		{
			state.finished = (val == "end");
			return true;
		}

		return false;
	}


	Result SystemRunner::run(const Command& cmd, const ProgressFn& observer)
	{
		Result ret;
		auto cmdline = cmd.toString();

		// these run on the reader threads, and only touch their own buffers.
		Progress progress;
		std::string pending;

		auto read_stdout = [&](const char* bytes, size_t n) {
			ret.out.append(bytes, n);
			if(!observer)
				return;

			pending.append(bytes, n);

			size_t ln = 0;
			while((ln = pending.find('\n')) != std::string::npos)
			{
				auto line = pending.substr(0, ln);
				pending.erase(0, ln + 1);

				if(parseProgressLine(progress, line))
					observer(progress);
			}
		};

		auto read_stderr = [&ret](const char* bytes, size_t n) {
			ret.err.append(bytes, n);
		};

		tinyproclib::Process proc(cmdline, "", read_stdout, read_stderr);
		if(proc.get_id() <= 0)
		{
			ret.status = -1;
			ret.err = zpr::sprint("failed to start '%s'", cmd.program);
			return ret;
		}

		int status = 0;
		while(!proc.try_get_exit_status(status))
		{
			if(isCancelled())
			{
				proc.kill();
				status = proc.get_exit_status();
				ret.cancelled = true;
				break;
			}

			std::this_thread::sleep_for(std::chrono::milliseconds(100));
		}

		ret.status = status;
		return ret;
	}
}
