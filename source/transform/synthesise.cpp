// synthesise.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

namespace xform
{
	std::string panFilter(probe::Layout target, int sourceChannels)
	{
		if(target == probe::Layout::Surround51)
		{
			// keep the front, centre, lfe and rear pairs; the side pair is dropped outright
			// rather than folded into the rears.
			return "pan=5.1|FL=FL|FR=FR|FC=FC|LFE=LFE|BL=BL|BR=BR";
		}

		// stereo. go by channel position, since 5.1 sources come as either 5.1 or 5.1(side)
		// and the names differ, but the order (FL FR FC LFE xL xR [SL SR]) doesn't. lfe is dropped.
		if(sourceChannels >= 8)
			return "pan=stereo|c0<c0+0.707*c2+0.707*c4+0.707*c6|c1<c1+0.707*c2+0.707*c5+0.707*c7";

		else
			return "pan=stereo|c0<c0+0.707*c2+0.707*c4|c1<c1+0.707*c2+0.707*c5";
	}

	std::string bitrateFor(probe::Layout target)
	{
		if(target == probe::Layout::Surround51)
			return SURROUND_BITRATE;

		return config::getStereoBitrate();
	}

	proc::Command synthesisCommand(const std::fs::path& source, const SynthTrack& track)
	{
		proc::Command cmd;
		cmd.program = config::getFFmpegPath();
		cmd.args = {
			"-nostdin", "-hide_banner", "-nostats",
			"-loglevel", "error",
			"-progress", "pipe:1",
			"-y",
			"-i", source.string(),
			"-map", zpr::sprint("0:a:%zu", track.sourceStreamNumber),
			"-af", panFilter(track.layout, track.sourceChannels),
			"-c:a", TARGET_CODEC,
			"-b:a", bitrateFor(track.layout),
			track.path.string()
		};

		return cmd;
	}

	proc::ProgressFn progressPrinter()
	{
		// a rewritten progress line only makes sense if there's one job writing it.
		if(config::disableProgress() || config::getJobCount() > 1)
			return { };

		// the callback runs on the process' reader thread, which has no indent of its own.
		auto indent = util::get_log_indent();
		return [indent](const proc::Progress& p) {
			if(p.finished)
				return;

			util::print_progress_line(zpr::sprint("time: %s%s", util::uglyPrintTime(p.outTimeNs, /* ms: */ false),
				p.speed.empty() ? "" : zpr::sprint(" (%s)", p.speed)), indent);
		};
	}

	Outcome synthesiseTrack(proc::Runner& runner, const std::fs::path& source, const SynthTrack& track)
	{
		util::info("generating %s audio from %d-channel stream %zu", probe::layoutName(track.layout),
			track.sourceChannels, track.sourceStreamNumber);

		auto res = runner.run(synthesisCommand(source, track), progressPrinter());
		util::end_progress_line();

		if(res.cancelled)
			return fail(Failure::Cancelled, "interrupted while synthesising audio", res.status);

		if(res.status != 0)
		{
			if(auto e = util::trim(res.err); !e.empty())
				util::error("%s", e);

			return fail(Failure::Synthesis, zpr::sprint("ffmpeg returned non-zero (status = %d)", res.status), res.status);
		}

		// a zero exit status with nothing written is still a failure.
		auto size = util::getFileSize(track.path);
		if(size <= 0)
			return fail(Failure::Synthesis, zpr::sprint("%s audio is missing or empty", probe::layoutName(track.layout)), res.status);

		util::log("%s audio generated (%s)", probe::layoutName(track.layout), util::prettyPrintSize(size));
		return Outcome();
	}
}
