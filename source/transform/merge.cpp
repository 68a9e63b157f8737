// merge.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

namespace xform
{
	proc::Command mergeCommand(const std::fs::path& source, size_t audioCount, size_t subtitleCount,
		const std::vector<SynthTrack>& tracks, const std::fs::path& output)
	{
		proc::Command cmd;
		cmd.program = config::getFFmpegPath();

		auto& args = cmd.args;
		args = {
			"-nostdin", "-hide_banner", "-nostats",
			"-loglevel", "error",
			"-progress", "pipe:1",
			"-y",
			"-i", source.string()
		};

		for(const auto& t : tracks)
		{
			args.push_back("-i");
			args.push_back(t.path.string());
		}

		// order: video, original audio, new audio, original subtitles.
		args.push_back("-map");
		args.push_back("0:v:0");

		for(size_t i = 0; i < audioCount; i++)
		{
			args.push_back("-map");
			args.push_back(zpr::sprint("0:a:%zu", i));
		}

		for(size_t k = 0; k < tracks.size(); k++)
		{
			args.push_back("-map");
			args.push_back(zpr::sprint("%zu:a:0", k + 1));
		}

		for(size_t i = 0; i < subtitleCount; i++)
		{
			args.push_back("-map");
			args.push_back(zpr::sprint("0:s:%zu", i));
		}

		// codecs. note that -c:a:N counts output audio streams, so the new ones start at 'audioCount'.
		args.push_back("-c:v");
		args.push_back("copy");

		for(size_t i = 0; i < audioCount; i++)
		{
			args.push_back(zpr::sprint("-c:a:%zu", i));
			args.push_back("copy");
		}

		for(size_t k = 0; k < tracks.size(); k++)
		{
			auto n = audioCount + k;

			args.push_back(zpr::sprint("-c:a:%zu", n));
			args.push_back(TARGET_CODEC);
			args.push_back(zpr::sprint("-b:a:%zu", n));
			args.push_back(bitrateFor(tracks[k].layout));
			args.push_back(zpr::sprint("-metadata:s:a:%zu", n));
			args.push_back(zpr::sprint("title=%s", tracks[k].layout == probe::Layout::Stereo ? "Stereo" : "5.1"));
		}

		for(size_t i = 0; i < subtitleCount; i++)
		{
			args.push_back(zpr::sprint("-c:s:%zu", i));
			args.push_back("copy");
		}

		args.push_back(output.string());
		return cmd;
	}

	Outcome mergeTracks(proc::Runner& runner, const std::fs::path& source, const std::vector<SynthTrack>& tracks,
		const std::fs::path& output, MergePlan* plan)
	{
		util::info("merging %zu new audio %s", tracks.size(), util::plural("track", tracks.size()));

		// enumerate again here; don't trust whatever the classifier saw.
		auto audio = probe::probeStreams(runner, source, probe::Kind::Audio);
		if(!audio)
		{
			if(proc::isCancelled())
				return fail(Failure::Cancelled, "interrupted while probing");

			return fail(Failure::Probe, "failed to enumerate audio streams for merging");
		}

		auto subs = probe::probeStreams(runner, source, probe::Kind::Subtitle);
		if(!subs)
		{
			if(proc::isCancelled())
				return fail(Failure::Cancelled, "interrupted while probing");

			return fail(Failure::Probe, "failed to enumerate subtitle streams for merging");
		}

		// with nothing found, still map the first audio stream, same as ffmpeg would on its own.
		size_t audioCount = audio->empty() ? 1 : audio->size();

		util::info("found %zu audio %s to preserve", audioCount, util::plural("track", audioCount));
		if(!subs->empty())
			util::info("found %zu subtitle %s to preserve", subs->size(), util::plural("track", subs->size()));

		if(plan)
		{
			plan->audio = *audio;
			plan->subtitles = *subs;
		}

		auto res = runner.run(mergeCommand(source, audioCount, subs->size(), tracks, output), progressPrinter());
		util::end_progress_line();

		if(res.cancelled)
			return fail(Failure::Cancelled, "interrupted while merging", res.status);

		if(res.status != 0)
		{
			if(auto e = util::trim(res.err); !e.empty())
				util::error("%s", e);

			return fail(Failure::Merge, zpr::sprint("ffmpeg returned non-zero (status = %d)", res.status), res.status);
		}

		if(util::getFileSize(output) <= 0)
			return fail(Failure::Merge, "merged output is missing or empty", res.status);

		util::log("merge complete");
		return Outcome();
	}
}
