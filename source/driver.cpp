// driver.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <algorithm>

namespace driver
{
	bool checkDependencies()
	{
		bool ok = true;
		for(const auto& prog : { config::getFFmpegPath(), config::getFFprobePath() })
		{
			if(util::findProgram(prog).empty())
			{
				util::error("'%s' is not installed (or not executable). please install it first.", prog);
				ok = false;
			}
		}

		if(ok)
			util::log("dependencies check passed");

		return ok;
	}

	bool checkRoots(const std::vector<std::string>& roots)
	{
		bool ok = true;
		for(const auto& root : roots)
		{
			std::error_code ec;
			if(!std::fs::is_regular_file(root, ec) && !std::fs::is_directory(root, ec))
			{
				util::error("%serror:%s '%s' does not exist", COLOUR_RED_BOLD, COLOUR_RESET, root);
				ok = false;
			}
		}

		return ok;
	}

	bool createOutputFolder()
	{
		auto out = config::getOutputFolder();
		if(out.empty())
			return true;

		auto path = std::fs::path(out);

		std::error_code ec;
		if(!std::fs::exists(path, ec))
		{
			if(!std::fs::create_directories(path, ec) || ec)
			{
				util::error("failed to create output folder '%s'", out);
				return false;
			}

			util::info("creating output folder '%s'", out);
		}
		else if(!std::fs::is_directory(path, ec))
		{
			util::error("%serror:%s specified output path '%s' is not a directory", COLOUR_RED_BOLD, COLOUR_RESET, out);
			return false;
		}

		return true;
	}

	bool isCandidate(const std::fs::path& path)
	{
		auto name = path.filename().string();

		// leftovers from an interrupted run are never inputs.
		if(name.find(xform::STAGING_MARKER) != std::string::npos)
			return false;

		auto ext = path.extension().string();
		if(ext.size() < 2)
			return false;

		ext = util::lowercase(ext.substr(1));
		for(const auto& x : config::getExtensions())
		{
			if(util::lowercase(x) == ext)
				return true;
		}

		return false;
	}

	std::vector<std::fs::path> collectFiles(const std::vector<std::string>& roots)
	{
		std::vector<std::fs::path> ret;

		std::fs::path outputFolder;
		if(auto out = config::getOutputFolder(); !out.empty())
		{
			std::error_code ec;
			outputFolder = std::fs::weakly_canonical(out, ec);

			// "out/" would otherwise carry an empty last element and never match.
			if(outputFolder.filename().empty())
				outputFolder = outputFolder.parent_path();
		}

		auto inside_output = [&outputFolder](const std::fs::path& p) -> bool {
			if(outputFolder.empty())
				return false;

			std::error_code ec;
			auto cp = std::fs::weakly_canonical(p, ec);
			auto mm = std::mismatch(outputFolder.begin(), outputFolder.end(), cp.begin(), cp.end());
			return mm.first == outputFolder.end();
		};

		auto consider = [&](const std::fs::path& p) {
			if(isCandidate(p) && !inside_output(p))
				ret.push_back(p);
		};

		for(const auto& root : roots)
		{
			auto path = std::fs::path(root);

			std::error_code ec;
			if(std::fs::is_regular_file(path, ec))
			{
				consider(path);
				continue;
			}
			else if(!std::fs::is_directory(path, ec))
			{
				util::error("skipping nonexistent path '%s'", root);
				continue;
			}

			util::info("searching for video files in '%s'", root);

			auto it = std::fs::recursive_directory_iterator(path, std::fs::directory_options::skip_permission_denied, ec);
			if(ec)
			{
				util::error("failed to read '%s': %s", root, ec.message());
				continue;
			}

			for(auto end = std::fs::recursive_directory_iterator(); it != end; it.increment(ec))
			{
				if(ec)
				{
					util::warn("error while walking '%s': %s", root, ec.message());
					break;
				}

				if(it->is_regular_file(ec))
					consider(it->path());
			}
		}

		std::sort(ret.begin(), ret.end());
		ret.erase(std::unique(ret.begin(), ret.end()), ret.end());

		return ret;
	}





	static void describe(const probe::AudioConfig& cfg, size_t count)
	{
		util::info("%zu audio %s: stereo = %s, 5.1 = %s, 7.1 = %s", count, util::plural("track", count),
			cfg.hasStereo ? "yes" : "no", cfg.has51 ? "yes" : "no", cfg.has71 ? "yes" : "no");
	}

	static void dryRun(proc::Runner& runner, const xform::Job& job, size_t audioCount)
	{
		auto subs = probe::probeStreams(runner, job.source, probe::Kind::Subtitle);

		util::log("dryrun: would have run:");
		util::indent_log();
		defer(util::unindent_log());

		for(const auto& t : job.synthesised)
			util::info("%s", xform::synthesisCommand(job.source, t).toString());

		util::info("%s", xform::mergeCommand(job.source, std::max(size_t(1), audioCount), subs ? subs->size() : 0,
			job.synthesised, job.staged).toString());
		util::info("then: '%s' -> '%s'", job.staged.string(), job.destination.string());
	}

	Result processOneFile(const Pipeline& pipeline, const std::fs::path& filepath, size_t jobId)
	{
		util::log("%s", filepath.filename().string());
		util::indent_log();
		defer(util::unindent_log());

		auto streams = probe::probeStreams(pipeline.runner, filepath, probe::Kind::Audio);
		if(!streams)
		{
			util::error("%s failed: could not read audio tracks", xform::failureName(xform::Failure::Probe));
			return Result::Failed;
		}

		auto cfg = probe::analyse(*streams);
		describe(cfg, streams->size());

		auto decision = probe::decide(cfg, config::getPolicy());
		switch(decision.action)
		{
			case probe::Action::AlreadyComplete:
				util::log("already has %s audio - skipping", config::getPolicy() == config::Policy::Complete
					? "5.1 and stereo" : "5.1");
				return Result::Skipped;

			case probe::Action::StereoOnlyNoSurroundSource:
				util::warn("only has stereo - skipping");
				return Result::Skipped;

			case probe::Action::NoSurroundSource:
				if(cfg.hasStereo)   util::warn("only has stereo - skipping");
				else                util::warn("no 7.1 audio to convert - skipping");

				return Result::Skipped;

			default:
				break;
		}

		util::info("%s: using %d-channel stream %zu (index %d)", probe::actionName(decision.action),
			decision.sourceChannels, *decision.sourceStreamNumber, decision.sourceStreamIndex.value_or(-1));

		auto job = xform::makeJob(filepath, decision, pipeline.scratch.path(), jobId, config::getOutputFolder());
		if(config::isDryRun())
		{
			dryRun(pipeline.runner, job, streams->size());
			return Result::Processed;
		}

		auto start = std::chrono::steady_clock::now();

		xform::Transaction txn(pipeline.runner, pipeline.reader, job);
		if(auto outcome = txn.run(); !outcome.ok())
			return Result::Failed;

		auto took = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
		util::log("successfully processed (%s)", util::prettyPrintTime(static_cast<uint64_t>(took.count()), false));
		return Result::Processed;
	}

	Tally processFiles(const Pipeline& pipeline, const std::vector<std::fs::path>& files)
	{
		Tally tally;

		std::mutex lock;
		std::atomic<size_t> cursor { 0 };
		std::atomic<bool> stop { false };

		size_t jobs = std::max(size_t(1), std::min(config::getJobCount(), files.size()));

		auto worker = [&]() {
			while(!stop && !proc::isCancelled())
			{
				size_t i = cursor++;
				if(i >= files.size())
					break;

				auto res = processOneFile(pipeline, files[i], i);
				if(jobs == 1)
					zpr::println("");

				std::lock_guard<std::mutex> lk(lock);
				switch(res)
				{
					case Result::Processed: tally.processed += 1; break;
					case Result::Skipped:   tally.skipped += 1; break;
					case Result::Failed:    tally.failed += 1; break;
				}

				if(res == Result::Failed && config::shouldStopOnError() && !stop)
				{
					util::error("stopping on first error");
					stop = true;
				}
			}
		};

		if(jobs == 1)
		{
			worker();
		}
		else
		{
			util::info("processing with %zu jobs", jobs);

			std::vector<std::thread> threads;
			for(size_t i = 0; i < jobs; i++)
				threads.emplace_back(worker);

			for(auto& t : threads)
				t.join();
		}

		tally.interrupted = proc::isCancelled();
		return tally;
	}

	Summary printSummary(const Tally& tally, size_t found)
	{
		if(tally.interrupted)
			util::warn("interrupted; remaining files were not touched");

		if(found == 0)
		{
			util::warn("no video files found");
			return Summary::NoFiles;
		}

		util::info("found %zu video %s", found, util::plural("file", found));

		auto ret = Summary::Completed;
		if(tally.processed == 0 && tally.failed == 0 && !tally.interrupted)
		{
			util::log("nothing needed converting");
			ret = Summary::NothingNeeded;
		}

		util::log("processing complete!");
		util::info("processed: %zu", tally.processed);
		util::info("skipped: %zu", tally.skipped);

		if(tally.failed > 0)    util::error("failed: %zu", tally.failed);
		else                    util::info("failed: %zu", tally.failed);

		return ret;
	}
}
