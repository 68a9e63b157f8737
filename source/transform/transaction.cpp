// transaction.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <mutex>

namespace xform
{
	std::string failureName(Failure f)
	{
		switch(f)
		{
			case Failure::None:         return "none";
			case Failure::Probe:        return "probe";
			case Failure::Backup:       return "backup";
			case Failure::Synthesis:    return "synthesis";
			case Failure::Merge:        return "merge";
			case Failure::Verification: return "verification";
			case Failure::Commit:       return "commit";
			case Failure::Cancelled:    return "cancelled";
		}

		return "?";
	}

	std::string stateName(State s)
	{
		switch(s)
		{
			case State::Idle:           return "idle";
			case State::BackingUp:      return "backing up";
			case State::Synthesising:   return "synthesising";
			case State::Merging:        return "merging";
			case State::Verifying:      return "verifying";
			case State::Committing:     return "committing";
			case State::Done:           return "done";
			case State::Aborted:        return "aborted";
		}

		return "?";
	}

	Job makeJob(const std::fs::path& source, const probe::Decision& decision, const std::fs::path& scratch,
		size_t jobId, const std::string& outputFolder)
	{
		Job job;
		job.source = source;
		job.sourceStreamNumber = decision.sourceStreamNumber.value_or(0);

		if(outputFolder.empty())
		{
			job.destination = source;
			job.backup = source.string() + BACKUP_SUFFIX;
		}
		else
		{
			job.destination = std::fs::path(outputFolder) / source.filename();
		}

		// stage next to the destination, so the final rename never crosses a filesystem. the extension
		// stays last since that's how ffmpeg picks the container.
		auto stem = source.stem().string();
		job.staged = job.destination.parent_path() / zpr::sprint(".%s%s-%zu%s", stem, STAGING_MARKER, jobId,
			source.extension().string());

		for(auto layout : decision.tracks)
		{
			SynthTrack track;
			track.layout = layout;
			track.sourceStreamNumber = job.sourceStreamNumber;
			track.sourceChannels = decision.sourceChannels;
			track.path = scratch / zpr::sprint("%zu-%s.%s.ac3", jobId, stem,
				layout == probe::Layout::Stereo ? "20" : "51");

			job.synthesised.push_back(track);
		}

		return job;
	}





	Transaction::Transaction(proc::Runner& runner, verify::LayoutReader& reader, Job job)
		: runner(runner), reader(reader), theJob(std::move(job))
	{
	}

	void Transaction::setState(State s)
	{
		this->current = s;
		if(this->onStateChange)
			this->onStateChange(s);
	}

	Outcome Transaction::abort(Outcome why)
	{
		util::error("%s failed while %s: %s", failureName(why.failure), stateName(this->current), why.message);

		this->setState(State::Aborted);
		return why;
	}

	Outcome Transaction::run()
	{
		if(this->current != State::Idle)
			return fail(Failure::Verification, "transaction was already run");

		// whatever happens below, the intermediates go away. the staged output only
		// survives by being renamed over the destination.
		bool committed = false;
		defer(this->cleanup(committed));

		auto interrupted = []() -> bool { return proc::isCancelled(); };

		this->setState(State::BackingUp);
		if(interrupted())                               return this->abort(fail(Failure::Cancelled, "interrupted"));
		if(auto r = this->backup(); !r.ok())            return this->abort(r);

		this->setState(State::Synthesising);
		if(interrupted())                               return this->abort(fail(Failure::Cancelled, "interrupted"));
		if(auto r = this->synthesise(); !r.ok())        return this->abort(r);

		this->setState(State::Merging);
		if(interrupted())                               return this->abort(fail(Failure::Cancelled, "interrupted"));
		if(auto r = this->merge(); !r.ok())             return this->abort(r);

		this->setState(State::Verifying);
		if(interrupted())                               return this->abort(fail(Failure::Cancelled, "interrupted"));
		if(auto r = this->verifyOutput(); !r.ok())      return this->abort(r);

		// past this point we don't stop for ^C; the rename is a single step anyway.
		this->setState(State::Committing);
		if(auto r = this->commit(); !r.ok())            return this->abort(r);

		committed = true;

		this->setState(State::Done);
		return Outcome();
	}

	Outcome Transaction::backup()
	{
		auto& job = this->theJob;
		std::error_code ec;
		if(job.backup.empty())
		{
			// two sources with the same name (in different folders) would land on the same output.
			if(std::fs::exists(job.destination, ec))
				return fail(Failure::Commit, zpr::sprint("'%s' already exists; refusing to overwrite it", job.destination.string()));

			util::info("writing to '%s'; original is left alone", job.destination.parent_path().string());
			return Outcome();
		}

		auto size = util::getFileSize(job.source);
		if(size < 0)    return fail(Failure::Backup, "cannot determine file size");
		if(size == 0)   return fail(Failure::Backup, "source file is empty");

		if(std::fs::exists(job.backup, ec))
		{
			// the source is only ever replaced by a file with more streams in it, so a backup of the
			// same size is a finished copy of a source that was never touched.
			if(util::getFileSize(job.backup) != size)
			{
				return fail(Failure::Backup, zpr::sprint("'%s' already exists and does not match the source; if the "
					"source is damaged, restore it from the backup, otherwise delete the backup", job.backup.string()));
			}

			util::warn("replacing stale backup from an interrupted run");
			if(!std::fs::remove(job.backup, ec) || ec)
				return fail(Failure::Backup, zpr::sprint("failed to remove stale backup: %s", ec.message()));
		}

		util::info("file size: %s - copying backup", util::prettyPrintSize(size));

		// mark it first, so that a partial copy still gets cleaned up.
		this->createdBackup = true;
		if(!std::fs::copy_file(job.source, job.backup, ec) || ec)
			return fail(Failure::Backup, zpr::sprint("failed to create backup: %s", ec.message()));

		if(auto bsize = util::getFileSize(job.backup); bsize != size)
			return fail(Failure::Backup, zpr::sprint("backup size mismatch (expected %d, got %d)", size, bsize));

		util::log("backup created");
		return Outcome();
	}

	Outcome Transaction::synthesise()
	{
		for(const auto& track : this->theJob.synthesised)
		{
			if(auto r = synthesiseTrack(this->runner, this->theJob.source, track); !r.ok())
				return r;

			if(proc::isCancelled())
				return fail(Failure::Cancelled, "interrupted");
		}

		return Outcome();
	}

	Outcome Transaction::merge()
	{
		return mergeTracks(this->runner, this->theJob.source, this->theJob.synthesised, this->theJob.staged,
			&this->plan);
	}

	Outcome Transaction::verifyOutput()
	{
		auto& job = this->theJob;
		if(util::getFileSize(job.staged) <= 0)
			return fail(Failure::Verification, "output file is missing or empty");

		if(!config::shouldVerifyStreams())
			return Outcome();

		verify::Layout layout;
		if(!this->reader.read(job.staged, layout))
			return fail(Failure::Verification, "could not inspect the merged output");

		std::vector<probe::Layout> added;
		for(const auto& t : job.synthesised)
			added.push_back(t.layout);

		if(auto err = verify::checkLayout(layout, this->plan.audio, this->plan.subtitles.size(), added, TARGET_CODEC);
			!err.empty())
		{
			return fail(Failure::Verification, err);
		}

		util::log("output has %zu audio and %zu subtitle %s", layout.audio.size(), layout.subtitles.size(),
			util::plural("stream", layout.subtitles.size()));

		return Outcome();
	}

	Outcome Transaction::commit()
	{
		// keeps the existence check and the rename together across jobs.
		static std::mutex commit_lock;
		std::lock_guard<std::mutex> lk(commit_lock);

		auto& job = this->theJob;

		std::error_code ec;
		if(job.destination == job.source)
		{
			util::info("replacing original file");
		}
		else
		{
			if(std::fs::exists(job.destination, ec))
				return fail(Failure::Commit, zpr::sprint("'%s' already exists; refusing to overwrite it", job.destination.string()));

			util::info("moving output to '%s'", job.destination.string());
		}

		std::fs::rename(job.staged, job.destination, ec);
		if(ec)
			return fail(Failure::Commit, zpr::sprint("failed to move output into place: %s", ec.message()));

		return Outcome();
	}

	void Transaction::cleanup(bool committed)
	{
		auto remove = [](const std::fs::path& p, const char* what) -> bool {
			if(p.empty())
				return false;

			std::error_code ec;
			bool removed = std::fs::remove(p, ec);
			if(ec)
				util::warn("failed to remove %s '%s': %s", what, p.string(), ec.message());

			return removed;
		};

		for(const auto& t : this->theJob.synthesised)
			remove(t.path, "intermediate audio");

		if(!committed)
			remove(this->theJob.staged, "staged output");

		// only ever delete a backup that we made ourselves.
		if(this->createdBackup && remove(this->theJob.backup, "backup") && committed)
			util::info("removed backup file");
	}
}
