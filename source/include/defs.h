// defs.h
// Copyright (c) 2014 - 2017, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <string_view>
#include <functional>
#include <filesystem>

#include "zpr.h"

#define COLOUR_RESET			"\033[0m"
#define COLOUR_BLACK			"\033[30m"			// Black
#define COLOUR_RED				"\033[31m"			// Red
#define COLOUR_GREEN			"\033[32m"			// Green
#define COLOUR_YELLOW			"\033[33m"			// Yellow
#define COLOUR_BLUE				"\033[34m"			// Blue
#define COLOUR_MAGENTA			"\033[35m"			// Magenta
#define COLOUR_CYAN				"\033[36m"			// Cyan
#define COLOUR_WHITE			"\033[37m"			// White
#define COLOUR_BLACK_BOLD		"\033[1m"			// Bold Black
#define COLOUR_RED_BOLD			"\033[1m\033[31m"	// Bold Red
#define COLOUR_GREEN_BOLD		"\033[1m\033[32m"	// Bold Green
#define COLOUR_YELLOW_BOLD		"\033[1m\033[33m"	// Bold Yellow
#define COLOUR_BLUE_BOLD		"\033[1m\033[34m"	// Bold Blue
#define COLOUR_MAGENTA_BOLD		"\033[1m\033[35m"	// Bold Magenta
#define COLOUR_CYAN_BOLD		"\033[1m\033[36m"	// Bold Cyan
#define COLOUR_WHITE_BOLD		"\033[1m\033[37m"	// Bold White
#define COLOUR_GREY_BOLD		"\033[30;1m"		// Bold Grey


namespace std
{
	namespace fs = filesystem;
}

namespace util
{
	void indent_log(int n = 1);
	void unindent_log(int n = 1);
	int get_log_indent();

	// writes one finished status line; thread-safe, and clears any progress line first.
	void print_log_line(FILE* stream, const char* colour, const std::string& msg);

	// rewrites the current progress line in-place (no newline). the indent is passed in, since
	// this usually gets called from a process reader thread and not the one that owns the file.
	void print_progress_line(const std::string& msg, int indent);
	void end_progress_line();

	template <typename... Args>
	static void error(const std::string& fmt, Args&&... args)
	{
		print_log_line(stderr, COLOUR_RED_BOLD, zpr::sprint(fmt, args...));
	}

	template <typename... Args>
	static void log(const std::string& fmt, Args&&... args)
	{
		print_log_line(stdout, COLOUR_GREEN_BOLD, zpr::sprint(fmt, args...));
	}

	template <typename... Args>
	static void info(const std::string& fmt, Args&&... args)
	{
		print_log_line(stdout, COLOUR_BLUE_BOLD, zpr::sprint(fmt, args...));
	}

	template <typename... Args>
	static void warn(const std::string& fmt, Args&&... args)
	{
		print_log_line(stdout, COLOUR_YELLOW_BOLD, zpr::sprint(fmt, args...));
	}

	// [2019-11-03 14:02:51]
	std::string timestamp();

	// returns -1 if the size could not be determined.
	int64_t getFileSize(const std::fs::path& path);
	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path);

	std::string getEnvironmentVar(const std::string& name);

	// resolves a bare program name against $PATH; returns an empty path if it isn't there.
	std::fs::path findProgram(const std::string& name);

	std::string shellQuote(const std::string& s);
	bool parseInt(const std::string& s, int* out);

	// 1h 3m 14s
	std::string prettyPrintTime(uint64_t ns, bool ms = true);

	// 01:03:14.51
	std::string uglyPrintTime(uint64_t ns, bool ms = true);

	// 1.4 GB
	std::string prettyPrintSize(int64_t bytes);

	static inline std::vector<std::string> splitString(std::string view, char delim = '\n')
	{
		std::vector<std::string> ret;

		while(true)
		{
			size_t ln = view.find(delim);

			if(ln != std::string_view::npos)
			{
				ret.emplace_back(view.data(), ln);
				view = view.substr(ln + 1);
			}
			else
			{
				break;
			}
		}

		// account for the case when there's no trailing newline, and we still have some stuff stuck in the view.
		if(!view.empty())
			ret.emplace_back(view.data(), view.length());

		return ret;
	}

	static inline std::string trim(const std::string& s)
	{
		auto ltrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_first_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s.remove_prefix(i);
			else                       s = std::string_view();

			return s;
		};

		auto rtrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_last_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s = s.substr(0, i + 1);

			return s;
		};

		std::string_view sv = s;
		return std::string(ltrim(rtrim(sv)));
	}

	static inline std::string lowercase(std::string xs)
	{
		for(size_t i = 0; i < xs.size(); i++)
			xs[i] = static_cast<char>(tolower(static_cast<unsigned char>(xs[i])));

		return xs;
	}

	static inline std::string plural(const std::string& thing, size_t count)
	{
		return count == 1 ? thing : thing + "s";
	}

	template <typename T, typename Fn>
	std::string listToString(const std::vector<T>& xs, Fn fn, bool braces = true, const std::string& sep = ", ")
	{
		std::string ret;
		for(size_t i = 0; i < xs.size(); i++)
		{
			ret += fn(xs[i]);
			if(i + 1 < xs.size())
				ret += sep;
		}

		return braces ? "[ " + ret + " ]" : ret;
	}
}

namespace config
{
	enum class Policy
	{
		SurroundOnly,       // only ever add 5.1 from 7.1
		Complete,           // also add stereo when it's missing
	};

	enum class ProbeFormat
	{
		Auto,
		Json,
		Flat,
	};

	void readConfig();

	bool parsePolicy(const std::string& s, Policy* out);
	bool parseProbeFormat(const std::string& s, ProbeFormat* out);

	std::string policyName(Policy p);

	std::string getRootFolder();
	std::string getOutputFolder();
	std::string getScratchFolder();
	std::string getConfigPath();
	std::string getFFmpegPath();
	std::string getFFprobePath();
	std::string getStereoBitrate();

	std::vector<std::string> getExtensions();

	Policy getPolicy();
	ProbeFormat getProbeFormat();
	size_t getJobCount();

	bool isDryRun();
	bool disableProgress();
	bool shouldStopOnError();
	bool shouldVerifyStreams();


	void setRootFolder(const std::string& x);
	void setOutputFolder(const std::string& x);
	void setScratchFolder(const std::string& x);
	void setConfigPath(const std::string& x);
	void setFFmpegPath(const std::string& x);
	void setFFprobePath(const std::string& x);
	void setStereoBitrate(const std::string& x);

	void setExtensions(const std::vector<std::string>& xs);

	void setPolicy(Policy x);
	void setProbeFormat(ProbeFormat x);
	void setJobCount(size_t x);

	void setIsDryRun(bool x);
	void setDisableProgress(bool x);
	void setShouldStopOnError(bool x);
	void setShouldVerifyStreams(bool x);
}

namespace args
{
	// returns the list of roots given on the command line (possibly empty).
	std::vector<std::string> parseCmdLineOpts(int argc, char** argv);
}

namespace proc
{
	struct Command
	{
		std::string program;
		std::vector<std::string> args;

		std::string toString() const;
	};

	// one block of ffmpeg's '-progress' output.
	struct Progress
	{
		uint64_t outTimeNs = 0;
		std::string speed;
		bool finished = false;
	};

	using ProgressFn = std::function<void (const Progress&)>;

	// feeds one 'key=value' line; returns true when the line closes a block (ie. 'progress=...').
	bool parseProgressLine(Progress& state, const std::string& line);

	struct Result
	{
		int status = -1;
		bool cancelled = false;

		std::string out;
		std::string err;
	};

	struct Runner
	{
		virtual ~Runner() { }
		virtual Result run(const Command& cmd, const ProgressFn& observer) = 0;
	};

	// spawns the command for real, and kills it if cancellation is requested while it runs.
	struct SystemRunner : Runner
	{
		Result run(const Command& cmd, const ProgressFn& observer) override;
	};

	void installSignalHandlers();

	void requestCancel();
	void resetCancel();
	bool isCancelled();
}

namespace probe
{
	enum class Kind
	{
		Audio,
		Subtitle,
	};

	// the position of a stream in a probe result is its "stream number" (what ffmpeg's
	// '0:a:N' addresses); 'index' is the raw position in the whole container.
	struct Stream
	{
		int index = -1;
		int channels = 0;
		std::string codec;

		bool operator == (const Stream& other) const
		{
			return index == other.index && channels == other.channels && codec == other.codec;
		}
	};

	bool parseJson(const std::string& text, std::vector<Stream>& out, std::string* err = nullptr);
	bool parseFlat(const std::string& text, std::vector<Stream>& out);

	proc::Command probeCommand(const std::fs::path& file, Kind kind, config::ProbeFormat format);

	// returns nullopt if ffprobe could not be run or its output made no sense.
	// "no streams" is an empty vector, not a failure.
	std::optional<std::vector<Stream>> probeStreams(proc::Runner& runner, const std::fs::path& file, Kind kind);


	enum class Layout
	{
		Stereo,
		Surround51,
	};

	int channelCount(Layout layout);
	std::string layoutName(Layout layout);

	struct AudioConfig
	{
		bool hasStereo = false;
		bool has51 = false;
		bool has71 = false;

		// stream numbers, not indices.
		std::optional<size_t> first51StreamNumber;
		std::optional<size_t> first71StreamNumber;

		std::optional<int> first51StreamIndex;
		std::optional<int> first71StreamIndex;
	};

	enum class Action
	{
		AlreadyComplete,
		StereoOnlyNoSurroundSource,
		NoSurroundSource,
		SynthesiseFrom71,
		SynthesiseStereo,
		SynthesiseBoth,
	};

	std::string actionName(Action action);

	struct Decision
	{
		Action action = Action::NoSurroundSource;

		std::optional<size_t> sourceStreamNumber;
		std::optional<int> sourceStreamIndex;
		int sourceChannels = 0;

		// in the order they get appended to the output.
		std::vector<Layout> tracks;

		bool isSkip() const { return tracks.empty(); }
	};

	AudioConfig analyse(const std::vector<Stream>& streams);
	Decision decide(const AudioConfig& config, config::Policy policy);
}

namespace verify
{
	struct Layout
	{
		size_t videoCount = 0;
		std::vector<probe::Stream> audio;
		std::vector<probe::Stream> subtitles;
	};

	struct LayoutReader
	{
		virtual ~LayoutReader() { }
		virtual bool read(const std::fs::path& file, Layout& out) = 0;
	};

	// opens the container with libavformat.
	struct AvLayoutReader : LayoutReader
	{
		AvLayoutReader();
		bool read(const std::fs::path& file, Layout& out) override;
	};

	// returns an empty string if 'actual' is what a merge of the given inputs should look like,
	// otherwise a description of the first mismatch.
	std::string checkLayout(const Layout& actual, const std::vector<probe::Stream>& originalAudio,
		size_t originalSubtitles, const std::vector<probe::Layout>& added, const std::string& codec);
}

namespace xform
{
	static constexpr const char* TARGET_CODEC       = "ac3";
	static constexpr const char* SURROUND_BITRATE   = "640k";
	static constexpr const char* STAGING_MARKER     = ".surroundinator-partial";
	static constexpr const char* BACKUP_SUFFIX      = ".backup";

	enum class Failure
	{
		None,
		Probe,
		Backup,
		Synthesis,
		Merge,
		Verification,
		Commit,
		Cancelled,
	};

	std::string failureName(Failure f);

	struct Outcome
	{
		Failure failure = Failure::None;
		int exitStatus = 0;
		std::string message;

		bool ok() const { return failure == Failure::None; }
	};

	static inline Outcome fail(Failure f, const std::string& msg, int status = 0)
	{
		return Outcome { f, status, msg };
	}

	struct SynthTrack
	{
		probe::Layout layout = probe::Layout::Surround51;

		size_t sourceStreamNumber = 0;
		int sourceChannels = 0;

		std::fs::path path;
	};

	// draws ffmpeg's progress on the status line; empty if that's turned off.
	proc::ProgressFn progressPrinter();

	std::string panFilter(probe::Layout target, int sourceChannels);
	std::string bitrateFor(probe::Layout target);

	proc::Command synthesisCommand(const std::fs::path& source, const SynthTrack& track);
	Outcome synthesiseTrack(proc::Runner& runner, const std::fs::path& source, const SynthTrack& track);

	// what the merge saw when it re-probed the source.
	struct MergePlan
	{
		std::vector<probe::Stream> audio;
		std::vector<probe::Stream> subtitles;
	};

	proc::Command mergeCommand(const std::fs::path& source, size_t audioCount, size_t subtitleCount,
		const std::vector<SynthTrack>& tracks, const std::fs::path& output);

	Outcome mergeTracks(proc::Runner& runner, const std::fs::path& source, const std::vector<SynthTrack>& tracks,
		const std::fs::path& output, MergePlan* plan);

	struct Job
	{
		std::fs::path source;
		std::fs::path destination;

		// empty when the output goes somewhere else, since the source is never touched then.
		std::fs::path backup;
		std::fs::path staged;

		std::vector<SynthTrack> synthesised;
		size_t sourceStreamNumber = 0;
	};

	Job makeJob(const std::fs::path& source, const probe::Decision& decision, const std::fs::path& scratch,
		size_t jobId, const std::string& outputFolder);

	enum class State
	{
		Idle,
		BackingUp,
		Synthesising,
		Merging,
		Verifying,
		Committing,
		Done,
		Aborted,
	};

	std::string stateName(State s);

	struct Transaction
	{
		Transaction(proc::Runner& runner, verify::LayoutReader& reader, Job job);

		Outcome run();

		State state() const { return this->current; }
		const Job& job() const { return this->theJob; }

		std::function<void (State)> onStateChange;

	private:
		void setState(State s);
		Outcome abort(Outcome why);
		void cleanup(bool committed);

		Outcome backup();
		Outcome synthesise();
		Outcome merge();
		Outcome verifyOutput();
		Outcome commit();

		proc::Runner& runner;
		verify::LayoutReader& reader;

		Job theJob;
		MergePlan plan;
		State current = State::Idle;

		bool createdBackup = false;
	};
}

namespace driver
{
	enum class Result
	{
		Processed,
		Skipped,
		Failed,
	};

	enum class Summary
	{
		NoFiles,
		NothingNeeded,
		Completed,
	};

	struct Tally
	{
		size_t processed = 0;
		size_t skipped = 0;
		size_t failed = 0;

		bool interrupted = false;
	};

	// owns the per-run scratch folder; it goes away when this does.
	struct ScratchDir
	{
		explicit ScratchDir(const std::fs::path& parent);
		~ScratchDir();

		ScratchDir(const ScratchDir&) = delete;
		ScratchDir& operator = (const ScratchDir&) = delete;

		bool valid() const { return !this->dir.empty(); }
		const std::fs::path& path() const { return this->dir; }

	private:
		std::fs::path dir;
	};

	struct Pipeline
	{
		proc::Runner& runner;
		verify::LayoutReader& reader;
		const ScratchDir& scratch;
	};

	bool checkDependencies();
	bool checkRoots(const std::vector<std::string>& roots);
	bool createOutputFolder();

	bool isCandidate(const std::fs::path& path);
	std::vector<std::fs::path> collectFiles(const std::vector<std::string>& roots);

	Result processOneFile(const Pipeline& pipeline, const std::fs::path& filepath, size_t jobId);
	Tally processFiles(const Pipeline& pipeline, const std::vector<std::fs::path>& files);

	Summary printSummary(const Tally& tally, size_t found);
}





// defer implementation
// credit: gingerBill
// shamelessly stolen from https://github.com/gingerBill/gb


namespace __dontlook
{
	// NOTE(bill): Stupid fucking templates
	template <typename T> struct gbRemoveReference       { typedef T Type; };
	template <typename T> struct gbRemoveReference<T &>  { typedef T Type; };
	template <typename T> struct gbRemoveReference<T &&> { typedef T Type; };

	/// NOTE(bill): "Move" semantics - invented because the C++ committee are idiots (as a collective not as indiviuals (well a least some aren't))
	template <typename T> inline T &&gb_forward(typename gbRemoveReference<T>::Type &t)  { return static_cast<T &&>(t); }
	template <typename T> inline T &&gb_forward(typename gbRemoveReference<T>::Type &&t) { return static_cast<T &&>(t); }
	template <typename T> inline T &&gb_move   (T &&t)                                   { return static_cast<typename gbRemoveReference<T>::Type &&>(t); }
	template <typename F>
	struct gbprivDefer {
		F f;
		gbprivDefer(F &&f) : f(gb_forward<F>(f)) {}
		~gbprivDefer() { f(); }
	};
	template <typename F> gbprivDefer<F> gb__defer_func(F &&f) { return gbprivDefer<F>(gb_forward<F>(f)); }
}

#define GB_DEFER_1(x, y) x##y
#define GB_DEFER_2(x, y) GB_DEFER_1(x, y)
#define GB_DEFER_3(x)    GB_DEFER_2(x, __COUNTER__)
#define defer(code) auto GB_DEFER_3(_defer_) = __dontlook::gb__defer_func([&]()->void{code;})
