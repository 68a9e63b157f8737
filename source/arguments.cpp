// arguments.cpp
// Copyright (c) 2014 - 2017, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#define ARG_HELP                    "--help"
#define ARG_JOBS                    "--jobs"
#define ARG_POLICY                  "--policy"
#define ARG_FFMPEG                  "--ffmpeg"
#define ARG_FFPROBE                 "--ffprobe"
#define ARG_DRY_RUN                 "--dry-run"
#define ARG_NO_VERIFY               "--no-verify"
#define ARG_CONFIG_PATH             "--config"
#define ARG_NO_PROGRESS             "--no-progress"
#define ARG_PROBE_FORMAT            "--probe-format"
#define ARG_OUTPUT_FOLDER           "--output-folder"
#define ARG_STOP_ON_ERROR           "--stop-on-error"
#define ARG_SCRATCH_FOLDER          "--scratch-folder"


static std::vector<std::pair<std::string, std::string>> helpList;
static void setupMap()
{
	helpList.push_back({ ARG_HELP,
		"show this help"
	});

	helpList.push_back({ ARG_CONFIG_PATH + std::string(" <path>"),
		"set the path to the configuration file to use"
	});

	helpList.push_back({ ARG_OUTPUT_FOLDER + std::string(" <path_to_folder>"),
		"write converted files to this folder instead of replacing the originals; will be created if it doesn't exist"
	});

	helpList.push_back({ ARG_SCRATCH_FOLDER + std::string(" <path_to_folder>"),
		"where to put intermediate audio files (default: the system temporary folder)"
	});

	helpList.push_back({ ARG_POLICY + std::string(" <surround-only|complete>"),
		"'surround-only' only adds 5.1 from 7.1 (the default); 'complete' also adds a stereo track where one is missing"
	});

	helpList.push_back({ ARG_PROBE_FORMAT + std::string(" <auto|json|flat>"),
		"how to read ffprobe's output; 'auto' tries json first"
	});

	helpList.push_back({ ARG_JOBS + std::string(" <n>"),
		"process up to n files at once"
	});

	helpList.push_back({ ARG_FFMPEG + std::string(" <path>"),
		"use this ffmpeg executable"
	});

	helpList.push_back({ ARG_FFPROBE + std::string(" <path>"),
		"use this ffprobe executable"
	});

	helpList.push_back({ ARG_DRY_RUN,
		"do everything normally, but do not modify any files"
	});

	helpList.push_back({ ARG_NO_PROGRESS,
		"disable progress indication"
	});

	helpList.push_back({ ARG_NO_VERIFY,
		"only check that the output exists, without inspecting its streams"
	});

	helpList.push_back({ ARG_STOP_ON_ERROR,
		"exit immediately without processing further files, if any error is encountered"
	});
}

static void printHelp()
{
	if(helpList.empty())
		setupMap();

	printf("usage: surroundinator [options] [folders or files...]\n\n");

	printf("options:\n");

	size_t maxl = 0;
	for(const auto& p : helpList)
	{
		if(p.first.length() > maxl)
			maxl = p.first.length();
	}

	maxl += 4;

	for(const auto& [ opt, desc ] : helpList)
		printf("  %s%s%s\n", opt.c_str(), std::string(maxl - opt.length(), ' ').c_str(), desc.c_str());

	printf("\nwith no folders given, the root folder from the config (default '%s') is used.\n\n",
		config::getRootFolder().c_str());
}






namespace args
{
	[[noreturn]] static void expected(const char* what, const char* opt)
	{
		util::error("%serror:%s expected %s after '%s' option", COLOUR_RED_BOLD, COLOUR_RESET, what, opt);
		exit(-1);
	}

	std::vector<std::string> parseCmdLineOpts(int argc, char** argv)
	{
		// quick thing: usually programs will not do anything if --help or --version is anywhere in the flags.
		// the config file also goes first, so that flags can override what it says.
		for(int i = 1; i < argc; i++)
		{
			if(!strcmp(argv[i], ARG_HELP))
			{
				printHelp();
				exit(0);
			}
			else if(!strcmp(argv[i], ARG_CONFIG_PATH))
			{
				if(i == argc - 1)
					expected("path", argv[i]);

				config::setConfigPath(argv[++i]);
			}
		}

		std::vector<std::string> roots;
		for(int i = 1; i < argc; i++)
		{
			if(!strcmp(argv[i], ARG_CONFIG_PATH))
			{
				// already handled.
				i++;
				continue;
			}
			else if(!strcmp(argv[i], ARG_OUTPUT_FOLDER))
			{
				if(i == argc - 1)
					expected("path", argv[i]);

				config::setOutputFolder(argv[++i]);
				continue;
			}
			else if(!strcmp(argv[i], ARG_SCRATCH_FOLDER))
			{
				if(i == argc - 1)
					expected("path", argv[i]);

				config::setScratchFolder(argv[++i]);
				continue;
			}
			else if(!strcmp(argv[i], ARG_FFMPEG))
			{
				if(i == argc - 1)
					expected("path", argv[i]);

				config::setFFmpegPath(argv[++i]);
				continue;
			}
			else if(!strcmp(argv[i], ARG_FFPROBE))
			{
				if(i == argc - 1)
					expected("path", argv[i]);

				config::setFFprobePath(argv[++i]);
				continue;
			}
			else if(!strcmp(argv[i], ARG_POLICY))
			{
				if(i == argc - 1)
					expected("'surround-only' or 'complete'", argv[i]);

				config::Policy p;
				if(!config::parsePolicy(argv[i + 1], &p))
					expected("'surround-only' or 'complete'", argv[i]);

				config::setPolicy(p);
				i++;
				continue;
			}
			else if(!strcmp(argv[i], ARG_PROBE_FORMAT))
			{
				if(i == argc - 1)
					expected("'auto', 'json' or 'flat'", argv[i]);

				config::ProbeFormat f;
				if(!config::parseProbeFormat(argv[i + 1], &f))
					expected("'auto', 'json' or 'flat'", argv[i]);

				config::setProbeFormat(f);
				i++;
				continue;
			}
			else if(!strcmp(argv[i], ARG_JOBS))
			{
				int n = 0;
				if(i == argc - 1 || !util::parseInt(argv[i + 1], &n) || n < 1)
					expected("(positive) integer", argv[i]);

				config::setJobCount(static_cast<size_t>(n));
				i++;
				continue;
			}
			else if(!strcmp(argv[i], ARG_DRY_RUN))
			{
				config::setIsDryRun(true);
				continue;
			}
			else if(!strcmp(argv[i], ARG_NO_PROGRESS))
			{
				config::setDisableProgress(true);
				continue;
			}
			else if(!strcmp(argv[i], ARG_NO_VERIFY))
			{
				config::setShouldVerifyStreams(false);
				continue;
			}
			else if(!strcmp(argv[i], ARG_STOP_ON_ERROR))
			{
				config::setShouldStopOnError(true);
				continue;
			}
			else if(argv[i][0] == '-')
			{
				util::error("%serror:%s unrecognised option '%s'", COLOUR_RED_BOLD, COLOUR_RESET,
					argv[i]);
				exit(-1);
			}
			else
			{
				roots.push_back(argv[i]);
			}
		}

		return roots;
	}
}
