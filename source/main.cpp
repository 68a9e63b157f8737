// main.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

int main(int argc, char** argv)
{
	config::readConfig();
	auto roots = args::parseCmdLineOpts(argc, argv);

	proc::installSignalHandlers();

	util::log("surroundinator: adding 5.1 audio to 7.1-only videos");
	util::info("policy: %s%s", config::policyName(config::getPolicy()), config::isDryRun() ? " (dry run)" : "");

	if(!driver::checkDependencies())
		return 1;

	if(roots.empty())
		roots.push_back(config::getRootFolder());

	if(!driver::checkRoots(roots))
		return 1;

	if(!driver::createOutputFolder())
		return 1;

	driver::ScratchDir scratch(config::getScratchFolder());
	if(!scratch.valid())
		return 1;

	proc::SystemRunner runner;
	verify::AvLayoutReader reader;

	auto pipeline = driver::Pipeline { runner, reader, scratch };

	auto files = driver::collectFiles(roots);
	util::info("found %zu video %s", files.size(), util::plural("file", files.size()));

	auto tally = driver::processFiles(pipeline, files);
	driver::printSummary(tally, files.size());

	return 0;
}
