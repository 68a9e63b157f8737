// scratch.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <unistd.h>

#include <atomic>

namespace driver
{
	ScratchDir::ScratchDir(const std::fs::path& parent)
	{
		// the pid keeps two concurrent runs out of each other's way.
		static std::atomic<int> counter { 0 };
		auto path = parent / zpr::sprint("surroundinator-%d-%d", static_cast<int>(getpid()), counter++);

		std::error_code ec;
		std::fs::create_directories(path, ec);
		if(ec || !std::fs::is_directory(path, ec))
		{
			util::error("failed to create scratch folder '%s': %s", path.string(), ec.message());
			return;
		}

		this->dir = path;
	}

	ScratchDir::~ScratchDir()
	{
		if(this->dir.empty())
			return;

		util::info("cleaning up temporary files");

		std::error_code ec;
		std::fs::remove_all(this->dir, ec);
		if(ec)
			util::warn("failed to remove scratch folder '%s': %s", this->dir.string(), ec.message());
	}
}
