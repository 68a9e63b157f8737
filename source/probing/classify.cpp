// classify.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

namespace probe
{
	int channelCount(Layout layout)
	{
		switch(layout)
		{
			case Layout::Stereo:        return 2;
			case Layout::Surround51:    return 6;
		}

		return 0;
	}

	std::string layoutName(Layout layout)
	{
		switch(layout)
		{
			case Layout::Stereo:        return "stereo";
			case Layout::Surround51:    return "5.1";
		}

		return "?";
	}

	std::string actionName(Action action)
	{
		switch(action)
		{
			case Action::AlreadyComplete:               return "already complete";
			case Action::StereoOnlyNoSurroundSource:    return "stereo only, no surround source";
			case Action::NoSurroundSource:              return "no surround source";
			case Action::SynthesiseFrom71:              return "synthesise 5.1 from 7.1";
			case Action::SynthesiseStereo:              return "synthesise stereo from 5.1";
			case Action::SynthesiseBoth:                return "synthesise 5.1 and stereo from 7.1";
		}

		return "?";
	}

	AudioConfig analyse(const std::vector<Stream>& streams)
	{
		AudioConfig ret;

		// 'i' is the stream number. the first of each kind wins.
		for(size_t i = 0; i < streams.size(); i++)
		{
			const auto& strm = streams[i];

			if(strm.channels == 2)
			{
				ret.hasStereo = true;
			}
			else if(strm.channels == 6)
			{
				if(!ret.has51)
				{
					ret.first51StreamNumber = i;
					ret.first51StreamIndex = strm.index;
				}

				ret.has51 = true;
			}
			else if(strm.channels == 8)
			{
				if(!ret.has71)
				{
					ret.first71StreamNumber = i;
					ret.first71StreamIndex = strm.index;
				}

				ret.has71 = true;
			}
		}

		return ret;
	}

	Decision decide(const AudioConfig& config, config::Policy policy)
	{
		Decision ret;

		auto from71 = [&config, &ret](std::vector<Layout> tracks) {
			ret.sourceStreamNumber = config.first71StreamNumber;
			ret.sourceStreamIndex = config.first71StreamIndex;
			ret.sourceChannels = 8;
			ret.tracks = tracks;
		};

		if(policy == config::Policy::SurroundOnly)
		{
			if(config.has51)
			{
				ret.action = Action::AlreadyComplete;
			}
			else if(config.has71)
			{
				ret.action = Action::SynthesiseFrom71;
				from71({ Layout::Surround51 });
			}
			else
			{
				// stereo or not, there's nothing to build 5.1 out of.
				ret.action = Action::NoSurroundSource;
			}

			return ret;
		}

		// the complete policy wants both a stereo and a 5.1 track.
		if(config.has51)
		{
			if(config.hasStereo)
			{
				ret.action = Action::AlreadyComplete;
			}
			else
			{
				ret.action = Action::SynthesiseStereo;
				ret.sourceStreamNumber = config.first51StreamNumber;
				ret.sourceStreamIndex = config.first51StreamIndex;
				ret.sourceChannels = 6;
				ret.tracks = { Layout::Stereo };
			}
		}
		else if(config.has71)
		{
			if(config.hasStereo)
			{
				ret.action = Action::SynthesiseFrom71;
				from71({ Layout::Surround51 });
			}
			else
			{
				ret.action = Action::SynthesiseBoth;
				from71({ Layout::Surround51, Layout::Stereo });
			}
		}
		else
		{
			ret.action = config.hasStereo ? Action::StereoOnlyNoSurroundSource : Action::NoSurroundSource;
		}

		return ret;
	}
}
