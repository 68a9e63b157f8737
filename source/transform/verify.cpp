// verify.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

// what the fuck? i shouldn't have to do this manually...
extern "C" {
	#include <libavutil/log.h>
	#include <libavcodec/avcodec.h>
	#include <libavformat/avformat.h>
}

namespace verify
{
	static int channel_count(const AVCodecParameters* cp)
	{
	#if LIBAVUTIL_VERSION_INT >= AV_VERSION_INT(57, 28, 100)
		return cp->ch_layout.nb_channels;
	#else
		return cp->channels;
	#endif
	}

	AvLayoutReader::AvLayoutReader()
	{
		// ffmpeg's own complaints go through ffmpeg; we just want the answer.
		av_log_set_level(AV_LOG_QUIET);
	}

	bool AvLayoutReader::read(const std::fs::path& file, Layout& out)
	{
		AVFormatContext* ctx = nullptr;
		if(avformat_open_input(&ctx, file.string().c_str(), nullptr, nullptr) < 0)
		{
			util::error("failed to open '%s' for inspection", file.string());
			return false;
		}

		defer(avformat_close_input(&ctx));

		if(avformat_find_stream_info(ctx, nullptr) < 0)
		{
			util::error("failed to read streams");
			return false;
		}

		Layout ret;
		for(unsigned int i = 0; i < ctx->nb_streams; i++)
		{
			auto strm = ctx->streams[i];
			auto cp = strm->codecpar;

			probe::Stream s;
			s.index = strm->index;
			s.codec = avcodec_get_name(cp->codec_id);

			if(cp->codec_type == AVMEDIA_TYPE_VIDEO)
			{
				// cover art is stored as a video stream, but it doesn't count.
				if(!(strm->disposition & AV_DISPOSITION_ATTACHED_PIC))
					ret.videoCount++;
			}
			else if(cp->codec_type == AVMEDIA_TYPE_AUDIO)
			{
				s.channels = channel_count(cp);
				ret.audio.push_back(s);
			}
			else if(cp->codec_type == AVMEDIA_TYPE_SUBTITLE)
			{
				ret.subtitles.push_back(s);
			}
		}

		out = ret;
		return true;
	}

	std::string checkLayout(const Layout& actual, const std::vector<probe::Stream>& originalAudio,
		size_t originalSubtitles, const std::vector<probe::Layout>& added, const std::string& codec)
	{
		if(actual.videoCount == 0)
			return "output has no video stream";

		size_t kept = originalAudio.size();
		if(actual.audio.size() != kept + added.size())
		{
			return zpr::sprint("expected %zu audio streams, found %zu", kept + added.size(),
				actual.audio.size());
		}

		for(size_t i = 0; i < originalAudio.size(); i++)
		{
			const auto& want = originalAudio[i];
			const auto& got = actual.audio[i];

			if(want.channels != got.channels || want.codec != got.codec)
			{
				return zpr::sprint("audio stream %zu changed (was %s/%d ch, now %s/%d ch)", i, want.codec, want.channels,
					got.codec, got.channels);
			}
		}

		for(size_t k = 0; k < added.size(); k++)
		{
			const auto& got = actual.audio[kept + k];
			if(got.codec != codec || got.channels != probe::channelCount(added[k]))
			{
				return zpr::sprint("new %s stream is %s/%d ch, expected %s/%d ch", probe::layoutName(added[k]),
					got.codec, got.channels, codec, probe::channelCount(added[k]));
			}
		}

		if(actual.subtitles.size() != originalSubtitles)
		{
			return zpr::sprint("expected %zu subtitle streams, found %zu", originalSubtitles,
				actual.subtitles.size());
		}

		return "";
	}
}
