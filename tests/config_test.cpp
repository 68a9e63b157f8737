// config_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "fakes.h"

using namespace testing_support;

struct ConfigTest : ConfigFixture
{
	TempDir tmp;

	void load(const std::string& json)
	{
		auto path = tmp / "config.json";
		writeText(path, json);
		config::setConfigPath(path.string());
	}
};

TEST_F(ConfigTest, ReadsOptions)
{
	load(R"({
		"options": {
			"root-folder": "/srv/media",
			"output-folder": "/srv/converted",
			"scratch-folder": "/var/tmp/surround",
			"ffmpeg-path": "/opt/ffmpeg/bin/ffmpeg",
			"stereo-bitrate": "224k",
			"policy": "complete",
			"probe-format": "flat",
			"extensions": [ "mkv", "ts" ],
			"jobs": 4,
			"show-progress": false,
			"stop-on-first-error": true,
			"verify-streams": false
		}
	})");

	EXPECT_EQ(config::getRootFolder(), "/srv/media");
	EXPECT_EQ(config::getOutputFolder(), "/srv/converted");
	EXPECT_EQ(config::getScratchFolder(), "/var/tmp/surround");
	EXPECT_EQ(config::getFFmpegPath(), "/opt/ffmpeg/bin/ffmpeg");
	EXPECT_EQ(config::getFFprobePath(), "ffprobe");
	EXPECT_EQ(config::getStereoBitrate(), "224k");
	EXPECT_EQ(config::getPolicy(), config::Policy::Complete);
	EXPECT_EQ(config::getProbeFormat(), config::ProbeFormat::Flat);
	EXPECT_EQ(config::getExtensions(), std::vector<std::string>({ "mkv", "ts" }));
	EXPECT_EQ(config::getJobCount(), 4u);
	EXPECT_TRUE(config::disableProgress());
	EXPECT_TRUE(config::shouldStopOnError());
	EXPECT_FALSE(config::shouldVerifyStreams());

	config::setRootFolder("/mnt/media/video");
}

TEST_F(ConfigTest, BadValuesKeepDefaults)
{
	load(R"({
		"options": {
			"policy": "everything",
			"probe-format": 3,
			"jobs": 0,
			"verify-streams": "yes"
		}
	})");

	EXPECT_EQ(config::getPolicy(), config::Policy::SurroundOnly);
	EXPECT_EQ(config::getProbeFormat(), config::ProbeFormat::Auto);
	EXPECT_EQ(config::getJobCount(), 1u);
	EXPECT_TRUE(config::shouldVerifyStreams());
}

TEST_F(ConfigTest, MalformedFileIsIgnored)
{
	load("{ \"options\": { \"policy\": ");
	EXPECT_EQ(config::getPolicy(), config::Policy::SurroundOnly);

	load(R"({ "policy": "complete" })");
	EXPECT_EQ(config::getPolicy(), config::Policy::SurroundOnly);
}

TEST_F(ConfigTest, ParseNames)
{
	config::Policy p;
	EXPECT_TRUE(config::parsePolicy("Surround-Only", &p));
	EXPECT_EQ(p, config::Policy::SurroundOnly);
	EXPECT_TRUE(config::parsePolicy("complete", &p));
	EXPECT_EQ(p, config::Policy::Complete);
	EXPECT_FALSE(config::parsePolicy("stereo", &p));

	config::ProbeFormat f;
	EXPECT_TRUE(config::parseProbeFormat("JSON", &f));
	EXPECT_EQ(f, config::ProbeFormat::Json);
	EXPECT_FALSE(config::parseProbeFormat("xml", &f));

	EXPECT_EQ(config::policyName(config::Policy::Complete), "complete");
}

TEST_F(ConfigTest, JobCountIsAtLeastOne)
{
	config::setJobCount(0);
	EXPECT_EQ(config::getJobCount(), 1u);
}
