// transaction_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "fakes.h"

using namespace testing_support;

struct TransactionTest : ConfigFixture
{
	TempDir tmp;
	FakeRunner runner;
	FakeLayoutReader reader;

	std::fs::path source;
	std::fs::path scratch;
	std::string original;

	void SetUp() override
	{
		ConfigFixture::SetUp();

		this->scratch = tmp / "scratch";
		std::fs::create_directories(this->scratch);

		this->source = tmp / "movie.mkv";
		this->setSource({ audioStream(1, 2, "aac"), audioStream(2, 8, "dts") }, { });
	}

	void setSource(const std::vector<probe::Stream>& audio, const std::vector<probe::Stream>& subs)
	{
		Media m;
		m.audio = audio;
		m.subtitles = subs;
		writeMedia(this->source, m);

		this->original = readText(this->source);
	}

	xform::Job job(const std::string& outputFolder = "")
	{
		Media m;
		readMedia(this->source, m);

		auto decision = probe::decide(probe::analyse(m.audio), config::getPolicy());
		return xform::makeJob(this->source, decision, this->scratch, 0, outputFolder);
	}

	// the source is exactly as it was, and nothing else is lying around.
	void expectUntouched()
	{
		EXPECT_EQ(readText(this->source), this->original);
		EXPECT_EQ(tmp.listing(), std::vector<std::string>({ "movie.mkv", "scratch" }));
	}
};

TEST_F(TransactionTest, JobPaths)
{
	auto j = this->job();

	EXPECT_EQ(j.destination, source);
	EXPECT_EQ(j.backup, tmp / "movie.mkv.backup");
	EXPECT_EQ(j.staged, tmp / ".movie.surroundinator-partial-0.mkv");
	EXPECT_EQ(j.sourceStreamNumber, 1u);

	ASSERT_EQ(j.synthesised.size(), 1u);
	EXPECT_EQ(j.synthesised[0].path, scratch / "0-movie.51.ac3");
	EXPECT_EQ(j.synthesised[0].sourceChannels, 8);

	auto o = this->job((tmp / "out").string());
	EXPECT_EQ(o.destination, tmp / "out" / "movie.mkv");
	EXPECT_TRUE(o.backup.empty());
	EXPECT_EQ(o.staged.parent_path(), tmp / "out");
}

TEST_F(TransactionTest, AddsSurroundTrackInPlace)
{
	xform::Transaction txn(runner, reader, this->job());

	std::vector<xform::State> states;
	txn.onStateChange = [&states](xform::State s) { states.push_back(s); };

	auto outcome = txn.run();
	ASSERT_TRUE(outcome.ok()) << outcome.message;
	EXPECT_EQ(txn.state(), xform::State::Done);

	auto expected = std::vector<xform::State> {
		xform::State::BackingUp, xform::State::Synthesising, xform::State::Merging,
		xform::State::Verifying, xform::State::Committing, xform::State::Done
	};
	EXPECT_EQ(states, expected);

	Media out;
	ASSERT_TRUE(readMedia(source, out));
	EXPECT_TRUE(out.video);

	ASSERT_EQ(out.audio.size(), 3u);
	EXPECT_EQ(out.audio[0].channels, 2);
	EXPECT_EQ(out.audio[0].codec, "aac");
	EXPECT_EQ(out.audio[1].channels, 8);
	EXPECT_EQ(out.audio[1].codec, "dts");
	EXPECT_EQ(out.audio[2].channels, 6);
	EXPECT_EQ(out.audio[2].codec, "ac3");

	// no backup, no staging file, no intermediate audio.
	EXPECT_EQ(tmp.listing(), std::vector<std::string>({ "movie.mkv", "scratch" }));

	// the synthesis read from the 7.1 stream by its position among the audio streams.
	auto ffmpeg = runner.ffmpegCommands();
	ASSERT_EQ(ffmpeg.size(), 2u);
	EXPECT_EQ(argAfter(ffmpeg[0], "-map"), "0:a:1");
}

TEST_F(TransactionTest, KeepsSubtitles)
{
	this->setSource({ audioStream(1, 8, "truehd") }, { subtitleStream(2, "subrip"), subtitleStream(3, "ass") });

	xform::Transaction txn(runner, reader, this->job());
	ASSERT_TRUE(txn.run().ok());

	Media out;
	ASSERT_TRUE(readMedia(source, out));
	EXPECT_EQ(out.audio.size(), 2u);

	ASSERT_EQ(out.subtitles.size(), 2u);
	EXPECT_EQ(out.subtitles[0].codec, "subrip");
	EXPECT_EQ(out.subtitles[1].codec, "ass");
}

TEST_F(TransactionTest, CompletePolicyAddsBothTracks)
{
	config::setPolicy(config::Policy::Complete);
	this->setSource({ audioStream(1, 8, "truehd") }, { });

	xform::Transaction txn(runner, reader, this->job());
	ASSERT_TRUE(txn.run().ok());

	Media out;
	ASSERT_TRUE(readMedia(source, out));

	ASSERT_EQ(out.audio.size(), 3u);
	EXPECT_EQ(out.audio[1].channels, 6);
	EXPECT_EQ(out.audio[2].channels, 2);
	EXPECT_EQ(out.audio[2].codec, "ac3");

	EXPECT_EQ(tmp.listing(), std::vector<std::string>({ "movie.mkv", "scratch" }));
}

TEST_F(TransactionTest, MergeFailureLeavesSourceAlone)
{
	runner.mergeStatus = 1;

	xform::Transaction txn(runner, reader, this->job());
	auto outcome = txn.run();

	EXPECT_EQ(outcome.failure, xform::Failure::Merge);
	EXPECT_EQ(outcome.exitStatus, 1);
	EXPECT_EQ(txn.state(), xform::State::Aborted);

	this->expectUntouched();
}

TEST_F(TransactionTest, SynthesisFailure)
{
	runner.synthesisStatus = 1;

	xform::Transaction txn(runner, reader, this->job());
	EXPECT_EQ(txn.run().failure, xform::Failure::Synthesis);

	// it never got as far as merging.
	EXPECT_EQ(runner.ffmpegCommands().size(), 1u);
	this->expectUntouched();
}

TEST_F(TransactionTest, ZeroExitWithNoOutputIsAFailure)
{
	runner.synthesisWritesNothing = true;

	xform::Transaction t1(runner, reader, this->job());
	EXPECT_EQ(t1.run().failure, xform::Failure::Synthesis);
	this->expectUntouched();

	runner.synthesisWritesNothing = false;
	runner.mergeWritesEmpty = true;

	xform::Transaction t2(runner, reader, this->job());
	EXPECT_EQ(t2.run().failure, xform::Failure::Merge);
	this->expectUntouched();
}

TEST_F(TransactionTest, VerificationFailure)
{
	// pretend ffmpeg quietly dropped one of the original tracks.
	reader.tamper = [](verify::Layout& l) { l.audio.erase(l.audio.begin()); };

	xform::Transaction txn(runner, reader, this->job());
	auto outcome = txn.run();

	EXPECT_EQ(outcome.failure, xform::Failure::Verification);
	EXPECT_NE(outcome.message.find("audio streams"), std::string::npos);

	this->expectUntouched();
}

TEST_F(TransactionTest, VerificationCanBeTurnedOff)
{
	config::setShouldVerifyStreams(false);
	reader.tamper = [](verify::Layout& l) { l.audio.clear(); };

	xform::Transaction txn(runner, reader, this->job());
	EXPECT_TRUE(txn.run().ok());
}

TEST_F(TransactionTest, CancelledMidway)
{
	runner.beforeFFmpeg = [](const proc::Command&) { proc::requestCancel(); };

	xform::Transaction txn(runner, reader, this->job());
	auto outcome = txn.run();

	EXPECT_EQ(outcome.failure, xform::Failure::Cancelled);
	EXPECT_EQ(txn.state(), xform::State::Aborted);

	this->expectUntouched();
}

TEST_F(TransactionTest, CancelledBeforeStarting)
{
	proc::requestCancel();

	xform::Transaction txn(runner, reader, this->job());
	EXPECT_EQ(txn.run().failure, xform::Failure::Cancelled);

	EXPECT_TRUE(runner.commands.empty());
	this->expectUntouched();
}

TEST_F(TransactionTest, RefusesToOverwriteExistingBackup)
{
	auto backup = tmp / "movie.mkv.backup";
	writeText(backup, "v\n");

	xform::Transaction txn(runner, reader, this->job());
	EXPECT_EQ(txn.run().failure, xform::Failure::Backup);

	EXPECT_EQ(readText(backup), "v\n");
	EXPECT_EQ(readText(source), original);
	EXPECT_TRUE(runner.ffmpegCommands().empty());
}

TEST_F(TransactionTest, StaleBackupOfUntouchedSourceIsReplaced)
{
	// what a kill between the backup and the commit leaves behind.
	auto backup = tmp / "movie.mkv.backup";
	writeText(backup, original);

	xform::Transaction txn(runner, reader, this->job());
	ASSERT_TRUE(txn.run().ok());

	Media m;
	ASSERT_TRUE(readMedia(source, m));
	EXPECT_EQ(m.audio.size(), 3u);

	EXPECT_FALSE(std::fs::exists(backup));
	EXPECT_EQ(tmp.listing(), std::vector<std::string>({ "movie.mkv", "scratch" }));
}

TEST_F(TransactionTest, EmptySourceIsNotBackedUp)
{
	writeText(source, "");
	this->original = "";

	// decide from a real layout, then make the file empty underneath it.
	Media m;
	m.audio = { audioStream(1, 8, "dts") };

	auto decision = probe::decide(probe::analyse(m.audio), config::getPolicy());
	xform::Transaction txn(runner, reader, xform::makeJob(source, decision, scratch, 0, ""));

	EXPECT_EQ(txn.run().failure, xform::Failure::Backup);
	this->expectUntouched();
}

TEST_F(TransactionTest, OutputFolderLeavesOriginal)
{
	auto out = tmp / "out";
	std::fs::create_directories(out);

	xform::Transaction txn(runner, reader, this->job(out.string()));
	ASSERT_TRUE(txn.run().ok());

	EXPECT_EQ(readText(source), original);

	Media m;
	ASSERT_TRUE(readMedia(out / "movie.mkv", m));
	EXPECT_EQ(m.audio.size(), 3u);

	EXPECT_EQ(tmp.listing(), std::vector<std::string>({ "movie.mkv", "out", "out/movie.mkv", "scratch" }));
}

TEST_F(TransactionTest, SameNameInOutputFolderIsNotOverwritten)
{
	auto out = tmp / "out";
	std::fs::create_directories(out);
	std::fs::create_directories(tmp / "A");
	std::fs::create_directories(tmp / "B");

	Media a;
	a.audio = { audioStream(1, 8, "dts") };
	writeMedia(tmp / "A" / "ep1.mkv", a);

	Media b;
	b.audio = { audioStream(1, 2, "aac"), audioStream(2, 8, "truehd") };
	writeMedia(tmp / "B" / "ep1.mkv", b);
	auto bText = readText(tmp / "B" / "ep1.mkv");

	auto makeFor = [&](const std::fs::path& src, const Media& m, size_t id) {
		auto decision = probe::decide(probe::analyse(m.audio), config::getPolicy());
		return xform::makeJob(src, decision, scratch, id, out.string());
	};

	xform::Transaction first(runner, reader, makeFor(tmp / "A" / "ep1.mkv", a, 0));
	ASSERT_TRUE(first.run().ok());
	auto firstOutput = readText(out / "ep1.mkv");

	xform::Transaction second(runner, reader, makeFor(tmp / "B" / "ep1.mkv", b, 1));
	EXPECT_EQ(second.run().failure, xform::Failure::Commit);

	// the first conversion survives, and the second source is as it was.
	EXPECT_EQ(readText(out / "ep1.mkv"), firstOutput);
	EXPECT_EQ(readText(tmp / "B" / "ep1.mkv"), bText);

	Media m;
	ASSERT_TRUE(readMedia(out / "ep1.mkv", m));
	ASSERT_EQ(m.audio.size(), 2u);
	EXPECT_EQ(m.audio[0].codec, "dts");

	EXPECT_EQ(tmp.listing(), std::vector<std::string>({ "A", "A/ep1.mkv", "B", "B/ep1.mkv", "movie.mkv",
		"out", "out/ep1.mkv", "scratch" }));
}

TEST_F(TransactionTest, OutputCollisionCaughtAtCommit)
{
	auto out = tmp / "out";
	std::fs::create_directories(out);

	// another job finishes first, while this one is still merging.
	runner.beforeFFmpeg = [&](const proc::Command& cmd) {
		if(countArg(cmd, "-i") > 1)
			writeText(out / "movie.mkv", "someone else's output");
	};

	xform::Transaction txn(runner, reader, this->job(out.string()));
	EXPECT_EQ(txn.run().failure, xform::Failure::Commit);

	EXPECT_EQ(readText(out / "movie.mkv"), "someone else's output");
	EXPECT_EQ(readText(source), original);
	EXPECT_EQ(tmp.listing(), std::vector<std::string>({ "movie.mkv", "out", "out/movie.mkv", "scratch" }));
}

TEST_F(TransactionTest, OnlyRunsOnce)
{
	xform::Transaction txn(runner, reader, this->job());
	ASSERT_TRUE(txn.run().ok());

	auto again = txn.run();
	EXPECT_FALSE(again.ok());
}
