#include "ipc/childProcess.hpp"
#include "ipc/debuggerProtocolError.hpp"
#include "ipc/lineChannel.hpp"
#include "ipc/namedPipe.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using namespace snap;
using namespace std::chrono_literals;

namespace {

bool isFifo(const std::string &path) {
	struct stat info{};
	return ::stat(path.c_str(), &info) == 0 && S_ISFIFO(info.st_mode);
}

bool waitForExit(ChildProcess &child) {
	auto deadline = std::chrono::steady_clock::now() + 5s;
	while (std::chrono::steady_clock::now() < deadline) {
		if (child.hasExited()) {
			return true;
		}
		std::this_thread::sleep_for(10ms);
	}
	return false;
}

class LineChannelTest : public ::testing::Test {
protected:
	void SetUp() override {
		std::signal(SIGPIPE, SIG_IGN);
		int fds[2];
		ASSERT_EQ(::pipe(fds), 0);
		reader = std::make_unique<LineChannel>(fds[0]);
		writer = std::make_unique<LineChannel>(fds[1]);
	}

	std::unique_ptr<LineChannel> reader;
	std::unique_ptr<LineChannel> writer;
};

} // namespace

TEST_F(LineChannelTest, ReadsWhatWasWritten) {
	ASSERT_TRUE(writer->writeLine("first"));
	ASSERT_TRUE(writer->writeLine(R"(["GetItems","3"])"));
	EXPECT_EQ(reader->readLine(), "first");
	EXPECT_EQ(reader->readLine(), R"(["GetItems","3"])");
}

TEST_F(LineChannelTest, StripsCarriageReturns) {
	ASSERT_TRUE(writer->writeLine("token\r"));
	EXPECT_EQ(reader->readLine(), "token");
}

TEST_F(LineChannelTest, EndOfStreamIsNoValue) {
	ASSERT_TRUE(writer->writeLine("last"));
	writer->close();
	EXPECT_FALSE(writer->isOpen());
	EXPECT_EQ(reader->readLine(), "last");
	EXPECT_EQ(reader->readLine(), std::nullopt);
}

TEST_F(LineChannelTest, WritingToAClosedPeerFails) {
	reader->close();
	EXPECT_FALSE(writer->writeLine("anyone?"));
}

TEST_F(LineChannelTest, WaitReadable) {
	EXPECT_FALSE(reader->waitReadable(10ms));
	ASSERT_TRUE(writer->writeLine("a"));
	ASSERT_TRUE(writer->writeLine("b"));
	EXPECT_TRUE(reader->waitReadable(1000ms));
	EXPECT_EQ(reader->readLine(), "a");
	// "b" is already buffered
	EXPECT_TRUE(reader->waitReadable(0ms));
	EXPECT_EQ(reader->readLine(), "b");
}

TEST(NamedPipe, CreatesAndRemovesFifo) {
	std::string path;
	{
		NamedPipe pipe = NamedPipe::create();
		path = pipe.path();
		EXPECT_TRUE(isFifo(path));
		EXPECT_NE(path.find("snapdbg-"), std::string::npos);

		NamedPipe moved = std::move(pipe);
		EXPECT_TRUE(pipe.path().empty());
		EXPECT_EQ(moved.path(), path);
		EXPECT_TRUE(isFifo(path));
	}
	EXPECT_FALSE(isFifo(path));
}

TEST(NamedPipe, NamesAreUnique) {
	NamedPipe a = NamedPipe::create();
	NamedPipe b = NamedPipe::create();
	EXPECT_NE(a.path(), b.path());
}

TEST(NamedPipe, WriterTimesOutWithoutReader) {
	NamedPipe pipe = NamedPipe::create();
	auto started = std::chrono::steady_clock::now();
	EXPECT_THROW(openPipeEnd(pipe.path(), PipeEnd::Write, 100ms, 10ms, nullptr), DebuggerProtocolError);
	EXPECT_GE(std::chrono::steady_clock::now() - started, 100ms);
}

TEST(NamedPipe, WriterGivesUpWhenPeerDies) {
	NamedPipe pipe = NamedPipe::create();
	try {
		openPipeEnd(pipe.path(), PipeEnd::Write, 10000ms, 10ms, [] { return false; });
		FAIL() << "expected DebuggerProtocolError";
	} catch (const DebuggerProtocolError &error) {
		EXPECT_NE(std::string(error.what()).find("exited before connecting"), std::string::npos);
	}
}

TEST(NamedPipe, EndsConnectAcrossThreads) {
	std::signal(SIGPIPE, SIG_IGN);
	NamedPipe pipe = NamedPipe::create();
	std::thread peer([path = pipe.path()] {
		std::this_thread::sleep_for(50ms);
		LineChannel reader(openPipeEnd(path, PipeEnd::Read, 1000ms, 10ms, nullptr));
		ASSERT_TRUE(reader.waitReadable(2000ms));
		EXPECT_EQ(reader.readLine(), "hello");
	});
	LineChannel writer(openPipeEnd(pipe.path(), PipeEnd::Write, 2000ms, 10ms, nullptr));
	EXPECT_TRUE(writer.writeLine("hello"));
	peer.join();
}

TEST(ChildProcess, ReportsExit) {
	ChildProcess child = ChildProcess::spawn("/bin/sh", {"-c", "exit 0"});
	EXPECT_GT(child.pid(), 0);
	EXPECT_TRUE(waitForExit(child));
}

TEST(ChildProcess, FindsProgramsOnThePath) {
	ChildProcess child = ChildProcess::spawn("sh", {"-c", "exit 3"});
	EXPECT_TRUE(waitForExit(child));
}

TEST(ChildProcess, KillStopsTheProcess) {
	ChildProcess child = ChildProcess::spawn("/bin/sh", {"-c", "sleep 30"});
	EXPECT_FALSE(child.hasExited());
	child.kill();
	EXPECT_TRUE(child.hasExited());
}

TEST(ChildProcess, UnknownProgramThrows) {
	EXPECT_THROW(ChildProcess::spawn("snapdbg-no-such-client", {}), DebuggerProtocolError);
}

TEST(ChildProcess, AdoptedProcessesAreProbed) {
	ChildProcess self = ChildProcess::adopt(static_cast<int>(::getpid()));
	EXPECT_FALSE(self.hasExited());
	EXPECT_TRUE(ChildProcess::adopt(0).hasExited());
}
