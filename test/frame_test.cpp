#include <gtest/gtest.h>

#include <sys/socket.h>
#include <unistd.h>
#include <string>

#include "frame.h"
#include "md5sum.h"

using namespace std;

// Connected pair of stream sockets, closed on scope exit.
class SocketPair
{
	public:

	SocketPair()
	{
		fds[0] = fds[1] = -1;
		if(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) < 0)
			ADD_FAILURE() << "socketpair failed";
	}
	~SocketPair()
	{
		closewriter();
		if(fds[1] >= 0) close(fds[1]);
	}

	int writer() const { return fds[0]; }
	int reader() const { return fds[1]; }
	void closewriter() { if(fds[0] >= 0) close(fds[0]); fds[0] = -1; }

	void write(const string &bytes)
	{
		ASSERT_EQ((ssize_t)bytes.size(), sendall(fds[0], bytes.data(), bytes.size()));
	}

	private:

	int fds[2];
};

TEST(LenField, RightJustifiedTenCharacters)
{
	EXPECT_EQ("        12", makelenfield(12));
	EXPECT_EQ("         0", makelenfield(0));
	EXPECT_EQ("4294967296", makelenfield(4294967296ULL));
	EXPECT_EQ((size_t)LENFIELDSIZE, makelenfield(7).size());
}

TEST(LenField, ParsesEitherJustification)
{
	size_t n = 0;
	ASSERT_EQ(0, parselenfield("        42", n));
	EXPECT_EQ(42u, n);
	ASSERT_EQ(0, parselenfield("42        ", n));
	EXPECT_EQ(42u, n);
	ASSERT_EQ(0, parselenfield("0000000042", n));
	EXPECT_EQ(42u, n);
	ASSERT_EQ(0, parselenfield("   123    ", n));
	EXPECT_EQ(123u, n);
}

TEST(LenField, RejectsNonDigits)
{
	size_t n = 0;
	EXPECT_EQ(-1, parselenfield("          ", n));
	EXPECT_EQ(-1, parselenfield("    -5    ", n));
	EXPECT_EQ(-1, parselenfield("   1 2    ", n));
	EXPECT_EQ(-1, parselenfield("abcdefghij", n));
	EXPECT_EQ(-1, parselenfield("       0x1", n));
}

TEST(ParseUint, Bounds)
{
	uint64_t v = 0;
	EXPECT_TRUE(parseuint("18446744073709551615", v));
	EXPECT_EQ(18446744073709551615ULL, v);
	EXPECT_FALSE(parseuint("18446744073709551616", v));
	EXPECT_FALSE(parseuint("", v));
	EXPECT_FALSE(parseuint("+1", v));
	EXPECT_FALSE(parseuint(" 1", v));
}

TEST(MetaHeader, BuildAndParse)
{
	TransferInfo info;
	info.filename = "report.pdf";
	info.filesize = 500000;
	EXPECT_EQ("report.pdf|500000", makemetaheader(info));

	TransferInfo parsed;
	ASSERT_EQ(0, parsemetaheader("report.pdf|500000", parsed));
	EXPECT_EQ("report.pdf", parsed.filename);
	EXPECT_EQ(500000u, parsed.filesize);
}

TEST(MetaHeader, NameMayContainDelimiter)
{
	TransferInfo parsed;
	ASSERT_EQ(0, parsemetaheader("a|b.txt|7", parsed));
	EXPECT_EQ("a|b.txt", parsed.filename);
	EXPECT_EQ(7u, parsed.filesize);
}

TEST(MetaHeader, RejectsMalformed)
{
	TransferInfo parsed;
	EXPECT_EQ(-1, parsemetaheader("nodelimiter", parsed));
	EXPECT_EQ(-1, parsemetaheader("file.txt|", parsed));
	EXPECT_EQ(-1, parsemetaheader("file.txt|12ab", parsed));
	EXPECT_EQ(-1, parsemetaheader("file.txt|-1", parsed));
	EXPECT_EQ(-1, parsemetaheader("|12", parsed));
}

TEST(ChunkHeader, BuildAndParse)
{
	string digest = md5hex("hello");
	string header = makechunkheader(5, digest);
	EXPECT_EQ("5|" + digest, header);

	uint64_t len = 0;
	string parsed;
	ASSERT_EQ(0, parsechunkheader(header, len, parsed));
	EXPECT_EQ(5u, len);
	EXPECT_EQ(digest, parsed);
}

TEST(ChunkHeader, RejectsMalformed)
{
	uint64_t len;
	string digest;
	EXPECT_EQ(-1, parsechunkheader("4096", len, digest));
	EXPECT_EQ(-1, parsechunkheader("4096|", len, digest));
	EXPECT_EQ(-1, parsechunkheader("x|abcd", len, digest));
	EXPECT_EQ(-1, parsechunkheader("1|ab|cd", len, digest));
}

TEST(RecvFrame, HeaderThenTerminator)
{
	SocketPair sp;
	ASSERT_EQ(0, sendframe(sp.writer(), "notes.txt|11"));
	ASSERT_EQ(0, sendterminator(sp.writer()));

	string header;
	EXPECT_EQ(FRAME_HEADER, recvframe(sp.reader(), header));
	EXPECT_EQ("notes.txt|11", header);
	EXPECT_EQ(FRAME_END, recvframe(sp.reader(), header));
}

TEST(RecvFrame, WireBytesAreExact)
{
	SocketPair sp;
	ASSERT_EQ(0, sendframe(sp.writer(), "ab|1"));
	ASSERT_EQ(0, sendterminator(sp.writer()));
	sp.closewriter();

	char buf[64];
	ssize_t n = recvall(sp.reader(), buf, sizeof(buf));
	EXPECT_EQ("         4ab|10000000000", string(buf, n));
}

TEST(RecvFrame, ZeroPaddedLengthAccepted)
{
	SocketPair sp;
	sp.write("0000000005a.b|0");
	string header;
	EXPECT_EQ(FRAME_HEADER, recvframe(sp.reader(), header));
	EXPECT_EQ("a.b|0", header);
}

TEST(RecvFrame, ShortLengthFieldIsClosed)
{
	SocketPair sp;
	sp.write("     1");
	sp.closewriter();
	string header;
	EXPECT_EQ(FRAME_CLOSED, recvframe(sp.reader(), header));
}

TEST(RecvFrame, ShortHeaderIsClosed)
{
	SocketPair sp;
	sp.write("        20abc");
	sp.closewriter();
	string header;
	EXPECT_EQ(FRAME_CLOSED, recvframe(sp.reader(), header));
}

TEST(RecvFrame, EmptyStreamIsClosed)
{
	SocketPair sp;
	sp.closewriter();
	string header;
	EXPECT_EQ(FRAME_CLOSED, recvframe(sp.reader(), header));
}

TEST(RecvFrame, GarbageLengthIsMalformed)
{
	SocketPair sp;
	sp.write("hello worldxxxxxxxx");
	string header;
	EXPECT_EQ(FRAME_MALFORMED, recvframe(sp.reader(), header));
}

TEST(RecvFrame, OversizedHeaderIsMalformed)
{
	SocketPair sp;
	sp.write(makelenfield(MAXHEADERSIZE + 1));
	string header;
	EXPECT_EQ(FRAME_MALFORMED, recvframe(sp.reader(), header));
}
