#ifndef XFER_H
#define XFER_H

#include <stdint.h>
#include <stdio.h>
#include <sys/types.h>
#include <atomic>
#include <functional>
#include <string>

#define LENFIELDSIZE 10			// outer length field, decimal ascii
#define TERMINATOR "0000000000"	// end of chunk stream
#define HEADERDELIM '|'
#define MAXHEADERSIZE 4096		// largest header payload accepted
#define BUFSIZE 4096			// socket/file io buffer
#define DEFAULT_CHUNKSIZE 4096
#define DEFAULT_POLLINTERVAL 1000	// ms between stop checks while idle
#define LISTENBACKLOG 1

typedef std::function<void(double, const std::string &)> ProgressCallback;
typedef std::function<void(const std::string &)> StatusCallback;

// Settings shared by both ends, copied by value into FileSender/FileReceiver.
struct XferConfig
{
	uint32_t chunksize;
	std::string savedir;
	int pollinterval;

	XferConfig() : chunksize(DEFAULT_CHUNKSIZE), savedir("."), pollinterval(DEFAULT_POLLINTERVAL) {}
};

// Both callbacks are optional and are invoked synchronously on the thread
// running the transfer.
struct XferCallbacks
{
	ProgressCallback onprogress;
	StatusCallback onstatus;

	void progress(double percentage, const std::string &message) const
	{
		if(onprogress)
			onprogress(percentage, message);
	}

	void status(const std::string &message) const
	{
		if(onstatus)
			onstatus(message);
	}
};

// Metadata of one file on the wire.
struct TransferInfo
{
	std::string filename;
	uint64_t filesize;
	uint32_t chunksize;

	TransferInfo() : filesize(0), chunksize(DEFAULT_CHUNKSIZE) {}
};

class ScopedFd
{
	public:

	explicit ScopedFd(int fd = -1) : fd_(fd) {}
	~ScopedFd() { reset(); }

	int get() const { return fd_; }
	int release() { int fd = fd_; fd_ = -1; return fd; }
	void reset(int fd = -1);

	private:

	ScopedFd(const ScopedFd &);
	ScopedFd &operator=(const ScopedFd &);

	int fd_;
};

class ScopedFile
{
	public:

	explicit ScopedFile(FILE *fp = NULL) : fp_(fp) {}
	~ScopedFile() { reset(); }

	FILE *get() const { return fp_; }
	FILE *release() { FILE *fp = fp_; fp_ = NULL; return fp; }
	void reset() { if(fp_ != NULL) fclose(fp_); fp_ = NULL; }

	private:

	ScopedFile(const ScopedFile &);
	ScopedFile &operator=(const ScopedFile &);

	FILE *fp_;
};

// Cooperative cancellation for FileReceiver::serve(). Safe to trip from a
// signal handler or another thread.
class StopToken
{
	public:

	StopToken() : stopped_(false) {}

	void stop() { stopped_.store(true); }
	bool stopped() const { return stopped_.load(); }

	private:

	std::atomic<bool> stopped_;
};

// Write exactly n bytes, looping on partial writes. Returns n or -1.
ssize_t sendall(int fd, const char *data, size_t n);

// Read exactly n bytes. Returns n, the short count if the peer closed the
// connection first, or -1 on error.
ssize_t recvall(int fd, char *data, size_t n);

std::string errnostr(int err);
std::string formatprogress(uint64_t done, uint64_t total, uint64_t chunks, uint64_t totalchunks);

#endif
