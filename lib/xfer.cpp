#include "xfer.h"

#include <errno.h>		//for errno,EINTR
#include <string.h>		//for strerror
#include <unistd.h>		//for close
#include <sys/socket.h>	//for send,recv,MSG_NOSIGNAL

using namespace std;

void ScopedFd::reset(int fd)
{
	if(fd_ >= 0)
		close(fd_);
	fd_ = fd;
}

ssize_t sendall(int fd, const char *data, size_t n)
{
	size_t written = 0;
	while(written < n)
	{
		ssize_t ok = send(fd, data + written, n - written, MSG_NOSIGNAL);
		if(ok < 0)
		{
			if(errno == EINTR)
				continue;
			return -1;
		}
		written += ok;
	}
	return written;
}

ssize_t recvall(int fd, char *data, size_t n)
{
	size_t got = 0;
	while(got < n)
	{
		ssize_t ok = recv(fd, data + got, n - got, 0);
		if(ok < 0)
		{
			if(errno == EINTR)
				continue;
			return -1;
		}
		if(ok == 0)		// peer closed
			break;
		got += ok;
	}
	return got;
}

string errnostr(int err)
{
	return string(strerror(err));
}

string formatprogress(uint64_t done, uint64_t total, uint64_t chunks, uint64_t totalchunks)
{
	double percentage = total > 0 ? (double)done / total * 100.0 : 100.0;
	char buf[160];
	if(totalchunks > 0)
		snprintf(buf, sizeof(buf), "%llu/%llu chunks (%llu/%llu bytes - %.1f%%)",
			(unsigned long long)chunks, (unsigned long long)totalchunks,
			(unsigned long long)done, (unsigned long long)total, percentage);
	else
		snprintf(buf, sizeof(buf), "%llu chunks (%llu/%llu bytes - %.1f%%)",
			(unsigned long long)chunks, (unsigned long long)done,
			(unsigned long long)total, percentage);
	return string(buf);
}
