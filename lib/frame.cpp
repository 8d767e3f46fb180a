#include "frame.h"

#include <errno.h>		//for errno,ERANGE
#include <stdio.h>		//for snprintf
#include <stdlib.h>		//for strtoull
#include <string.h>		//for memcmp

using namespace std;

const char *framestatusstr(framestatus status)
{
	switch(status)
	{
		case FRAME_HEADER:		return "header";
		case FRAME_END:			return "end of file marker";
		case FRAME_CLOSED:		return "connection closed";
		case FRAME_MALFORMED:	return "malformed length field";
		case FRAME_IOERROR:		return "socket read error";
	}
	return "unknown";
}

string makelenfield(size_t n)
{
	char field[LENFIELDSIZE+1];
	snprintf(field, sizeof(field), "%10zu", n);
	return string(field, LENFIELDSIZE);
}

bool parseuint(const string &s, uint64_t &value)
{
	if(s.empty() || s.size() > 20)
		return false;
	for(size_t i = 0; i < s.size(); i++)
	{
		if(s[i] < '0' || s[i] > '9')
			return false;
	}
	errno = 0;
	unsigned long long v = strtoull(s.c_str(), NULL, 10);
	if(errno == ERANGE)
		return false;
	value = v;
	return true;
}

int parselenfield(const char *field, size_t &n)
{
	size_t begin = 0, end = LENFIELDSIZE;
	while(begin < end && field[begin] == ' ')
		begin++;
	while(end > begin && field[end-1] == ' ')
		end--;

	uint64_t value;
	if(!parseuint(string(field + begin, end - begin), value))
		return -1;
	n = value;
	return 0;
}

string makemetaheader(const TransferInfo &info)
{
	char str[21];
	snprintf(str, sizeof(str), "%llu", (unsigned long long)info.filesize);
	return info.filename + HEADERDELIM + str;
}

int parsemetaheader(const string &header, TransferInfo &info)
{
	// split at the last delimiter, a name may contain one
	size_t pos = header.rfind(HEADERDELIM);
	if(pos == string::npos || pos == 0)
		return -1;
	uint64_t size;
	if(!parseuint(header.substr(pos + 1), size))
		return -1;
	info.filename = header.substr(0, pos);
	info.filesize = size;
	return 0;
}

string makechunkheader(size_t chunklen, const string &digest)
{
	char str[21];
	snprintf(str, sizeof(str), "%zu", chunklen);
	return str + string(1, HEADERDELIM) + digest;
}

int parsechunkheader(const string &header, uint64_t &chunklen, string &digest)
{
	size_t pos = header.find(HEADERDELIM);
	if(pos == string::npos || header.find(HEADERDELIM, pos + 1) != string::npos)
		return -1;
	if(!parseuint(header.substr(0, pos), chunklen))
		return -1;
	digest = header.substr(pos + 1);
	if(digest.empty())
		return -1;
	return 0;
}

int sendframe(int fd, const string &header)
{
	string frame = makelenfield(header.size()) + header;
	if(sendall(fd, frame.data(), frame.size()) < 0)
		return -1;
	return 0;
}

int sendterminator(int fd)
{
	if(sendall(fd, TERMINATOR, LENFIELDSIZE) < 0)
		return -1;
	return 0;
}

framestatus recvframe(int fd, string &header)
{
	char field[LENFIELDSIZE];
	ssize_t n = recvall(fd, field, LENFIELDSIZE);
	if(n < 0)
		return FRAME_IOERROR;
	if(n < LENFIELDSIZE)
		return FRAME_CLOSED;
	if(!memcmp(field, TERMINATOR, LENFIELDSIZE))
		return FRAME_END;

	size_t headerlen;
	if(parselenfield(field, headerlen) < 0 || headerlen > MAXHEADERSIZE)
		return FRAME_MALFORMED;
	if(headerlen == 0)
		return FRAME_END;

	header.assign(headerlen, '\0');
	n = recvall(fd, &header[0], headerlen);
	if(n < 0)
		return FRAME_IOERROR;
	if((size_t)n < headerlen)
		return FRAME_CLOSED;
	return FRAME_HEADER;
}
