#ifndef XFER_FRAME_H
#define XFER_FRAME_H

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "xfer.h"

/*
Wire format of one transfer:

	[lenfield][name|size]
	[lenfield][chunklen|md5hex][chunk bytes]	once per chunk
	...
	[0000000000]

lenfield is LENFIELDSIZE decimal ascii characters giving the byte length of
the header payload that follows. Chunk bytes are not counted by lenfield,
their length is the chunklen inside the chunk header.
*/

enum framestatus
{
	FRAME_HEADER,		// header payload read
	FRAME_END,			// terminator read
	FRAME_CLOSED,		// peer closed before a full frame arrived
	FRAME_MALFORMED,	// length field unreadable or too large
	FRAME_IOERROR
};

const char *framestatusstr(framestatus status);

// Right justified, space padded.
std::string makelenfield(size_t n);

// Accepts digits padded with spaces on either side or leading zeros.
// Returns 0, or -1 if field holds anything else.
int parselenfield(const char *field, size_t &n);

// Non-empty and all decimal digits, no overflow.
bool parseuint(const std::string &s, uint64_t &value);

std::string makemetaheader(const TransferInfo &info);
int parsemetaheader(const std::string &header, TransferInfo &info);

std::string makechunkheader(size_t chunklen, const std::string &digest);
int parsechunkheader(const std::string &header, uint64_t &chunklen, std::string &digest);

int sendframe(int fd, const std::string &header);
int sendterminator(int fd);

// Blocking: reads exactly LENFIELDSIZE bytes, then exactly the declared
// header length.
framestatus recvframe(int fd, std::string &header);

#endif
